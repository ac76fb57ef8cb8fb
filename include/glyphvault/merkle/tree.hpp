#pragma once

#include <glyphvault/schema/primitives.hpp>
#include <optional>
#include <vector>

// Binary Merkle tree over glyph ids.
//   leaf  = sha256(id)
//   node  = sha256(min(a, b) || max(a, b))
// Levels are paired in input order. A trailing unpaired node moves up
// unchanged and adds nothing to the proof at that level, so a proof is just
// the sibling hashes from leaf to root.
namespace glyphvault::merkle {

using proof_t = std::vector<glyphvault::schema::hash32_t>;

glyphvault::schema::hash32_t leaf_hash(
    const glyphvault::schema::glyph_id_t& id);

glyphvault::schema::hash32_t combine(const glyphvault::schema::hash32_t& a,
                                     const glyphvault::schema::hash32_t& b);

class tree final {
 public:
  /// Throws std::invalid_argument for an empty id list.
  explicit tree(std::vector<glyphvault::schema::glyph_id_t> ids);

  const glyphvault::schema::hash32_t& root() const noexcept;
  std::size_t size() const noexcept { return ids_.size(); }
  const std::vector<glyphvault::schema::glyph_id_t>& ids() const noexcept {
    return ids_;
  }

  /// Sibling path for the first occurrence of id, or std::nullopt when id
  /// is not a member.
  std::optional<proof_t> proof(const glyphvault::schema::glyph_id_t& id) const;

 private:
  std::vector<glyphvault::schema::glyph_id_t> ids_;
  std::vector<std::vector<glyphvault::schema::hash32_t>> levels_;
};

/// Throws std::invalid_argument for an empty id list.
glyphvault::schema::hash32_t root(
    const std::vector<glyphvault::schema::glyph_id_t>& ids);

/// std::nullopt when target is not in ids. Throws std::invalid_argument
/// for an empty id list.
std::optional<proof_t> proof(
    const std::vector<glyphvault::schema::glyph_id_t>& ids,
    const glyphvault::schema::glyph_id_t& target);

bool verify(const glyphvault::schema::hash32_t& root,
            const glyphvault::schema::glyph_id_t& id,
            const proof_t& proof);

}  // namespace glyphvault::merkle
