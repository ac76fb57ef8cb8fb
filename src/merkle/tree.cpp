#include <glyphvault/crypto/digest.hpp>
#include <glyphvault/merkle/tree.hpp>

#include <algorithm>
#include <iterator>
#include <stdexcept>

using namespace glyphvault::schema;

namespace glyphvault::merkle {

hash32_t leaf_hash(const glyph_id_t& id) {
  return glyphvault::crypto::sha256(bytes_view_t{id});
}

hash32_t combine(const hash32_t& a, const hash32_t& b) {
  const auto& [low, high] = std::minmax(a, b);
  auto buffer = std::array<uint8_t, 64>{};
  std::copy(low.begin(), low.end(), buffer.begin());
  std::copy(high.begin(), high.end(), buffer.begin() + 32);
  return glyphvault::crypto::sha256(bytes_view_t{buffer});
}

tree::tree(std::vector<glyph_id_t> ids) : ids_(std::move(ids)) {
  if (ids_.empty()) {
    throw std::invalid_argument("cannot build a Merkle tree over no glyphs");
  }
  auto level = std::vector<hash32_t>{};
  level.reserve(ids_.size());
  std::transform(ids_.begin(), ids_.end(), std::back_inserter(level),
                 leaf_hash);
  levels_.push_back(std::move(level));

  while (levels_.back().size() > 1) {
    const auto& current = levels_.back();
    auto next = std::vector<hash32_t>{};
    next.reserve((current.size() + 1) / 2);
    for (std::size_t i = 0; i + 1 < current.size(); i += 2) {
      next.push_back(combine(current[i], current[i + 1]));
    }
    if (current.size() % 2 == 1) {
      next.push_back(current.back());
    }
    levels_.push_back(std::move(next));
  }
}

const hash32_t& tree::root() const noexcept {
  return levels_.back().front();
}

std::optional<proof_t> tree::proof(const glyph_id_t& id) const {
  auto it = std::find(ids_.begin(), ids_.end(), id);
  if (it == ids_.end()) {
    return std::nullopt;
  }
  auto index = static_cast<std::size_t>(std::distance(ids_.begin(), it));
  auto path = proof_t{};
  for (std::size_t depth = 0; depth + 1 < levels_.size(); ++depth) {
    const auto& level = levels_[depth];
    auto sibling = index ^ 1u;
    if (sibling < level.size()) {
      path.push_back(level[sibling]);
    }
    index /= 2;
  }
  return path;
}

hash32_t root(const std::vector<glyph_id_t>& ids) {
  return tree{ids}.root();
}

std::optional<proof_t> proof(const std::vector<glyph_id_t>& ids,
                             const glyph_id_t& target) {
  return tree{ids}.proof(target);
}

bool verify(const hash32_t& root, const glyph_id_t& id, const proof_t& proof) {
  auto current = leaf_hash(id);
  for (const auto& sibling : proof) {
    current = combine(current, sibling);
  }
  return current == root;
}

}  // namespace glyphvault::merkle
