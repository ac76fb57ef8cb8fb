#pragma once

#include <glyphvault/crypto/aead.hpp>
#include <glyphvault/schema/glyph.hpp>
#include <glyphvault/schema/primitives.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

// On-disk layout under the store root:
//   vault.key               "GLYK" | version | iterations (u32 LE) | salt (16)
//                           | nonce (12) | key check ciphertext | tag (16)
//   blobs/<id hex>.glyph    "GLYB" | version | nonce (12) | ciphertext
//                           | tag (16)
// Blob plaintext is the SCALE-encoded glyph; the glyph id is the GCM
// associated data, so a blob copied under another name fails to open.
namespace glyphvault::vault {

inline constexpr auto kDefaultKdfIterations = uint32_t{600000};
inline constexpr auto kSaltSize = std::size_t{16};

class encrypted_store final {
 public:
  /// Opens the store, creating the key header on first use. Throws
  /// configuration_error for an empty passphrase or zero iterations,
  /// integrity_error when the passphrase does not unlock an existing header
  /// and storage_error on filesystem failures.
  encrypted_store(const std::filesystem::path& root,
                  std::string_view passphrase,
                  uint32_t kdf_iterations = kDefaultKdfIterations);
  ~encrypted_store();

  encrypted_store(const encrypted_store&) = delete;
  encrypted_store& operator=(const encrypted_store&) = delete;

  /// Encrypts and atomically replaces the blob for glyph.id.
  void put(const glyphvault::schema::glyph_t& glyph) const;

  /// std::nullopt when no blob exists. Throws integrity_error when the blob
  /// does not authenticate or decode.
  std::optional<glyphvault::schema::glyph_t> get(
      const glyphvault::schema::glyph_id_t& id) const;

  bool contains(const glyphvault::schema::glyph_id_t& id) const;

  /// Ids of every blob on disk, sorted.
  std::vector<glyphvault::schema::glyph_id_t> ids() const;

  const std::filesystem::path& root() const noexcept { return root_; }
  uint32_t kdf_iterations() const noexcept { return kdf_iterations_; }

 private:
  std::filesystem::path blob_path(
      const glyphvault::schema::glyph_id_t& id) const;
  void create_header(std::string_view passphrase);
  void unlock_header(std::string_view passphrase);

  std::filesystem::path root_;
  std::filesystem::path blob_dir_;
  glyphvault::crypto::aes_key_t key_{};
  uint32_t kdf_iterations_{};
};

}  // namespace glyphvault::vault
