#pragma once

#include <glyphvault/crypto/secp256k1.hpp>
#include <glyphvault/schema/assurance_level.hpp>
#include <glyphvault/schema/glyph.hpp>
#include <glyphvault/schema/primitives.hpp>
#include <json/value.h>
#include <string>
#include <string_view>
#include <variant>

namespace glyphvault::glyph {

/// Glyphs are signed with an secp256k1 key held by this process.
struct local_key final {
  glyphvault::crypto::signing_key key;
};

/// No key available: glyphs carry a recomputable hash commitment.
struct server_attestation final {};

using signing_identity = std::variant<local_key, server_attestation>;

/// keccak256(data_hash || source).
glyphvault::schema::glyph_id_t derive_id(
    const glyphvault::schema::hash32_t& data_hash,
    std::string_view source);

/// sha256("server:" + hex(data_hash)).
glyphvault::schema::hash32_t attestation_digest(
    const glyphvault::schema::hash32_t& data_hash);

/// EIP-191 digest of the `0x`-hex text of data_hash.
glyphvault::schema::hash32_t signing_digest(
    const glyphvault::schema::hash32_t& data_hash);

/// Check a signature against its claimed signer. Any malformed input
/// yields false.
bool verify_signature(const glyphvault::schema::hash32_t& data_hash,
                      std::string_view signer,
                      const glyphvault::schema::bytes_t& signature) noexcept;

bool verify(const glyphvault::schema::glyph_t& glyph) noexcept;

glyphvault::schema::assurance_level assurance(std::string_view signer) noexcept;
glyphvault::schema::assurance_level assurance(
    const glyphvault::schema::glyph_t& glyph) noexcept;

class factory final {
 public:
  explicit factory(signing_identity identity);

  /// Throws std::invalid_argument when `data` is not a JSON object or array.
  glyphvault::schema::glyph_t create(const Json::Value& data,
                                     const std::string& source) const;
  glyphvault::schema::glyph_t create(
      const Json::Value& data,
      const std::string& source,
      glyphvault::schema::timestamp_seconds_t timestamp) const;

  /// Checksummed address, or the server sentinel.
  std::string signer() const;
  glyphvault::schema::assurance_level assurance() const noexcept;
  const signing_identity& identity() const noexcept { return identity_; }

 private:
  glyphvault::schema::bytes_t sign(
      const glyphvault::schema::hash32_t& data_hash) const;

  signing_identity identity_;
};

}  // namespace glyphvault::glyph
