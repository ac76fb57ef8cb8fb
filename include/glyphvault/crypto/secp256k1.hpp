#pragma once

#include <glyphvault/schema/primitives.hpp>
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace glyphvault::crypto {

/// Compact recoverable signature: r (32) || s (32) || v (1). `v` is the
/// recovery id, either raw (0, 1) or Ethereum style (27, 28).
using recoverable_signature_t = std::array<uint8_t, 65>;

/// Uncompressed SEC1 point: 0x04 || x (32) || y (32).
using public_key_t = std::array<uint8_t, 65>;

/// secp256k1 private key with its derived public key and EVM address.
class signing_key final {
 public:
  /// std::nullopt when the scalar is zero or not below the group order.
  static std::optional<signing_key> from_private_key(
      const glyphvault::schema::private_key_t& secret);

  /// Accepts 64 hex characters with an optional `0x` prefix.
  static std::optional<signing_key> from_hex(std::string_view hex);

  static signing_key generate();

  signing_key(const signing_key&) = default;
  signing_key& operator=(const signing_key&) = default;
  ~signing_key();

  const public_key_t& public_key() const noexcept { return public_key_; }
  const glyphvault::schema::address_t& address() const noexcept {
    return address_;
  }

  /// EIP-55 checksummed `0x` address.
  std::string address_text() const;

  /// Sign a prehashed 32-byte digest. The result is low-s normalized and
  /// carries the raw recovery id (0 or 1) in the last byte.
  recoverable_signature_t sign_digest(
      const glyphvault::schema::hash32_t& digest) const;

 private:
  signing_key(const glyphvault::schema::private_key_t& secret,
              const public_key_t& public_key);

  glyphvault::schema::private_key_t secret_{};
  public_key_t public_key_{};
  glyphvault::schema::address_t address_{};
};

std::optional<public_key_t> recover_public_key(
    const glyphvault::schema::hash32_t& digest,
    const recoverable_signature_t& signature);

std::optional<glyphvault::schema::address_t> recover_address(
    const glyphvault::schema::hash32_t& digest,
    const recoverable_signature_t& signature);

/// keccak256(x || y), last 20 bytes.
glyphvault::schema::address_t address_from_public_key(
    const public_key_t& public_key);

std::string to_checksum_address(const glyphvault::schema::address_t& address);

/// Parses a `0x` address in any letter case. Checksums are not enforced.
std::optional<glyphvault::schema::address_t> try_parse_address(
    std::string_view text);

/// EIP-191 version 0x45 digest:
/// keccak256("\x19Ethereum Signed Message:\n" + len(message) + message).
glyphvault::schema::hash32_t personal_message_digest(std::string_view message);

}  // namespace glyphvault::crypto
