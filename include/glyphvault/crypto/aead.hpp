#pragma once

#include <glyphvault/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace glyphvault::crypto {

inline constexpr auto kAesKeySize = std::size_t{32};
inline constexpr auto kGcmNonceSize = std::size_t{12};
inline constexpr auto kGcmTagSize = std::size_t{16};

using aes_key_t = std::array<uint8_t, kAesKeySize>;
using gcm_nonce_t = std::array<uint8_t, kGcmNonceSize>;
using gcm_tag_t = std::array<uint8_t, kGcmTagSize>;

struct sealed_box final {
  gcm_nonce_t nonce{};
  glyphvault::schema::bytes_t ciphertext;
  gcm_tag_t tag{};
};

/// PBKDF2-HMAC-SHA256.
aes_key_t derive_key(std::string_view passphrase,
                     const glyphvault::schema::bytes_view_t& salt,
                     uint32_t iterations);

/// Cryptographically secure random bytes from OpenSSL's DRBG.
glyphvault::schema::bytes_t random_bytes(std::size_t size);

/// AES-256-GCM with a fresh random nonce.
sealed_box seal(const aes_key_t& key,
                const glyphvault::schema::bytes_view_t& plaintext,
                const glyphvault::schema::bytes_view_t& associated_data);

/// std::nullopt when the tag does not authenticate the ciphertext and
/// associated data under `key`.
std::optional<glyphvault::schema::bytes_t> open(
    const aes_key_t& key,
    const sealed_box& box,
    const glyphvault::schema::bytes_view_t& associated_data);

}  // namespace glyphvault::crypto
