#pragma once

#include <glyphvault/schema/primitives.hpp>
#include <string_view>

namespace glyphvault::crypto {

/// Original Keccak-256 (pad 0x01), as used by the EVM. Not FIPS-202 SHA3.
glyphvault::schema::hash32_t keccak256(
    const glyphvault::schema::bytes_view_t& bytes);
glyphvault::schema::hash32_t keccak256(const std::string_view& str);

glyphvault::schema::hash32_t sha256(
    const glyphvault::schema::bytes_view_t& bytes);
glyphvault::schema::hash32_t sha256(const std::string_view& str);

}  // namespace glyphvault::crypto
