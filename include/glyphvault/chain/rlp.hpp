#pragma once

#include <glyphvault/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Ethereum Recursive Length Prefix encoding.
namespace glyphvault::chain::rlp {

/// Byte string item. A single byte below 0x80 encodes as itself.
glyphvault::schema::bytes_t encode_bytes(
    const glyphvault::schema::bytes_view_t& bytes);

/// Unsigned integer as its minimal big-endian byte string (0 is empty).
glyphvault::schema::bytes_t encode_uint(uint64_t value);

/// List of already-encoded items.
glyphvault::schema::bytes_t encode_list(
    const std::vector<glyphvault::schema::bytes_t>& encoded_items);

/// Minimal big-endian form of a fixed-width integer, leading zeros removed.
glyphvault::schema::bytes_t trim_leading_zeros(
    const glyphvault::schema::bytes_view_t& bytes);

}  // namespace glyphvault::chain::rlp
