#pragma once

#include <glyphvault/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Minimal Solidity ABI support for the anchoring contract:
//   function anchor(bytes32 root)
//   function isAnchored(bytes32 root) view returns (bool)
//   function anchors(bytes32 root) view returns (uint256 timestamp)
namespace glyphvault::chain::abi {

inline constexpr auto kAnchorSignature = std::string_view{"anchor(bytes32)"};
inline constexpr auto kIsAnchoredSignature =
    std::string_view{"isAnchored(bytes32)"};
inline constexpr auto kAnchorsSignature = std::string_view{"anchors(bytes32)"};

using selector_t = std::array<uint8_t, 4>;

/// First four bytes of keccak256(signature).
selector_t selector(std::string_view signature);

/// selector || word, for functions taking a single bytes32.
glyphvault::schema::bytes_t encode_call(
    std::string_view signature,
    const glyphvault::schema::hash32_t& word);

/// A single 32-byte return word holding 0 or 1.
std::optional<bool> decode_bool(const glyphvault::schema::bytes_view_t& data);

/// A single uint256 return word. std::nullopt when the value does not fit
/// in 64 bits.
std::optional<uint64_t> decode_uint64(
    const glyphvault::schema::bytes_view_t& data);

}  // namespace glyphvault::chain::abi
