#pragma once

#include <glyphvault/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>

// Schema type: anchor result.
// Outcome of submitting a Merkle root to the anchoring contract.
namespace glyphvault::schema {

enum class anchor_status : uint8_t {
  confirmed = 0,
  already_anchored = 1,
};

constexpr std::string_view to_string(const anchor_status status) {
  switch (status) {
    case anchor_status::confirmed:
      return "confirmed";
    case anchor_status::already_anchored:
      return "already_anchored";
  }
  return "unknown";
}

template <uint16_t Version>
struct anchor_result;

template <>
struct anchor_result<1> final {
  uint16_t version{1};
  anchor_status status{anchor_status::confirmed};
  hash32_t root{};
  std::string tx_hash;
  uint64_t block_number{};
  uint64_t gas_used{};
  uint64_t glyph_count{};
};

using anchor_result_t = anchor_result<1>;

/// On-chain view of a single root.
struct anchor_state final {
  bool anchored{};
  timestamp_seconds_t timestamp{};
};

}  // namespace glyphvault::schema
