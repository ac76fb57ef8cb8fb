#pragma once

#include <glyphvault/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: glyph summary.
// Ledger row for a glyph: every glyph field except the payload.
namespace glyphvault::schema {

template <uint16_t Version>
struct glyph_summary;

template <>
struct glyph_summary<1> final {
  uint16_t version{1};
  glyph_id_t id{};
  hash32_t data_hash{};
  std::string source;
  timestamp_seconds_t timestamp{};
  std::string signer;
  bytes_t signature;
  bool verified{};

  bool operator==(const glyph_summary&) const = default;
};

using glyph_summary_t = glyph_summary<1>;

}  // namespace glyphvault::schema
