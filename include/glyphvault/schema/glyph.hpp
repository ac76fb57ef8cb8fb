#pragma once

#include <glyphvault/schema/primitives.hpp>
#include <json/value.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: glyph.
// Provenance unit: content-addressed, signed record for one JSON payload.
// `data` is absent when only ledger metadata survived.
namespace glyphvault::schema {

/// Signer value used when the glyph carries a server attestation instead of
/// a key signature.
inline constexpr auto kServerSigner = std::string_view{"glyphvault:server"};

template <uint16_t Version>
struct glyph;

template <>
struct glyph<1> final {
  uint16_t version{1};
  glyph_id_t id{};
  hash32_t data_hash{};
  std::string source;
  timestamp_seconds_t timestamp{};
  std::string signer;
  bytes_t signature;
  std::optional<Json::Value> data;
  bool verified{};

  bool operator==(const glyph&) const = default;
};

using glyph_t = glyph<1>;

}  // namespace glyphvault::schema
