#pragma once

#include <cstdint>
#include <string_view>

// Schema type: assurance level.
// How much a glyph signature proves. A server attestation is a hash
// commitment anyone can recompute; only a key signature is unforgeable.
namespace glyphvault::schema {

enum class assurance_level : uint8_t {
  local_signature = 0,
  server_attestation = 1,
};

constexpr std::string_view to_string(const assurance_level level) {
  switch (level) {
    case assurance_level::local_signature:
      return "local_signature";
    case assurance_level::server_attestation:
      return "server_attestation";
  }
  return "unknown";
}

}  // namespace glyphvault::schema
