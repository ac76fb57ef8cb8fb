#pragma once

#include <glyphvault/schema/assurance_level.hpp>
#include <glyphvault/schema/audit_entry.hpp>
#include <glyphvault/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: proof report.
// Provenance answer handed to callers such as a web layer.
namespace glyphvault::schema {

template <uint16_t Version>
struct proof_report;

template <>
struct proof_report<1> final {
  uint16_t version{1};
  glyph_id_t glyph_id{};
  hash32_t data_hash{};
  std::string source;
  timestamp_seconds_t timestamp{};
  std::string signer;
  bytes_t signature;
  bool signature_valid{};
  assurance_level assurance{assurance_level::server_attestation};
  bool verified{};
  std::vector<audit_entry_t> audit_trail;
  timestamp_seconds_t proof_generated_at{};
};

using proof_report_t = proof_report<1>;

}  // namespace glyphvault::schema
