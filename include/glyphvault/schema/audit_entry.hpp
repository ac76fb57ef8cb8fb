#pragma once

#include <glyphvault/schema/primitives.hpp>
#include <json/value.h>
#include <cstdint>
#include <string>
#include <string_view>

// Schema type: audit entry.
// Append-only lifecycle record for a glyph. Entries are never updated or
// deleted; `sequence` is a ledger-wide insertion counter.
namespace glyphvault::schema {

namespace audit_action {
inline constexpr auto kCreated = std::string_view{"CREATED"};
inline constexpr auto kResubmitted = std::string_view{"RESUBMITTED"};
inline constexpr auto kRecovered = std::string_view{"RECOVERED"};
inline constexpr auto kAnchored = std::string_view{"ANCHORED"};
inline constexpr auto kPublished = std::string_view{"PUBLISHED"};
}  // namespace audit_action

template <uint16_t Version>
struct audit_entry;

template <>
struct audit_entry<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  glyph_id_t glyph_id{};
  std::string action;
  std::string actor;
  timestamp_seconds_t timestamp{};
  Json::Value metadata{Json::objectValue};
};

using audit_entry_t = audit_entry<1>;

}  // namespace glyphvault::schema
