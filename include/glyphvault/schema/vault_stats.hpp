#pragma once

#include <glyphvault/schema/primitives.hpp>
#include <cstdint>
#include <map>
#include <string>

// Schema type: vault statistics.
namespace glyphvault::schema {

struct vault_stats final {
  uint64_t total_glyphs{};
  uint64_t verified_count{};
  std::map<std::string, uint64_t> sources;
  timestamp_seconds_t latest_timestamp{};
  std::string storage_path;
};

}  // namespace glyphvault::schema
