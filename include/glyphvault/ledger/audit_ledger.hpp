#pragma once

#include <glyphvault/schema/audit_entry.hpp>
#include <glyphvault/schema/glyph_summary.hpp>
#include <glyphvault/schema/primitives.hpp>
#include <glyphvault/schema/vault_stats.hpp>
#include <glyphvault/storage/rocksdb/storage.hpp>
#include <json/value.h>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace glyphvault::ledger {

/// An audit entry before the ledger assigns its sequence and timestamp.
struct action_record final {
  glyphvault::schema::glyph_id_t glyph_id{};
  std::string action;
  std::string actor;
  Json::Value metadata{Json::objectValue};
};

/// Append-only glyph registry and audit log on RocksDB. Every write is a
/// single synced batch; reads never mutate.
class audit_ledger final {
 public:
  explicit audit_ledger(const std::filesystem::path& path);

  audit_ledger(const audit_ledger&) = delete;
  audit_ledger& operator=(const audit_ledger&) = delete;

  /// Glyph row, listing index and CREATED entry, followed by `follow_up`
  /// entries, in one batch. Throws std::invalid_argument when the id is
  /// already recorded.
  void record_glyph(const glyphvault::schema::glyph_summary_t& glyph,
                    std::string_view actor,
                    const std::vector<action_record>& follow_up = {});

  /// Throws not_found_error when the glyph was never recorded.
  glyphvault::schema::audit_entry_t log_action(
      const glyphvault::schema::glyph_id_t& id,
      std::string_view action,
      std::string_view actor,
      const Json::Value& metadata = Json::Value{Json::objectValue});

  /// All-or-nothing append. Throws not_found_error before writing anything
  /// when any id is unknown.
  std::vector<glyphvault::schema::audit_entry_t> log_actions(
      const std::vector<action_record>& records);

  std::optional<glyphvault::schema::glyph_summary_t> get_glyph(
      const glyphvault::schema::glyph_id_t& id) const;
  bool contains(const glyphvault::schema::glyph_id_t& id) const;

  /// Newest first.
  std::vector<glyphvault::schema::audit_entry_t> audit_trail(
      const glyphvault::schema::glyph_id_t& id) const;

  /// Newest first, optionally restricted to one source.
  std::vector<glyphvault::schema::glyph_summary_t> list(
      const std::optional<std::string>& source,
      std::size_t limit,
      std::size_t offset) const;

  /// Aggregates over every glyph row. `storage_path` is left empty.
  glyphvault::schema::vault_stats stats() const;

 private:
  glyphvault::schema::audit_entry_t stage_entry(
      glyphvault::storage::write_batch& batch,
      const action_record& record,
      glyphvault::schema::timestamp_seconds_t timestamp);
  void stage_sequence(glyphvault::storage::write_batch& batch) const;

  glyphvault::storage::storage<glyphvault::storage::rocksdb_storage_tag>
      storage_;
  std::mutex write_mutex_;
  uint64_t next_sequence_{};
};

}  // namespace glyphvault::ledger
