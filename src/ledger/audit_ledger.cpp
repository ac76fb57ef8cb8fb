#include <glyphvault/common/error.hpp>
#include <glyphvault/ledger/audit_ledger.hpp>
#include <glyphvault/schema/encoding/scale/encoder.hpp>
#include <glyphvault/schema/encoding/scale/records.hpp>
#include <glyphvault/schema/key/ledger_keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <stdexcept>

using namespace glyphvault::schema;

namespace glyphvault::ledger {

namespace {

using encoder_t =
    glyphvault::schema::encoding::encoder<encoding::scale_encoder_tag>;

glyph_summary_t decode_row(const bytes_view_t& value) {
  auto summary = encoding::scale::decode_glyph_summary(value);
  if (!summary.has_value()) {
    throw glyphvault::storage_error("undecodable glyph row in ledger");
  }
  return *summary;
}

}  // namespace

audit_ledger::audit_ledger(const std::filesystem::path& path)
    : storage_(glyphvault::storage::make_storage<
               glyphvault::storage::rocksdb_storage_tag>(path.string())) {
  auto encoder = encoder_t{};
  next_sequence_ = storage_
                       .get<uint64_t>(encoder, make_bytes_view(
                                                   key::kAuditSequenceKey))
                       .value_or(0);
  spdlog::debug("Audit ledger at {} resumes at sequence {}", path.string(),
                next_sequence_);
}

audit_entry_t audit_ledger::stage_entry(glyphvault::storage::write_batch& batch,
                                        const action_record& record,
                                        const timestamp_seconds_t timestamp) {
  if (record.action.empty()) {
    throw std::invalid_argument("audit action must not be empty");
  }
  if (!record.metadata.isObject()) {
    throw std::invalid_argument("audit metadata must be a JSON object");
  }
  auto entry = audit_entry_t{};
  entry.sequence = next_sequence_++;
  entry.glyph_id = record.glyph_id;
  entry.action = record.action;
  entry.actor = record.actor;
  entry.timestamp = timestamp;
  entry.metadata = record.metadata;

  auto key = key::make_audit_key(entry.glyph_id, entry.sequence);
  auto value = encoding::scale::encode(entry);
  batch.put(make_bytes_view(key), make_bytes_view(value));
  return entry;
}

void audit_ledger::stage_sequence(
    glyphvault::storage::write_batch& batch) const {
  auto encoder = encoder_t{};
  batch.put(encoder, make_bytes_view(key::kAuditSequenceKey), next_sequence_);
}

void audit_ledger::record_glyph(const glyph_summary_t& glyph,
                                const std::string_view actor,
                                const std::vector<action_record>& follow_up) {
  auto lock = std::scoped_lock{write_mutex_};
  if (contains(glyph.id)) {
    throw std::invalid_argument("glyph " + to_prefixed_hex(glyph.id) +
                                " is already in the ledger");
  }
  const auto rollback = next_sequence_;
  const auto now = now_seconds();

  auto batch = glyphvault::storage::write_batch{};
  auto row_key = key::make_glyph_key(glyph.id);
  auto row = encoding::scale::encode(glyph);
  batch.put(make_bytes_view(row_key), make_bytes_view(row));
  auto index_key = key::make_time_index_key(glyph.timestamp, glyph.id);
  batch.put(make_bytes_view(index_key), bytes_view_t{});

  try {
    auto created = action_record{};
    created.glyph_id = glyph.id;
    created.action = std::string{audit_action::kCreated};
    created.actor = std::string{actor};
    created.metadata["source"] = glyph.source;
    created.metadata["signer"] = glyph.signer;
    stage_entry(batch, created, now);
    for (const auto& record : follow_up) {
      stage_entry(batch, record, now);
    }
    stage_sequence(batch);
    storage_.commit(batch);
  } catch (const std::exception&) {
    next_sequence_ = rollback;
    throw;
  }
  spdlog::info("Recorded glyph {} from '{}'", to_prefixed_hex(glyph.id),
               glyph.source);
}

audit_entry_t audit_ledger::log_action(const glyph_id_t& id,
                                       const std::string_view action,
                                       const std::string_view actor,
                                       const Json::Value& metadata) {
  auto entries = log_actions({action_record{.glyph_id = id,
                                            .action = std::string{action},
                                            .actor = std::string{actor},
                                            .metadata = metadata}});
  return entries.front();
}

std::vector<audit_entry_t> audit_ledger::log_actions(
    const std::vector<action_record>& records) {
  if (records.empty()) {
    return {};
  }
  auto known = std::set<glyph_id_t>{};
  for (const auto& record : records) {
    if (!known.contains(record.glyph_id)) {
      if (!contains(record.glyph_id)) {
        throw glyphvault::not_found_error("glyph " +
                                          to_prefixed_hex(record.glyph_id) +
                                          " is not in the ledger");
      }
      known.insert(record.glyph_id);
    }
  }

  auto lock = std::scoped_lock{write_mutex_};
  const auto rollback = next_sequence_;
  const auto now = now_seconds();
  auto entries = std::vector<audit_entry_t>{};
  entries.reserve(records.size());
  auto batch = glyphvault::storage::write_batch{};
  try {
    for (const auto& record : records) {
      entries.push_back(stage_entry(batch, record, now));
    }
    stage_sequence(batch);
    storage_.commit(batch);
  } catch (const std::exception&) {
    next_sequence_ = rollback;
    throw;
  }
  return entries;
}

std::optional<glyph_summary_t> audit_ledger::get_glyph(
    const glyph_id_t& id) const {
  auto key = key::make_glyph_key(id);
  auto value = storage_.get(make_bytes_view(key));
  if (!value.has_value()) {
    return std::nullopt;
  }
  return decode_row(make_bytes_view(*value));
}

bool audit_ledger::contains(const glyph_id_t& id) const {
  auto key = key::make_glyph_key(id);
  return storage_.get(make_bytes_view(key)).has_value();
}

std::vector<audit_entry_t> audit_ledger::audit_trail(
    const glyph_id_t& id) const {
  auto prefix = key::make_audit_prefix(id);
  auto trail = std::vector<audit_entry_t>{};
  storage_.scan_prefix(
      make_bytes_view(prefix),
      [&](const bytes_view_t&, const bytes_view_t& value) {
        auto entry = encoding::scale::decode_audit_entry(value);
        if (!entry.has_value()) {
          throw glyphvault::storage_error("undecodable audit entry in ledger");
        }
        trail.push_back(std::move(*entry));
        return true;
      });
  std::reverse(trail.begin(), trail.end());
  return trail;
}

std::vector<glyph_summary_t> audit_ledger::list(
    const std::optional<std::string>& source,
    const std::size_t limit,
    const std::size_t offset) const {
  auto out = std::vector<glyph_summary_t>{};
  if (limit == 0) {
    return out;
  }
  auto skipped = std::size_t{};
  storage_.scan_prefix(
      make_bytes_view(key::kTimeIndexPrefix),
      [&](const bytes_view_t& index_key, const bytes_view_t&) {
        auto id = key::parse_time_index_key(index_key);
        if (!id.has_value()) {
          spdlog::warn("Skipping malformed listing index key");
          return true;
        }
        auto summary = get_glyph(*id);
        if (!summary.has_value() ||
            (source.has_value() && summary->source != *source)) {
          return true;
        }
        if (skipped < offset) {
          ++skipped;
          return true;
        }
        out.push_back(std::move(*summary));
        return out.size() < limit;
      });
  return out;
}

vault_stats audit_ledger::stats() const {
  auto stats = vault_stats{};
  storage_.scan_prefix(make_bytes_view(key::kGlyphPrefix),
                       [&](const bytes_view_t&, const bytes_view_t& value) {
                         auto summary = decode_row(value);
                         ++stats.total_glyphs;
                         if (summary.verified) {
                           ++stats.verified_count;
                         }
                         ++stats.sources[summary.source];
                         stats.latest_timestamp = std::max(
                             stats.latest_timestamp, summary.timestamp);
                         return true;
                       });
  return stats;
}

}  // namespace glyphvault::ledger
