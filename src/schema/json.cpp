#include <glyphvault/schema/json.hpp>

#include <json/reader.h>
#include <json/writer.h>

#include <memory>

namespace glyphvault::schema {

namespace {

Json::Value audit_trail_to_json(const std::vector<audit_entry_t>& trail) {
  auto out = Json::Value{Json::arrayValue};
  for (const auto& entry : trail) {
    out.append(to_json(entry));
  }
  return out;
}

}  // namespace

std::string write_canonical_json(const Json::Value& value) {
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "";
  builder["commentStyle"] = "None";
  builder["emitUTF8"] = true;
  builder["precision"] = 17;
  builder["precisionType"] = "significant";
  builder["enableYAMLCompatibility"] = false;
  builder["dropNullPlaceholders"] = false;
  return Json::writeString(builder, value);
}

std::optional<Json::Value> try_parse_json(const std::string_view text) {
  auto builder = Json::CharReaderBuilder{};
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  auto value = Json::Value{};
  auto errors = std::string{};
  if (!reader->parse(text.data(), text.data() + text.size(), &value,
                     &errors)) {
    return std::nullopt;
  }
  return value;
}

Json::Value to_json(const glyph_t& glyph) {
  auto out = Json::Value{Json::objectValue};
  out["glyph_id"] = to_prefixed_hex(glyph.id);
  out["data_hash"] = to_prefixed_hex(glyph.data_hash);
  out["source"] = glyph.source;
  out["timestamp"] = Json::UInt64{glyph.timestamp};
  out["signer"] = glyph.signer;
  out["signature"] = to_prefixed_hex(glyph.signature);
  out["data"] = glyph.data.value_or(Json::Value{Json::nullValue});
  out["verified"] = glyph.verified;
  return out;
}

Json::Value to_json(const glyph_summary_t& summary) {
  auto out = Json::Value{Json::objectValue};
  out["glyph_id"] = to_prefixed_hex(summary.id);
  out["data_hash"] = to_prefixed_hex(summary.data_hash);
  out["source"] = summary.source;
  out["timestamp"] = Json::UInt64{summary.timestamp};
  out["signer"] = summary.signer;
  out["signature"] = to_prefixed_hex(summary.signature);
  out["verified"] = summary.verified;
  return out;
}

Json::Value to_json(const audit_entry_t& entry) {
  auto out = Json::Value{Json::objectValue};
  out["sequence"] = Json::UInt64{entry.sequence};
  out["glyph_id"] = to_prefixed_hex(entry.glyph_id);
  out["action"] = entry.action;
  out["actor"] = entry.actor;
  out["timestamp"] = Json::UInt64{entry.timestamp};
  out["metadata"] = entry.metadata;
  return out;
}

Json::Value to_json(const proof_report_t& report) {
  auto out = Json::Value{Json::objectValue};
  out["glyph_id"] = to_prefixed_hex(report.glyph_id);
  out["data_hash"] = to_prefixed_hex(report.data_hash);
  out["source"] = report.source;
  out["timestamp"] = Json::UInt64{report.timestamp};
  out["signer"] = report.signer;
  out["signature"] = to_prefixed_hex(report.signature);
  out["signature_valid"] = report.signature_valid;
  out["assurance"] = std::string{to_string(report.assurance)};
  out["verified"] = report.verified;
  out["audit_trail"] = audit_trail_to_json(report.audit_trail);
  out["proof_generated_at"] = Json::UInt64{report.proof_generated_at};
  return out;
}

Json::Value to_json(const anchor_result_t& result) {
  auto out = Json::Value{Json::objectValue};
  out["status"] = std::string{to_string(result.status)};
  out["root"] = to_prefixed_hex(result.root);
  out["glyph_count"] = Json::UInt64{result.glyph_count};
  if (result.status == anchor_status::confirmed) {
    out["tx_hash"] = result.tx_hash;
    out["block_number"] = Json::UInt64{result.block_number};
    out["gas_used"] = Json::UInt64{result.gas_used};
  }
  return out;
}

Json::Value to_json(const anchor_state& state) {
  auto out = Json::Value{Json::objectValue};
  out["anchored"] = state.anchored;
  out["timestamp"] = Json::UInt64{state.timestamp};
  return out;
}

Json::Value to_json(const vault_stats& stats) {
  auto out = Json::Value{Json::objectValue};
  out["total_glyphs"] = Json::UInt64{stats.total_glyphs};
  out["verified_count"] = Json::UInt64{stats.verified_count};
  auto sources = Json::Value{Json::objectValue};
  for (const auto& [source, count] : stats.sources) {
    sources[source] = Json::UInt64{count};
  }
  out["sources"] = sources;
  out["latest_timestamp"] = Json::UInt64{stats.latest_timestamp};
  out["storage_path"] = stats.storage_path;
  return out;
}

}  // namespace glyphvault::schema
