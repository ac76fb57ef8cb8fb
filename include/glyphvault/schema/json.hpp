#pragma once

#include <glyphvault/schema/anchor_result.hpp>
#include <glyphvault/schema/audit_entry.hpp>
#include <glyphvault/schema/glyph.hpp>
#include <glyphvault/schema/glyph_summary.hpp>
#include <glyphvault/schema/proof_report.hpp>
#include <glyphvault/schema/vault_stats.hpp>
#include <json/value.h>
#include <optional>
#include <string>
#include <string_view>

namespace glyphvault::schema {

/// Serialize with sorted object keys, no whitespace, raw UTF-8 strings and
/// 17 significant digits for reals. Equal values always produce equal text.
std::string write_canonical_json(const Json::Value& value);

/// Strict parse: object or array root, no comments, no duplicate keys, no
/// trailing content.
std::optional<Json::Value> try_parse_json(std::string_view text);

Json::Value to_json(const glyph_t& glyph);
Json::Value to_json(const glyph_summary_t& summary);
Json::Value to_json(const audit_entry_t& entry);
Json::Value to_json(const proof_report_t& report);
Json::Value to_json(const anchor_result_t& result);
Json::Value to_json(const anchor_state& state);
Json::Value to_json(const vault_stats& stats);

}  // namespace glyphvault::schema
