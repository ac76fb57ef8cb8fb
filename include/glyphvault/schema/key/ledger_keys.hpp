#pragma once
#include <glyphvault/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Ledger key space. Each prefix plays the role of one table:
//   glyphs|<id>                      -> glyph summary
//   audit_log|<id>|<sequence BE>     -> audit entry (insert only)
//   glyph_time|<~timestamp BE><id>   -> empty, newest-first listing index
//   SYS|AUDIT_SEQ                    -> next audit sequence number
namespace glyphvault::schema::key {

inline constexpr auto kGlyphPrefix = std::string_view{"glyphs|"};
inline constexpr auto kAuditPrefix = std::string_view{"audit_log|"};
inline constexpr auto kTimeIndexPrefix = std::string_view{"glyph_time|"};
inline constexpr auto kAuditSequenceKey = std::string_view{"SYS|AUDIT_SEQ"};

glyphvault::schema::bytes_t make_glyph_key(
    const glyphvault::schema::glyph_id_t& id);

glyphvault::schema::bytes_t make_audit_prefix(
    const glyphvault::schema::glyph_id_t& id);

glyphvault::schema::bytes_t make_audit_key(
    const glyphvault::schema::glyph_id_t& id,
    uint64_t sequence);

glyphvault::schema::bytes_t make_time_index_key(
    glyphvault::schema::timestamp_seconds_t timestamp,
    const glyphvault::schema::glyph_id_t& id);

/// Extract the glyph id from a time index key, or std::nullopt when the key
/// does not have the expected shape.
std::optional<glyphvault::schema::glyph_id_t> parse_time_index_key(
    const glyphvault::schema::bytes_view_t& key);

}  // namespace glyphvault::schema::key
