#pragma once

#include <glyphvault/schema/audit_entry.hpp>
#include <glyphvault/schema/glyph.hpp>
#include <glyphvault/schema/glyph_summary.hpp>
#include <glyphvault/schema/primitives.hpp>
#include <optional>

// SCALE layouts for persisted records. Each record is flattened into a
// tuple; JSON members travel as canonical JSON text. Decoders return
// std::nullopt on any malformed input, including an unknown version.
namespace glyphvault::schema::encoding::scale {

glyphvault::schema::bytes_t encode(const glyphvault::schema::glyph_t& o);
std::optional<glyphvault::schema::glyph_t> decode_glyph(
    const glyphvault::schema::bytes_view_t& bytes);

glyphvault::schema::bytes_t encode(
    const glyphvault::schema::glyph_summary_t& o);
std::optional<glyphvault::schema::glyph_summary_t> decode_glyph_summary(
    const glyphvault::schema::bytes_view_t& bytes);

glyphvault::schema::bytes_t encode(const glyphvault::schema::audit_entry_t& o);
std::optional<glyphvault::schema::audit_entry_t> decode_audit_entry(
    const glyphvault::schema::bytes_view_t& bytes);

}  // namespace glyphvault::schema::encoding::scale
