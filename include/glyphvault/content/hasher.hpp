#pragma once

#include <glyphvault/schema/primitives.hpp>
#include <json/value.h>
#include <string>
#include <string_view>

namespace glyphvault::content {

/// Canonical JSON text: sorted keys, compact separators, UTF-8 strings,
/// exact integers and 17 significant digits for reals.
std::string canonicalize(const Json::Value& data);

/// BLAKE3-256 over the canonical text.
glyphvault::schema::hash32_t hash(const Json::Value& data);

/// Strict parse of a JSON object or array. Throws std::invalid_argument on
/// malformed input or a scalar root.
Json::Value parse(std::string_view text);

/// True when `data` is an object or an array, the only payload shapes a
/// glyph may carry.
bool is_payload(const Json::Value& data) noexcept;

}  // namespace glyphvault::content
