#include <glyphvault/blake3/hash.hpp>
#include <glyphvault/content/hasher.hpp>
#include <glyphvault/schema/json.hpp>

#include <stdexcept>

namespace glyphvault::content {

std::string canonicalize(const Json::Value& data) {
  return glyphvault::schema::write_canonical_json(data);
}

glyphvault::schema::hash32_t hash(const Json::Value& data) {
  return glyphvault::blake3::hash(std::string_view{canonicalize(data)});
}

Json::Value parse(const std::string_view text) {
  auto parsed = glyphvault::schema::try_parse_json(text);
  if (!parsed.has_value()) {
    throw std::invalid_argument("payload is not a well-formed JSON document");
  }
  if (!is_payload(*parsed)) {
    throw std::invalid_argument("payload must be a JSON object or array");
  }
  return *parsed;
}

bool is_payload(const Json::Value& data) noexcept {
  return data.isObject() || data.isArray();
}

}  // namespace glyphvault::content
