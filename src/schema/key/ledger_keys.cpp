#include <glyphvault/schema/key/builder.hpp>
#include <glyphvault/schema/key/ledger_keys.hpp>

#include <algorithm>
#include <limits>

using namespace glyphvault::schema;

namespace glyphvault::schema::key {

bytes_t make_glyph_key(const glyph_id_t& id) {
  auto b = builder{};
  b.write(kGlyphPrefix);
  b.write(std::span(id.data(), id.size()));
  return b.data;
}

bytes_t make_audit_prefix(const glyph_id_t& id) {
  auto b = builder{};
  b.write(kAuditPrefix);
  b.write(std::span(id.data(), id.size()));
  b.write("|");
  return b.data;
}

bytes_t make_audit_key(const glyph_id_t& id, const uint64_t sequence) {
  auto b = builder{};
  b.data = make_audit_prefix(id);
  b.write(sequence);
  return b.data;
}

bytes_t make_time_index_key(const timestamp_seconds_t timestamp,
                            const glyph_id_t& id) {
  auto b = builder{};
  b.write(kTimeIndexPrefix);
  b.write(std::numeric_limits<uint64_t>::max() - timestamp);
  b.write(std::span(id.data(), id.size()));
  return b.data;
}

std::optional<glyph_id_t> parse_time_index_key(const bytes_view_t& key) {
  constexpr auto kExpected = kTimeIndexPrefix.size() + sizeof(uint64_t) + 32;
  if (key.size() != kExpected ||
      !make_string_view(key).starts_with(kTimeIndexPrefix)) {
    return std::nullopt;
  }
  auto id = glyph_id_t{};
  std::copy_n(key.data() + kTimeIndexPrefix.size() + sizeof(uint64_t),
              id.size(), id.begin());
  return id;
}

}  // namespace glyphvault::schema::key
