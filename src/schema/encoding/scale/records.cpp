#include <glyphvault/schema/encoding/scale/encoder.hpp>
#include <glyphvault/schema/encoding/scale/records.hpp>
#include <glyphvault/schema/json.hpp>

#include <string>
#include <tuple>

using namespace glyphvault::schema;

namespace glyphvault::schema::encoding::scale {

namespace {

using encoder_t = encoder<scale_encoder_tag>;

using glyph_tuple_t = std::tuple<uint16_t,
                                 hash32_t,
                                 hash32_t,
                                 std::string,
                                 uint64_t,
                                 std::string,
                                 bytes_t,
                                 std::optional<std::string>,
                                 bool>;

using glyph_summary_tuple_t = std::tuple<uint16_t,
                                         hash32_t,
                                         hash32_t,
                                         std::string,
                                         uint64_t,
                                         std::string,
                                         bytes_t,
                                         bool>;

using audit_entry_tuple_t = std::tuple<uint16_t,
                                       uint64_t,
                                       hash32_t,
                                       std::string,
                                       std::string,
                                       uint64_t,
                                       std::string>;

}  // namespace

bytes_t encode(const glyph_t& o) {
  auto data = std::optional<std::string>{};
  if (o.data.has_value()) {
    data = write_canonical_json(*o.data);
  }
  auto encoder = encoder_t{};
  return encoder.encode(glyph_tuple_t{o.version, o.id, o.data_hash, o.source,
                                      o.timestamp, o.signer, o.signature,
                                      data, o.verified});
}

std::optional<glyph_t> decode_glyph(const bytes_view_t& bytes) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<glyph_tuple_t>(bytes);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  auto& [version, id, data_hash, source, timestamp, signer, signature, data,
         verified] = *decoded;
  if (version != 1) {
    return std::nullopt;
  }
  auto out = glyph_t{};
  out.id = id;
  out.data_hash = data_hash;
  out.source = std::move(source);
  out.timestamp = timestamp;
  out.signer = std::move(signer);
  out.signature = std::move(signature);
  out.verified = verified;
  if (data.has_value()) {
    auto parsed = try_parse_json(*data);
    if (!parsed.has_value()) {
      return std::nullopt;
    }
    out.data = std::move(*parsed);
  }
  return out;
}

bytes_t encode(const glyph_summary_t& o) {
  auto encoder = encoder_t{};
  return encoder.encode(glyph_summary_tuple_t{o.version, o.id, o.data_hash,
                                              o.source, o.timestamp, o.signer,
                                              o.signature, o.verified});
}

std::optional<glyph_summary_t> decode_glyph_summary(const bytes_view_t& bytes) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<glyph_summary_tuple_t>(bytes);
  if (!decoded.has_value() || std::get<0>(*decoded) != 1) {
    return std::nullopt;
  }
  auto& [version, id, data_hash, source, timestamp, signer, signature,
         verified] = *decoded;
  return glyph_summary_t{.version = version,
                         .id = id,
                         .data_hash = data_hash,
                         .source = std::move(source),
                         .timestamp = timestamp,
                         .signer = std::move(signer),
                         .signature = std::move(signature),
                         .verified = verified};
}

bytes_t encode(const audit_entry_t& o) {
  auto encoder = encoder_t{};
  return encoder.encode(audit_entry_tuple_t{
      o.version, o.sequence, o.glyph_id, o.action, o.actor, o.timestamp,
      write_canonical_json(o.metadata)});
}

std::optional<audit_entry_t> decode_audit_entry(const bytes_view_t& bytes) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<audit_entry_tuple_t>(bytes);
  if (!decoded.has_value() || std::get<0>(*decoded) != 1) {
    return std::nullopt;
  }
  auto& [version, sequence, glyph_id, action, actor, timestamp, metadata] =
      *decoded;
  auto parsed = try_parse_json(metadata);
  if (!parsed.has_value()) {
    return std::nullopt;
  }
  auto out = audit_entry_t{};
  out.sequence = sequence;
  out.glyph_id = glyph_id;
  out.action = std::move(action);
  out.actor = std::move(actor);
  out.timestamp = timestamp;
  out.metadata = std::move(*parsed);
  return out;
}

}  // namespace glyphvault::schema::encoding::scale
