#include <glyphvault/chain/rlp.hpp>

#include <algorithm>

using namespace glyphvault::schema;

namespace glyphvault::chain::rlp {

namespace {

constexpr auto kShortString = uint8_t{0x80};
constexpr auto kShortList = uint8_t{0xc0};
constexpr auto kMaxShortPayload = std::size_t{55};

bytes_t big_endian(uint64_t value) {
  auto out = bytes_t{};
  while (value > 0) {
    out.push_back(static_cast<uint8_t>(value & 0xFFu));
    value >>= 8u;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

bytes_t encode_header(const std::size_t payload_size, const uint8_t offset) {
  if (payload_size <= kMaxShortPayload) {
    return bytes_t{static_cast<uint8_t>(offset + payload_size)};
  }
  auto length = big_endian(payload_size);
  auto out = bytes_t{static_cast<uint8_t>(offset + kMaxShortPayload +
                                          length.size())};
  out.insert(out.end(), length.begin(), length.end());
  return out;
}

}  // namespace

bytes_t encode_bytes(const bytes_view_t& bytes) {
  if (bytes.size() == 1 && bytes[0] < kShortString) {
    return bytes_t{bytes[0]};
  }
  auto out = encode_header(bytes.size(), kShortString);
  out.insert(out.end(), bytes.begin(), bytes.end());
  return out;
}

bytes_t encode_uint(const uint64_t value) {
  auto bytes = big_endian(value);
  return encode_bytes(make_bytes_view(bytes));
}

bytes_t encode_list(const std::vector<bytes_t>& encoded_items) {
  auto payload_size = std::size_t{};
  for (const auto& encoded : encoded_items) {
    payload_size += encoded.size();
  }
  auto out = encode_header(payload_size, kShortList);
  for (const auto& encoded : encoded_items) {
    out.insert(out.end(), encoded.begin(), encoded.end());
  }
  return out;
}

bytes_t trim_leading_zeros(const bytes_view_t& bytes) {
  auto first = std::find_if(bytes.begin(), bytes.end(),
                            [](const uint8_t b) { return b != 0; });
  return bytes_t{first, bytes.end()};
}

}  // namespace glyphvault::chain::rlp
