#include <glyphvault/chain/abi.hpp>
#include <glyphvault/crypto/digest.hpp>

#include <algorithm>

using namespace glyphvault::schema;

namespace glyphvault::chain::abi {

namespace {

constexpr auto kWordSize = std::size_t{32};

bool high_bytes_zero(const bytes_view_t& word, const std::size_t width) {
  auto end = word.end() - static_cast<std::ptrdiff_t>(width);
  return std::all_of(word.begin(), end, [](const uint8_t b) { return b == 0; });
}

}  // namespace

selector_t selector(const std::string_view signature) {
  auto hash = glyphvault::crypto::keccak256(signature);
  auto out = selector_t{};
  std::copy_n(hash.begin(), out.size(), out.begin());
  return out;
}

bytes_t encode_call(const std::string_view signature, const hash32_t& word) {
  auto out = bytes_t{};
  out.reserve(4 + kWordSize);
  auto head = selector(signature);
  out.insert(out.end(), head.begin(), head.end());
  out.insert(out.end(), word.begin(), word.end());
  return out;
}

std::optional<bool> decode_bool(const bytes_view_t& data) {
  if (data.size() != kWordSize || !high_bytes_zero(data, 1) ||
      data.back() > 1) {
    return std::nullopt;
  }
  return data.back() == 1;
}

std::optional<uint64_t> decode_uint64(const bytes_view_t& data) {
  if (data.size() != kWordSize || !high_bytes_zero(data, sizeof(uint64_t))) {
    return std::nullopt;
  }
  auto value = uint64_t{};
  for (auto i = kWordSize - sizeof(uint64_t); i < kWordSize; ++i) {
    value = (value << 8u) | data[i];
  }
  return value;
}

}  // namespace glyphvault::chain::abi
