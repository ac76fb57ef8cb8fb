#pragma once
#include <glyphvault/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace glyphvault::schema::key {

struct builder final {
  glyphvault::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  /// Big-endian so that byte order in the key space matches numeric order.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = sizeof(T); i > 0; --i) {
      data.push_back(static_cast<uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace glyphvault::schema::key
