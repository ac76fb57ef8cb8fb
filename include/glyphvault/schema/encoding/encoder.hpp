#pragma once
#include <glyphvault/schema/primitives.hpp>
#include <optional>
#include <span>

namespace glyphvault::schema::encoding {

// The wire library is a build time choice expressed as a tag type:
//   auto enc = encoder<scale_encoder_tag>{};
// Hot swapping is not a design goal.
template <typename Library>
struct encoder {
  template <typename T>
  glyphvault::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, glyphvault::schema::bytes_t& out);

  template <typename T>
  T decode(const glyphvault::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const glyphvault::schema::bytes_view_t& bytes);
};

}  // namespace glyphvault::schema::encoding
