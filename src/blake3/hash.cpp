#include <blake3.h>
#include <glyphvault/blake3/hash.hpp>

namespace glyphvault::blake3 {

glyphvault::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  // BLAKE3_OUT_LEN
  auto output = glyphvault::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

glyphvault::schema::hash32_t hash(
    const glyphvault::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  // BLAKE3_OUT_LEN
  auto output = glyphvault::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace glyphvault::blake3
