#pragma once

#include <glyphvault/crypto/secp256k1.hpp>
#include <glyphvault/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace glyphvault::testing {

/// Low iteration count keeps key derivation fast in tests.
inline constexpr auto kTestKdfIterations = uint32_t{1000};
inline constexpr auto kTestPassphrase = std::string_view{"correct horse"};

inline glyphvault::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = glyphvault::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Deterministic key whose scalar is `seed` in the last byte.
inline glyphvault::crypto::signing_key make_signing_key(const uint8_t seed) {
  auto secret = glyphvault::schema::private_key_t{};
  secret[31] = seed;
  return *glyphvault::crypto::signing_key::from_private_key(secret);
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Removes the directory when the test scope ends.
class scoped_path final {
 public:
  explicit scoped_path(const std::string_view prefix)
      : path_(make_db_path(prefix)) {}
  ~scoped_path() { remove_path(path_); }

  scoped_path(const scoped_path&) = delete;
  scoped_path& operator=(const scoped_path&) = delete;

  const std::string& str() const noexcept { return path_; }
  std::filesystem::path path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace glyphvault::testing
