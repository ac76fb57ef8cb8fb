#include <glyphvault/common/critical.hpp>
#include <glyphvault/crypto/digest.hpp>

#include <memory>
#include <string>
#include <openssl/evp.h>

namespace glyphvault::crypto {

namespace {

using evp_md_ptr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;

glyphvault::schema::hash32_t digest(
    const EVP_MD* md, const glyphvault::schema::bytes_view_t& bytes,
    const std::string_view& name) {
  auto out = glyphvault::schema::hash32_t{};
  auto size = static_cast<unsigned int>(out.size());
  if (EVP_Digest(bytes.data(), bytes.size(), out.data(), &size, md,
                 nullptr) != 1 ||
      size != out.size()) {
    glyphvault::common::critical(std::string{"OpenSSL "} + std::string{name} +
                                 " digest failed");
  }
  return out;
}

// Legacy Keccak (0x01 padding) lives in the default provider from 3.2 on.
const EVP_MD* keccak256_md() {
  static auto md = evp_md_ptr{EVP_MD_fetch(nullptr, "KECCAK-256", nullptr),
                              &EVP_MD_free};
  if (!md) {
    glyphvault::common::critical("OpenSSL KECCAK-256 is unavailable");
  }
  return md.get();
}

}  // namespace

glyphvault::schema::hash32_t keccak256(
    const glyphvault::schema::bytes_view_t& bytes) {
  return digest(keccak256_md(), bytes, "KECCAK-256");
}

glyphvault::schema::hash32_t keccak256(const std::string_view& str) {
  return keccak256(glyphvault::schema::make_bytes_view(str));
}

glyphvault::schema::hash32_t sha256(
    const glyphvault::schema::bytes_view_t& bytes) {
  return digest(EVP_sha256(), bytes, "SHA-256");
}

glyphvault::schema::hash32_t sha256(const std::string_view& str) {
  return sha256(glyphvault::schema::make_bytes_view(str));
}

}  // namespace glyphvault::crypto
