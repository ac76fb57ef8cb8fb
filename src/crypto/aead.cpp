#include <glyphvault/common/critical.hpp>
#include <glyphvault/crypto/aead.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <memory>

namespace glyphvault::crypto {

namespace {

using cipher_ctx_ptr =
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

cipher_ctx_ptr make_cipher_ctx() {
  auto ctx = cipher_ctx_ptr{EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free};
  if (!ctx) {
    glyphvault::common::critical("EVP_CIPHER_CTX_new failed");
  }
  return ctx;
}

}  // namespace

aes_key_t derive_key(const std::string_view passphrase,
                     const glyphvault::schema::bytes_view_t& salt,
                     const uint32_t iterations) {
  auto key = aes_key_t{};
  if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                        salt.data(), static_cast<int>(salt.size()),
                        static_cast<int>(iterations), EVP_sha256(),
                        static_cast<int>(key.size()), key.data()) != 1) {
    glyphvault::common::critical("PBKDF2 key derivation failed");
  }
  return key;
}

glyphvault::schema::bytes_t random_bytes(const std::size_t size) {
  auto out = glyphvault::schema::bytes_t(size);
  if (size > 0 && RAND_bytes(out.data(), static_cast<int>(size)) != 1) {
    glyphvault::common::critical("OpenSSL RAND_bytes failed");
  }
  return out;
}

sealed_box seal(const aes_key_t& key,
                const glyphvault::schema::bytes_view_t& plaintext,
                const glyphvault::schema::bytes_view_t& associated_data) {
  auto box = sealed_box{};
  auto nonce = random_bytes(box.nonce.size());
  std::copy(nonce.begin(), nonce.end(), box.nonce.begin());

  auto ctx = make_cipher_ctx();
  auto length = 0;
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(box.nonce.size()), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(),
                         box.nonce.data()) != 1) {
    glyphvault::common::critical("AES-256-GCM encrypt init failed");
  }
  if (!associated_data.empty() &&
      EVP_EncryptUpdate(ctx.get(), nullptr, &length, associated_data.data(),
                        static_cast<int>(associated_data.size())) != 1) {
    glyphvault::common::critical("AES-256-GCM associated data failed");
  }

  box.ciphertext.resize(plaintext.size());
  auto written = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), box.ciphertext.data(), &length,
                          plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
      glyphvault::common::critical("AES-256-GCM encrypt failed");
    }
    written = length;
  }
  if (EVP_EncryptFinal_ex(ctx.get(), box.ciphertext.data() + written,
                          &length) != 1) {
    glyphvault::common::critical("AES-256-GCM encrypt final failed");
  }
  box.ciphertext.resize(static_cast<std::size_t>(written + length));

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(box.tag.size()),
                          box.tag.data()) != 1) {
    glyphvault::common::critical("AES-256-GCM tag extraction failed");
  }
  return box;
}

std::optional<glyphvault::schema::bytes_t> open(
    const aes_key_t& key,
    const sealed_box& box,
    const glyphvault::schema::bytes_view_t& associated_data) {
  auto ctx = make_cipher_ctx();
  auto length = 0;
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(box.nonce.size()), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(),
                         box.nonce.data()) != 1) {
    return std::nullopt;
  }
  if (!associated_data.empty() &&
      EVP_DecryptUpdate(ctx.get(), nullptr, &length, associated_data.data(),
                        static_cast<int>(associated_data.size())) != 1) {
    return std::nullopt;
  }

  auto plaintext = glyphvault::schema::bytes_t(box.ciphertext.size());
  auto written = 0;
  if (!box.ciphertext.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &length,
                          box.ciphertext.data(),
                          static_cast<int>(box.ciphertext.size())) != 1) {
      return std::nullopt;
    }
    written = length;
  }

  // EVP_CTRL_GCM_SET_TAG takes a non-const buffer.
  auto tag = box.tag;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(tag.size()), tag.data()) != 1) {
    return std::nullopt;
  }
  if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + written, &length) !=
      1) {
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return std::nullopt;
  }
  plaintext.resize(static_cast<std::size_t>(written + length));
  return plaintext;
}

}  // namespace glyphvault::crypto
