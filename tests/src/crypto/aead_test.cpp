#include <glyphvault/crypto/aead.hpp>
#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace {

glyphvault::crypto::aes_key_t make_key(std::string_view passphrase) {
  auto salt = glyphvault::schema::bytes_t(16, 0x5A);
  return glyphvault::crypto::derive_key(
      passphrase, glyphvault::schema::make_bytes_view(salt), 1000);
}

}  // namespace

TEST(aead, derive_key_is_deterministic_per_salt_and_passphrase) {
  auto salt = glyphvault::schema::bytes_t(16, 0x01);
  auto other_salt = glyphvault::schema::bytes_t(16, 0x02);
  auto a = glyphvault::crypto::derive_key(
      "secret", glyphvault::schema::make_bytes_view(salt), 1000);
  auto b = glyphvault::crypto::derive_key(
      "secret", glyphvault::schema::make_bytes_view(salt), 1000);
  auto c = glyphvault::crypto::derive_key(
      "secret", glyphvault::schema::make_bytes_view(other_salt), 1000);
  auto d = glyphvault::crypto::derive_key(
      "Secret", glyphvault::schema::make_bytes_view(salt), 1000);
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
  EXPECT_NE(a, d);
}

TEST(aead, random_bytes_has_requested_size) {
  auto a = glyphvault::crypto::random_bytes(32);
  auto b = glyphvault::crypto::random_bytes(32);
  EXPECT_EQ(a.size(), 32u);
  EXPECT_NE(a, b);
}

TEST(aead, seal_then_open_returns_plaintext) {
  auto key = make_key("passphrase");
  auto plaintext = std::string{"{\"title\":\"A\"}"};
  auto aad = std::string{"glyph-id"};
  auto box = glyphvault::crypto::seal(
      key, glyphvault::schema::make_bytes_view(plaintext),
      glyphvault::schema::make_bytes_view(aad));
  EXPECT_EQ(box.ciphertext.size(), plaintext.size());

  auto opened = glyphvault::crypto::open(
      key, box, glyphvault::schema::make_bytes_view(aad));
  ASSERT_TRUE(opened.has_value());
  EXPECT_EQ(glyphvault::schema::make_string(*opened), plaintext);
}

TEST(aead, each_seal_uses_a_fresh_nonce) {
  auto key = make_key("passphrase");
  auto plaintext = std::string{"same"};
  auto first = glyphvault::crypto::seal(
      key, glyphvault::schema::make_bytes_view(plaintext), {});
  auto second = glyphvault::crypto::seal(
      key, glyphvault::schema::make_bytes_view(plaintext), {});
  EXPECT_NE(first.nonce, second.nonce);
  EXPECT_NE(first.ciphertext, second.ciphertext);
}

TEST(aead, open_rejects_tampering_wrong_key_and_wrong_aad) {
  auto key = make_key("passphrase");
  auto plaintext = std::string{"payload bytes"};
  auto aad = std::string{"id-1"};
  auto box = glyphvault::crypto::seal(
      key, glyphvault::schema::make_bytes_view(plaintext),
      glyphvault::schema::make_bytes_view(aad));

  auto flipped = box;
  flipped.ciphertext[0] ^= 0x01;
  EXPECT_FALSE(glyphvault::crypto::open(
                   key, flipped, glyphvault::schema::make_bytes_view(aad))
                   .has_value());

  auto bad_tag = box;
  bad_tag.tag[0] ^= 0x01;
  EXPECT_FALSE(glyphvault::crypto::open(
                   key, bad_tag, glyphvault::schema::make_bytes_view(aad))
                   .has_value());

  auto aad_view = glyphvault::schema::make_bytes_view(aad);
  EXPECT_FALSE(
      glyphvault::crypto::open(make_key("other"), box, aad_view).has_value());

  auto other_aad = std::string{"id-2"};
  EXPECT_FALSE(glyphvault::crypto::open(
                   key, box, glyphvault::schema::make_bytes_view(other_aad))
                   .has_value());
}
