#include <glyphvault/crypto/digest.hpp>
#include <glyphvault/crypto/secp256k1.hpp>
#include <glyphvault/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>
#include <string_view>

TEST(secp256k1, private_key_one_derives_known_address) {
  auto key = glyphvault::testing::make_signing_key(1);
  EXPECT_EQ(key.address_text(), "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");
  EXPECT_EQ(key.public_key()[0], 0x04);
  EXPECT_EQ(glyphvault::crypto::address_from_public_key(key.public_key()),
            key.address());
}

TEST(secp256k1, checksum_address_matches_eip55_example) {
  auto address = glyphvault::crypto::try_parse_address(
      "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ(glyphvault::crypto::to_checksum_address(*address),
            "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
}

TEST(secp256k1, try_parse_address_rejects_malformed_text) {
  EXPECT_FALSE(glyphvault::crypto::try_parse_address(
                   "5aaeb6053f3e94c9b9a09f33669435e7ef1beaed")
                   .has_value());
  EXPECT_FALSE(glyphvault::crypto::try_parse_address("0x1234").has_value());
  EXPECT_FALSE(glyphvault::crypto::try_parse_address(
                   "0xzzaeb6053f3e94c9b9a09f33669435e7ef1beaed")
                   .has_value());
}

TEST(secp256k1, from_private_key_rejects_zero_and_order) {
  auto zero = glyphvault::schema::private_key_t{};
  EXPECT_FALSE(
      glyphvault::crypto::signing_key::from_private_key(zero).has_value());

  auto order = glyphvault::schema::make_hash32(std::string_view{
      "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"});
  EXPECT_FALSE(
      glyphvault::crypto::signing_key::from_private_key(order).has_value());
}

TEST(secp256k1, from_hex_accepts_prefixed_and_bare_keys) {
  auto bare = glyphvault::crypto::signing_key::from_hex(
      "0000000000000000000000000000000000000000000000000000000000000001");
  auto prefixed = glyphvault::crypto::signing_key::from_hex(
      "0x0000000000000000000000000000000000000000000000000000000000000001");
  ASSERT_TRUE(bare.has_value());
  ASSERT_TRUE(prefixed.has_value());
  EXPECT_EQ(bare->address(), prefixed->address());
  EXPECT_FALSE(glyphvault::crypto::signing_key::from_hex("0x01").has_value());
  EXPECT_FALSE(
      glyphvault::crypto::signing_key::from_hex("not hex").has_value());
}

TEST(secp256k1, sign_then_recover_yields_signer_address) {
  auto key = glyphvault::crypto::signing_key::generate();
  auto digest = glyphvault::crypto::keccak256(std::string_view{"anchor me"});
  auto signature = key.sign_digest(digest);

  EXPECT_LE(signature[64], 1u);
  // Low-s: s must not exceed half the group order.
  EXPECT_LT(signature[32], 0x80u);

  auto recovered = glyphvault::crypto::recover_address(digest, signature);
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, key.address());

  auto ethereum_style = signature;
  ethereum_style[64] = static_cast<uint8_t>(ethereum_style[64] + 27);
  auto recovered_27 =
      glyphvault::crypto::recover_address(digest, ethereum_style);
  ASSERT_TRUE(recovered_27.has_value());
  EXPECT_EQ(*recovered_27, key.address());
}

TEST(secp256k1, altered_digest_or_signature_does_not_recover_signer) {
  auto key = glyphvault::testing::make_signing_key(7);
  auto digest = glyphvault::crypto::keccak256(std::string_view{"payload"});
  auto signature = key.sign_digest(digest);

  auto other_digest = digest;
  other_digest[0] ^= 0x01;
  auto recovered = glyphvault::crypto::recover_address(other_digest, signature);
  EXPECT_TRUE(!recovered.has_value() || *recovered != key.address());

  auto bad = signature;
  bad[10] ^= 0x01;
  auto recovered_bad = glyphvault::crypto::recover_address(digest, bad);
  EXPECT_TRUE(!recovered_bad.has_value() || *recovered_bad != key.address());

  auto bad_v = signature;
  bad_v[64] = 9;
  EXPECT_FALSE(glyphvault::crypto::recover_address(digest, bad_v).has_value());
}

TEST(secp256k1, personal_message_digest_prefixes_length) {
  auto message = std::string_view{"hello"};
  auto expected = glyphvault::crypto::keccak256(
      std::string_view{"\x19" "Ethereum Signed Message:\n5hello"});
  EXPECT_EQ(glyphvault::crypto::personal_message_digest(message), expected);
}

TEST(secp256k1, copies_share_identity) {
  auto key = glyphvault::testing::make_signing_key(3);
  auto copy = key;
  EXPECT_EQ(copy.address(), key.address());
  EXPECT_EQ(copy.public_key(), key.public_key());
}
