#include <glyphvault/blake3/hash.hpp>
#include <glyphvault/crypto/digest.hpp>
#include <gtest/gtest.h>

#include <string>
#include <string_view>

using glyphvault::schema::to_hex;

TEST(digest, keccak256_matches_known_vectors) {
  EXPECT_EQ(to_hex(glyphvault::crypto::keccak256(std::string_view{""})),
            "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
  EXPECT_EQ(to_hex(glyphvault::crypto::keccak256(std::string_view{"abc"})),
            "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(digest, keccak256_is_legacy_padding_not_sha3) {
  // SHA3-256("") for contrast.
  EXPECT_NE(to_hex(glyphvault::crypto::keccak256(std::string_view{""})),
            "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
  auto transfer = glyphvault::crypto::keccak256(
      std::string_view{"transfer(address,uint256)"});
  EXPECT_EQ(to_hex(transfer).substr(0, 8), "a9059cbb");
}

TEST(digest, keccak256_handles_multi_block_input) {
  // 200 bytes spans the 136-byte rate twice.
  auto input = std::string(200, 'a');
  auto once = glyphvault::crypto::keccak256(std::string_view{input});
  auto again = glyphvault::crypto::keccak256(
      glyphvault::schema::make_bytes_view(input));
  EXPECT_EQ(once, again);
  EXPECT_NE(once, glyphvault::crypto::keccak256(std::string_view{"a"}));

  // Exactly one rate block exercises the padding-only final block.
  auto block = std::string(136, 'x');
  EXPECT_NE(glyphvault::crypto::keccak256(std::string_view{block}),
            glyphvault::crypto::keccak256(std::string_view{block + "x"}));
}

TEST(digest, sha256_matches_known_vectors) {
  EXPECT_EQ(to_hex(glyphvault::crypto::sha256(std::string_view{""})),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(to_hex(glyphvault::crypto::sha256(std::string_view{"abc"})),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(digest, blake3_matches_known_vector) {
  EXPECT_EQ(to_hex(glyphvault::blake3::hash(std::string_view{""})),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(digest, blake3_string_and_bytes_agree) {
  auto text = std::string{"{\"a\":1}"};
  auto bytes = glyphvault::schema::make_bytes_view(text);
  EXPECT_EQ(glyphvault::blake3::hash(std::string_view{text}),
            glyphvault::blake3::hash(bytes));
}
