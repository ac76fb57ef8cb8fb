#include <glyphvault/content/hasher.hpp>
#include <glyphvault/crypto/digest.hpp>
#include <glyphvault/glyph/factory.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace glyphvault::glyph {

namespace {

constexpr auto kEthereumRecoveryOffset = uint8_t{27};

// n / 2 for secp256k1, big-endian. Signatures are always emitted low-s.
constexpr auto kHalfCurveOrder = std::array<uint8_t, 32>{
    0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
    0xff, 0xff, 0xff, 0xff, 0xff, 0x5d, 0x57, 0x6e, 0x73, 0x57, 0xa4,
    0x50, 0x1d, 0xdf, 0xe9, 0x2f, 0x46, 0x68, 0x1b, 0x20, 0xa0};

bool is_canonical(const glyphvault::crypto::recoverable_signature_t&
                      signature) noexcept {
  auto v = signature[64];
  if (v != kEthereumRecoveryOffset && v != kEthereumRecoveryOffset + 1) {
    return false;
  }
  return !std::lexicographical_compare(
      kHalfCurveOrder.begin(), kHalfCurveOrder.end(), signature.begin() + 32,
      signature.begin() + 64);
}

bool equals_ignore_case(const std::string_view lhs,
                        const std::string_view rhs) noexcept {
  return lhs.size() == rhs.size() &&
         std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                    [](const char a, const char b) {
                      return std::tolower(static_cast<unsigned char>(a)) ==
                             std::tolower(static_cast<unsigned char>(b));
                    });
}

}  // namespace

glyphvault::schema::glyph_id_t derive_id(
    const glyphvault::schema::hash32_t& data_hash,
    const std::string_view source) {
  auto preimage = glyphvault::schema::bytes_t{data_hash.begin(),
                                              data_hash.end()};
  preimage.insert(preimage.end(), source.begin(), source.end());
  return glyphvault::crypto::keccak256(
      glyphvault::schema::make_bytes_view(preimage));
}

glyphvault::schema::hash32_t attestation_digest(
    const glyphvault::schema::hash32_t& data_hash) {
  return glyphvault::crypto::sha256(
      std::string_view{"server:" + glyphvault::schema::to_hex(data_hash)});
}

glyphvault::schema::hash32_t signing_digest(
    const glyphvault::schema::hash32_t& data_hash) {
  return glyphvault::crypto::personal_message_digest(
      glyphvault::schema::to_prefixed_hex(data_hash));
}

bool verify_signature(const glyphvault::schema::hash32_t& data_hash,
                      const std::string_view signer,
                      const glyphvault::schema::bytes_t& signature) noexcept {
  try {
    if (signer == glyphvault::schema::kServerSigner) {
      auto expected = attestation_digest(data_hash);
      return signature.size() == expected.size() &&
             std::equal(expected.begin(), expected.end(), signature.begin());
    }
    auto compact = glyphvault::crypto::recoverable_signature_t{};
    if (signature.size() != compact.size()) {
      return false;
    }
    std::copy(signature.begin(), signature.end(), compact.begin());
    if (!is_canonical(compact)) {
      return false;
    }
    auto recovered =
        glyphvault::crypto::recover_address(signing_digest(data_hash), compact);
    if (!recovered.has_value()) {
      return false;
    }
    auto address = glyphvault::crypto::to_checksum_address(*recovered);
    return equals_ignore_case(address, signer);
  } catch (const std::exception& e) {
    spdlog::warn("Signature verification failed: {}", e.what());
    return false;
  }
}

bool verify(const glyphvault::schema::glyph_t& glyph) noexcept {
  return verify_signature(glyph.data_hash, glyph.signer, glyph.signature);
}

glyphvault::schema::assurance_level assurance(
    const std::string_view signer) noexcept {
  if (signer == glyphvault::schema::kServerSigner) {
    return glyphvault::schema::assurance_level::server_attestation;
  }
  return glyphvault::schema::assurance_level::local_signature;
}

glyphvault::schema::assurance_level assurance(
    const glyphvault::schema::glyph_t& glyph) noexcept {
  return assurance(glyph.signer);
}

factory::factory(signing_identity identity) : identity_(std::move(identity)) {}

glyphvault::schema::glyph_t factory::create(const Json::Value& data,
                                            const std::string& source) const {
  return create(data, source, glyphvault::schema::now_seconds());
}

glyphvault::schema::glyph_t factory::create(
    const Json::Value& data,
    const std::string& source,
    const glyphvault::schema::timestamp_seconds_t timestamp) const {
  if (!glyphvault::content::is_payload(data)) {
    throw std::invalid_argument("glyph payload must be a JSON object or array");
  }
  auto glyph = glyphvault::schema::glyph_t{};
  glyph.data_hash = glyphvault::content::hash(data);
  glyph.id = derive_id(glyph.data_hash, source);
  glyph.source = source;
  glyph.timestamp = timestamp;
  glyph.signer = signer();
  glyph.signature = sign(glyph.data_hash);
  // Stored as parsed from its canonical text so that a decoded copy
  // compares equal to the original.
  glyph.data =
      glyphvault::content::parse(glyphvault::content::canonicalize(data));
  glyph.verified = true;
  spdlog::debug("Created glyph {} from source '{}'",
                glyphvault::schema::to_prefixed_hex(glyph.id), source);
  return glyph;
}

std::string factory::signer() const {
  return std::visit(
      overloaded{
          [](const local_key& identity) { return identity.key.address_text(); },
          [](const server_attestation&) {
            return std::string{glyphvault::schema::kServerSigner};
          }},
      identity_);
}

glyphvault::schema::assurance_level factory::assurance() const noexcept {
  if (std::holds_alternative<local_key>(identity_)) {
    return glyphvault::schema::assurance_level::local_signature;
  }
  return glyphvault::schema::assurance_level::server_attestation;
}

glyphvault::schema::bytes_t factory::sign(
    const glyphvault::schema::hash32_t& data_hash) const {
  return std::visit(
      overloaded{[&](const local_key& identity) {
                   auto signature =
                       identity.key.sign_digest(signing_digest(data_hash));
                   signature[64] = static_cast<uint8_t>(
                       signature[64] + kEthereumRecoveryOffset);
                   return glyphvault::schema::bytes_t{signature.begin(),
                                                      signature.end()};
                 },
                 [&](const server_attestation&) {
                   auto digest = attestation_digest(data_hash);
                   return glyphvault::schema::bytes_t{digest.begin(),
                                                      digest.end()};
                 }},
      identity_);
}

}  // namespace glyphvault::glyph
