#include <glyphvault/common/critical.hpp>
#include <glyphvault/crypto/digest.hpp>
#include <glyphvault/crypto/secp256k1.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

namespace glyphvault::crypto {

namespace {

using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using secret_bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using param_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

constexpr auto kSigningAttempts = 8;

ec_group_ptr make_group() {
  return ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                      EC_GROUP_free};
}

bignum_ptr make_bignum(const uint8_t* data, const std::size_t size) {
  return bignum_ptr{BN_bin2bn(data, static_cast<int>(size), nullptr),
                    BN_free};
}

std::optional<public_key_t> encode_point(const EC_GROUP* group,
                                         const EC_POINT* point,
                                         BN_CTX* ctx) {
  auto out = public_key_t{};
  auto written = EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED,
                                    out.data(), out.size(), ctx);
  if (written != out.size()) {
    return std::nullopt;
  }
  return out;
}

std::optional<public_key_t> derive_public_key(
    const glyphvault::schema::private_key_t& secret) {
  auto group = make_group();
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  if (!group || !ctx) {
    return std::nullopt;
  }
  auto scalar = secret_bignum_ptr{
      BN_bin2bn(secret.data(), static_cast<int>(secret.size()), nullptr),
      BN_clear_free};
  if (!scalar || BN_is_zero(scalar.get()) ||
      BN_cmp(scalar.get(), EC_GROUP_get0_order(group.get())) >= 0) {
    return std::nullopt;
  }
  auto point = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point || EC_POINT_mul(group.get(), point.get(), scalar.get(), nullptr,
                             nullptr, ctx.get()) != 1) {
    return std::nullopt;
  }
  return encode_point(group.get(), point.get(), ctx.get());
}

evp_pkey_ptr make_keypair(const glyphvault::schema::private_key_t& secret,
                          const public_key_t& public_key) {
  auto none = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto scalar = secret_bignum_ptr{
      BN_bin2bn(secret.data(), static_cast<int>(secret.size()), nullptr),
      BN_clear_free};
  auto builder = param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!scalar || !builder) {
    return none;
  }
  if (OSSL_PARAM_BLD_push_utf8_string(builder.get(), OSSL_PKEY_PARAM_GROUP_NAME,
                                      "secp256k1", 0) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             scalar.get()) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       public_key.data(),
                                       public_key.size()) != 1) {
    return none;
  }
  auto params =
      param_ptr{OSSL_PARAM_BLD_to_param(builder.get()), OSSL_PARAM_free};
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return none;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &raw_pkey, EVP_PKEY_KEYPAIR,
                        params.get()) != 1) {
    return none;
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

// One ECDSA signature over the digest, as compact r || s with low-s.
std::optional<std::array<uint8_t, 64>> sign_compact(
    EVP_PKEY* pkey,
    const glyphvault::schema::hash32_t& digest) {
  auto ctx =
      evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_from_pkey(nullptr, pkey, nullptr),
                       EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_sign_init(ctx.get()) != 1) {
    return std::nullopt;
  }
  auto der_size = std::size_t{};
  if (EVP_PKEY_sign(ctx.get(), nullptr, &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_PKEY_sign(ctx.get(), der.data(), &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = static_cast<const unsigned char*>(der.data());
  auto sig = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
      ECDSA_SIG_free};
  if (!sig) {
    return std::nullopt;
  }
  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(sig.get(), &r, &s);

  auto group = make_group();
  auto half_order = bignum_ptr{BN_dup(EC_GROUP_get0_order(group.get())),
                               BN_free};
  auto low_s = bignum_ptr{BN_dup(s), BN_free};
  if (!half_order || !low_s || BN_rshift1(half_order.get(),
                                          half_order.get()) != 1) {
    return std::nullopt;
  }
  if (BN_cmp(low_s.get(), half_order.get()) > 0 &&
      BN_sub(low_s.get(), EC_GROUP_get0_order(group.get()), low_s.get()) !=
          1) {
    return std::nullopt;
  }

  auto out = std::array<uint8_t, 64>{};
  if (BN_bn2binpad(r, out.data(), 32) != 32 ||
      BN_bn2binpad(low_s.get(), out.data() + 32, 32) != 32) {
    return std::nullopt;
  }
  return out;
}

}  // namespace

signing_key::signing_key(const glyphvault::schema::private_key_t& secret,
                         const public_key_t& public_key)
    : secret_(secret),
      public_key_(public_key),
      address_(address_from_public_key(public_key)) {}

signing_key::~signing_key() {
  OPENSSL_cleanse(secret_.data(), secret_.size());
}

std::optional<signing_key> signing_key::from_private_key(
    const glyphvault::schema::private_key_t& secret) {
  auto public_key = derive_public_key(secret);
  if (!public_key.has_value()) {
    return std::nullopt;
  }
  return signing_key{secret, *public_key};
}

std::optional<signing_key> signing_key::from_hex(const std::string_view hex) {
  auto decoded = glyphvault::schema::try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto secret = glyphvault::schema::private_key_t{};
  std::copy(decoded->begin(), decoded->end(), secret.begin());
  OPENSSL_cleanse(decoded->data(), decoded->size());
  auto key = from_private_key(secret);
  OPENSSL_cleanse(secret.data(), secret.size());
  return key;
}

signing_key signing_key::generate() {
  auto secret = glyphvault::schema::private_key_t{};
  while (true) {
    if (RAND_bytes(secret.data(), static_cast<int>(secret.size())) != 1) {
      glyphvault::common::critical("OpenSSL RAND_bytes failed");
    }
    auto key = from_private_key(secret);
    if (key.has_value()) {
      OPENSSL_cleanse(secret.data(), secret.size());
      return *key;
    }
  }
}

std::string signing_key::address_text() const {
  return to_checksum_address(address_);
}

recoverable_signature_t signing_key::sign_digest(
    const glyphvault::schema::hash32_t& digest) const {
  auto pkey = make_keypair(secret_, public_key_);
  if (!pkey) {
    glyphvault::common::critical("failed to load secp256k1 key into OpenSSL");
  }

  // A recovery id of 2 or 3 (r overflowed the order) has negligible odds;
  // signing again with a fresh nonce sidesteps it.
  for (auto attempt = 0; attempt < kSigningAttempts; ++attempt) {
    auto compact = sign_compact(pkey.get(), digest);
    if (!compact.has_value()) {
      glyphvault::common::critical("OpenSSL secp256k1 signing failed");
    }
    auto signature = recoverable_signature_t{};
    std::copy(compact->begin(), compact->end(), signature.begin());
    for (uint8_t recovery_id = 0; recovery_id < 2; ++recovery_id) {
      signature[64] = recovery_id;
      auto recovered = recover_public_key(digest, signature);
      if (recovered.has_value() && *recovered == public_key_) {
        return signature;
      }
    }
  }
  glyphvault::common::critical("unable to derive secp256k1 recovery id");
}

std::optional<public_key_t> recover_public_key(
    const glyphvault::schema::hash32_t& digest,
    const recoverable_signature_t& signature) {
  auto recovery_id = signature[64];
  if (recovery_id >= 27) {
    recovery_id = static_cast<uint8_t>(recovery_id - 27);
  }
  if (recovery_id > 3) {
    return std::nullopt;
  }

  auto group = make_group();
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  if (!group || !ctx) {
    return std::nullopt;
  }
  const auto* order = EC_GROUP_get0_order(group.get());

  auto r = make_bignum(signature.data(), 32);
  auto s = make_bignum(signature.data() + 32, 32);
  if (!r || !s || BN_is_zero(r.get()) || BN_is_zero(s.get()) ||
      BN_cmp(r.get(), order) >= 0 || BN_cmp(s.get(), order) >= 0) {
    return std::nullopt;
  }

  auto x = bignum_ptr{BN_dup(r.get()), BN_free};
  if (!x) {
    return std::nullopt;
  }
  if ((recovery_id & 2u) != 0) {
    auto field = bignum_ptr{BN_new(), BN_free};
    if (!field ||
        EC_GROUP_get_curve(group.get(), field.get(), nullptr, nullptr,
                           ctx.get()) != 1 ||
        BN_add(x.get(), x.get(), order) != 1 ||
        BN_cmp(x.get(), field.get()) >= 0) {
      return std::nullopt;
    }
  }

  auto big_r = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!big_r ||
      EC_POINT_set_compressed_coordinates(group.get(), big_r.get(), x.get(),
                                          recovery_id & 1u, ctx.get()) != 1) {
    return std::nullopt;
  }

  // Q = r^-1 (s R - e G) = (-e r^-1) G + (s r^-1) R
  auto e = make_bignum(digest.data(), digest.size());
  auto r_inverse = bignum_ptr{
      BN_mod_inverse(nullptr, r.get(), order, ctx.get()), BN_free};
  auto zero = bignum_ptr{BN_new(), BN_free};
  auto product = bignum_ptr{BN_new(), BN_free};
  auto u1 = bignum_ptr{BN_new(), BN_free};
  auto u2 = bignum_ptr{BN_new(), BN_free};
  if (!e || !r_inverse || !zero || !product || !u1 || !u2) {
    return std::nullopt;
  }
  BN_zero(zero.get());
  if (BN_mod_mul(product.get(), e.get(), r_inverse.get(), order, ctx.get()) !=
          1 ||
      BN_mod_sub(u1.get(), zero.get(), product.get(), order, ctx.get()) != 1 ||
      BN_mod_mul(u2.get(), s.get(), r_inverse.get(), order, ctx.get()) != 1) {
    return std::nullopt;
  }

  auto q = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!q || EC_POINT_mul(group.get(), q.get(), u1.get(), big_r.get(),
                         u2.get(), ctx.get()) != 1) {
    return std::nullopt;
  }
  if (EC_POINT_is_at_infinity(group.get(), q.get()) == 1) {
    return std::nullopt;
  }
  return encode_point(group.get(), q.get(), ctx.get());
}

std::optional<glyphvault::schema::address_t> recover_address(
    const glyphvault::schema::hash32_t& digest,
    const recoverable_signature_t& signature) {
  auto public_key = recover_public_key(digest, signature);
  if (!public_key.has_value()) {
    return std::nullopt;
  }
  return address_from_public_key(*public_key);
}

glyphvault::schema::address_t address_from_public_key(
    const public_key_t& public_key) {
  auto hash = keccak256(
      glyphvault::schema::bytes_view_t{public_key.data() + 1,
                                       public_key.size() - 1});
  auto address = glyphvault::schema::address_t{};
  std::copy(hash.end() - address.size(), hash.end(), address.begin());
  return address;
}

std::string to_checksum_address(const glyphvault::schema::address_t& address) {
  auto lower = glyphvault::schema::to_hex(address);
  auto hash = keccak256(std::string_view{lower});
  for (std::size_t i = 0; i < lower.size(); ++i) {
    auto nibble = (i % 2 == 0) ? (hash[i / 2] >> 4u) : (hash[i / 2] & 0x0Fu);
    if (std::isalpha(static_cast<unsigned char>(lower[i])) != 0 &&
        nibble >= 8) {
      lower[i] = static_cast<char>(
          std::toupper(static_cast<unsigned char>(lower[i])));
    }
  }
  return "0x" + lower;
}

std::optional<glyphvault::schema::address_t> try_parse_address(
    const std::string_view text) {
  if (!text.starts_with("0x") && !text.starts_with("0X")) {
    return std::nullopt;
  }
  auto decoded = glyphvault::schema::try_from_hex(text);
  if (!decoded || decoded->size() != 20) {
    return std::nullopt;
  }
  auto address = glyphvault::schema::address_t{};
  std::copy(decoded->begin(), decoded->end(), address.begin());
  return address;
}

glyphvault::schema::hash32_t personal_message_digest(
    const std::string_view message) {
  auto prefixed = std::string{"\x19"
                              "Ethereum Signed Message:\n"};
  prefixed += std::to_string(message.size());
  prefixed.append(message.data(), message.size());
  return keccak256(std::string_view{prefixed});
}

}  // namespace glyphvault::crypto
