#pragma once

#include <glyphvault/chain/json_rpc.hpp>
#include <glyphvault/crypto/secp256k1.hpp>
#include <glyphvault/merkle/tree.hpp>
#include <glyphvault/schema/anchor_result.hpp>
#include <glyphvault/schema/primitives.hpp>
#include <json/value.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace glyphvault::chain {

inline constexpr auto kDefaultGasLimit = uint64_t{200000};

struct anchor_client_config final {
  std::string rpc_url;
  std::optional<glyphvault::schema::address_t> contract;
  std::optional<glyphvault::crypto::signing_key> signer;
  /// Taken from eth_chainId when unset.
  std::optional<uint64_t> chain_id;
  /// Taken from eth_gasPrice when unset.
  std::optional<uint64_t> gas_price;
  uint64_t gas_limit{kDefaultGasLimit};
  std::chrono::milliseconds request_timeout{std::chrono::seconds{15}};
  std::chrono::milliseconds confirmation_timeout{std::chrono::seconds{120}};
  std::chrono::milliseconds poll_interval{std::chrono::seconds{2}};
  uint32_t max_retries{3};
  std::chrono::milliseconds retry_backoff{std::chrono::milliseconds{500}};
};

/// Unsigned EIP-155 legacy transaction.
struct legacy_transaction final {
  uint64_t nonce{};
  uint64_t gas_price{};
  uint64_t gas_limit{};
  glyphvault::schema::address_t to{};
  uint64_t value{};
  glyphvault::schema::bytes_t data;
  uint64_t chain_id{};
};

/// keccak256 of the EIP-155 signing payload
/// rlp([nonce, gasPrice, gas, to, value, data, chainId, 0, 0]).
glyphvault::schema::hash32_t signing_hash(const legacy_transaction& tx);

/// rlp([nonce, gasPrice, gas, to, value, data, v, r, s]) with
/// v = recovery_id + 2 * chainId + 35.
glyphvault::schema::bytes_t sign_transaction(
    const legacy_transaction& tx,
    const glyphvault::crypto::signing_key& key);

/// Submits Merkle roots to the anchoring contract and reads anchor state.
/// Anchoring is idempotent: a root that is already on chain is reported as
/// such and no transaction is sent.
class anchor_client final {
 public:
  anchor_client(anchor_client_config config,
                std::shared_ptr<json_rpc_transport> transport);

  /// Throws configuration_error when the signing key or contract is
  /// missing (before any RPC), std::invalid_argument for an empty id list
  /// and chain_error for submission failure, revert, timeout or
  /// cancellation.
  glyphvault::schema::anchor_result_t anchor(
      const std::vector<glyphvault::schema::glyph_id_t>& ids,
      std::stop_token stop = {});

  /// Throws configuration_error without a contract address and chain_error
  /// when the node cannot be reached.
  glyphvault::schema::anchor_state is_anchored(
      const glyphvault::schema::hash32_t& root,
      std::stop_token stop = {});

  /// Offline check, no RPC.
  static bool verify_proof(const glyphvault::schema::hash32_t& root,
                           const glyphvault::schema::glyph_id_t& id,
                           const glyphvault::merkle::proof_t& proof);

  const anchor_client_config& config() const noexcept { return config_; }

 private:
  Json::Value call_with_retry(std::string_view method,
                              const Json::Value& params,
                              std::stop_token stop);
  Json::Value read(std::string_view method,
                   const Json::Value& params,
                   std::stop_token stop);
  glyphvault::schema::bytes_t eth_call(const glyphvault::schema::bytes_t& data,
                                       std::stop_token stop);
  std::string submit(const glyphvault::schema::bytes_t& raw,
                     std::stop_token stop);
  Json::Value wait_for_receipt(const std::string& tx_hash,
                               std::stop_token stop);
  void require_contract() const;

  anchor_client_config config_;
  json_rpc_client rpc_;
};

/// Client over HTTP JSON-RPC at config.rpc_url. Throws configuration_error
/// when no endpoint is configured.
std::unique_ptr<anchor_client> make_http_anchor_client(
    anchor_client_config config);

}  // namespace glyphvault::chain
