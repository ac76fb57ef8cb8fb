#include <glyphvault/chain/abi.hpp>
#include <glyphvault/chain/anchor_client.hpp>
#include <glyphvault/chain/rlp.hpp>
#include <glyphvault/common/error.hpp>
#include <glyphvault/crypto/digest.hpp>
#include <glyphvault/schema/json.hpp>

#include <spdlog/spdlog.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <condition_variable>
#include <mutex>

using namespace glyphvault::schema;

namespace glyphvault::chain {

namespace {

// Waits out `duration` unless stop is requested first. Returns false when
// interrupted.
bool interruptible_sleep(const std::chrono::milliseconds duration,
                         const std::stop_token& stop) {
  auto mutex = std::mutex{};
  auto cv = std::condition_variable_any{};
  auto lock = std::unique_lock{mutex};
  cv.wait_for(lock, stop, duration, [] { return false; });
  return !stop.stop_requested();
}

uint64_t require_quantity(const Json::Value& value,
                          const std::string_view what) {
  auto parsed = parse_quantity(value);
  if (!parsed.has_value()) {
    throw glyphvault::chain_error(
        fmt::format("node returned an invalid {}", what));
  }
  return *parsed;
}

bool is_duplicate_submission(const std::string_view message) {
  return message.find("already known") != std::string_view::npos ||
         message.find("known transaction") != std::string_view::npos;
}

}  // namespace

hash32_t signing_hash(const legacy_transaction& tx) {
  auto payload = rlp::encode_list({
      rlp::encode_uint(tx.nonce),
      rlp::encode_uint(tx.gas_price),
      rlp::encode_uint(tx.gas_limit),
      rlp::encode_bytes(tx.to),
      rlp::encode_uint(tx.value),
      rlp::encode_bytes(make_bytes_view(tx.data)),
      rlp::encode_uint(tx.chain_id),
      rlp::encode_uint(0),
      rlp::encode_uint(0),
  });
  return glyphvault::crypto::keccak256(make_bytes_view(payload));
}

bytes_t sign_transaction(const legacy_transaction& tx,
                         const glyphvault::crypto::signing_key& key) {
  auto signature = key.sign_digest(signing_hash(tx));
  auto v = static_cast<uint64_t>(signature[64]) + (tx.chain_id * 2) + 35;
  auto r = rlp::trim_leading_zeros(bytes_view_t{signature.data(), 32});
  auto s = rlp::trim_leading_zeros(bytes_view_t{signature.data() + 32, 32});
  return rlp::encode_list({
      rlp::encode_uint(tx.nonce),
      rlp::encode_uint(tx.gas_price),
      rlp::encode_uint(tx.gas_limit),
      rlp::encode_bytes(tx.to),
      rlp::encode_uint(tx.value),
      rlp::encode_bytes(make_bytes_view(tx.data)),
      rlp::encode_uint(v),
      rlp::encode_bytes(make_bytes_view(r)),
      rlp::encode_bytes(make_bytes_view(s)),
  });
}

anchor_client::anchor_client(anchor_client_config config,
                             std::shared_ptr<json_rpc_transport> transport)
    : config_(std::move(config)), rpc_(std::move(transport)) {}

void anchor_client::require_contract() const {
  if (!config_.contract.has_value()) {
    throw glyphvault::configuration_error(
        "anchoring contract address is not configured");
  }
}

Json::Value anchor_client::call_with_retry(const std::string_view method,
                                           const Json::Value& params,
                                           std::stop_token stop) {
  auto delay = config_.retry_backoff;
  for (auto attempt = uint32_t{0};; ++attempt) {
    try {
      return rpc_.call(method, params);
    } catch (const transport_error& e) {
      if (attempt >= config_.max_retries) {
        throw glyphvault::chain_error(fmt::format(
            "{} failed after {} attempts: {}", method, attempt + 1, e.what()));
      }
      spdlog::warn("{} failed ({}), retrying in {} ms", method, e.what(),
                   delay.count());
    }
    if (!interruptible_sleep(delay, stop)) {
      throw glyphvault::chain_error("anchoring cancelled");
    }
    delay *= 2;
  }
}

Json::Value anchor_client::read(const std::string_view method,
                                const Json::Value& params,
                                std::stop_token stop) {
  try {
    return call_with_retry(method, params, std::move(stop));
  } catch (const rpc_error& e) {
    throw glyphvault::chain_error(
        fmt::format("{} rejected by node: {}", method, e.what()));
  }
}

bytes_t anchor_client::eth_call(const bytes_t& data, std::stop_token stop) {
  auto call = Json::Value{Json::objectValue};
  call["to"] = to_prefixed_hex(*config_.contract);
  call["data"] = to_prefixed_hex(data);
  auto params = Json::Value{Json::arrayValue};
  params.append(call);
  params.append("latest");

  auto result = read("eth_call", params, std::move(stop));
  auto decoded = result.isString() ? try_from_hex(result.asString())
                                   : std::optional<bytes_t>{};
  if (!decoded.has_value()) {
    throw glyphvault::chain_error("eth_call returned malformed data");
  }
  return *decoded;
}

glyphvault::schema::anchor_state anchor_client::is_anchored(
    const hash32_t& root,
    std::stop_token stop) {
  require_contract();
  auto anchored = abi::decode_bool(make_bytes_view(
      eth_call(abi::encode_call(abi::kIsAnchoredSignature, root), stop)));
  if (!anchored.has_value()) {
    throw glyphvault::chain_error("isAnchored returned a non-boolean value");
  }
  if (!*anchored) {
    return {};
  }
  auto timestamp = abi::decode_uint64(make_bytes_view(
      eth_call(abi::encode_call(abi::kAnchorsSignature, root), stop)));
  if (!timestamp.has_value()) {
    throw glyphvault::chain_error("anchors returned an invalid timestamp");
  }
  return glyphvault::schema::anchor_state{.anchored = true,
                                          .timestamp = *timestamp};
}

std::string anchor_client::submit(const bytes_t& raw, std::stop_token stop) {
  auto local_hash = to_prefixed_hex(
      glyphvault::crypto::keccak256(make_bytes_view(raw)));
  auto params = Json::Value{Json::arrayValue};
  params.append(to_prefixed_hex(raw));
  try {
    auto result = call_with_retry("eth_sendRawTransaction", params,
                                  std::move(stop));
    if (!result.isString()) {
      throw glyphvault::chain_error(
          "eth_sendRawTransaction returned no transaction hash", local_hash);
    }
    if (result.asString() != local_hash) {
      spdlog::warn("Node reported transaction hash {} (computed {})",
                   result.asString(), local_hash);
    }
    return result.asString();
  } catch (const rpc_error& e) {
    if (is_duplicate_submission(e.what())) {
      spdlog::info("Transaction {} was already known to the node", local_hash);
      return local_hash;
    }
    throw glyphvault::chain_error(
        fmt::format("eth_sendRawTransaction rejected: {}", e.what()),
        local_hash);
  } catch (const glyphvault::chain_error& e) {
    if (!e.tx_hash().empty()) {
      throw;
    }
    throw glyphvault::chain_error(e.what(), local_hash);
  }
}

Json::Value anchor_client::wait_for_receipt(const std::string& tx_hash,
                                            std::stop_token stop) {
  const auto deadline =
      std::chrono::steady_clock::now() + config_.confirmation_timeout;
  auto params = Json::Value{Json::arrayValue};
  params.append(tx_hash);
  try {
    while (true) {
      if (stop.stop_requested()) {
        throw glyphvault::chain_error(
            "anchoring cancelled while awaiting confirmation", tx_hash);
      }
      auto receipt = read("eth_getTransactionReceipt", params, stop);
      if (!receipt.isNull()) {
        return receipt;
      }
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        throw glyphvault::chain_error(
            fmt::format("no receipt within {} ms",
                        config_.confirmation_timeout.count()),
            tx_hash);
      }
      auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
      auto wait = std::min(config_.poll_interval, remaining);
      if (!interruptible_sleep(wait, stop)) {
        throw glyphvault::chain_error(
            "anchoring cancelled while awaiting confirmation", tx_hash);
      }
    }
  } catch (const glyphvault::chain_error& e) {
    if (!e.tx_hash().empty()) {
      throw;
    }
    throw glyphvault::chain_error(e.what(), tx_hash);
  }
}

anchor_result_t anchor_client::anchor(const std::vector<glyph_id_t>& ids,
                                      std::stop_token stop) {
  if (!config_.signer.has_value()) {
    throw glyphvault::configuration_error(
        "anchoring requires a signing key; none is configured");
  }
  require_contract();

  auto tree = glyphvault::merkle::tree{ids};
  auto result = anchor_result_t{};
  result.root = tree.root();
  result.glyph_count = ids.size();
  auto root_text = to_prefixed_hex(result.root);

  auto state = is_anchored(result.root, stop);
  if (state.anchored) {
    spdlog::info("Root {} already anchored at {}", root_text, state.timestamp);
    result.status = anchor_status::already_anchored;
    return result;
  }

  auto from = Json::Value{Json::arrayValue};
  from.append(config_.signer->address_text());
  from.append("pending");

  auto tx = legacy_transaction{};
  tx.nonce = require_quantity(read("eth_getTransactionCount", from, stop),
                              "transaction count");
  tx.gas_price = config_.gas_price.has_value()
                     ? *config_.gas_price
                     : require_quantity(read("eth_gasPrice",
                                             Json::Value{Json::arrayValue},
                                             stop),
                                        "gas price");
  tx.gas_limit = config_.gas_limit;
  tx.to = *config_.contract;
  tx.data = abi::encode_call(abi::kAnchorSignature, result.root);
  tx.chain_id = config_.chain_id.has_value()
                    ? *config_.chain_id
                    : require_quantity(read("eth_chainId",
                                            Json::Value{Json::arrayValue},
                                            stop),
                                       "chain id");

  auto raw = sign_transaction(tx, *config_.signer);
  auto tx_hash = submit(raw, stop);
  spdlog::info("Submitted anchor transaction {} for root {} ({} glyphs)",
               tx_hash, root_text, result.glyph_count);

  auto receipt = wait_for_receipt(tx_hash, stop);
  auto status = parse_quantity(receipt["status"]);
  if (!status.has_value() || *status != 1) {
    spdlog::error("Anchor transaction {} reverted", tx_hash);
    throw glyphvault::chain_error("anchor transaction reverted", tx_hash,
                                  write_canonical_json(receipt));
  }

  result.status = anchor_status::confirmed;
  result.tx_hash = tx_hash;
  result.block_number = parse_quantity(receipt["blockNumber"]).value_or(0);
  result.gas_used = parse_quantity(receipt["gasUsed"]).value_or(0);
  spdlog::info("Anchored root {} in block {} (gas used {})", root_text,
               result.block_number, result.gas_used);
  return result;
}

bool anchor_client::verify_proof(const hash32_t& root,
                                 const glyph_id_t& id,
                                 const glyphvault::merkle::proof_t& proof) {
  return glyphvault::merkle::verify(root, id, proof);
}

std::unique_ptr<anchor_client> make_http_anchor_client(
    anchor_client_config config) {
  if (config.rpc_url.empty()) {
    throw glyphvault::configuration_error("no RPC endpoint configured");
  }
  auto transport = std::make_shared<curl_transport>(config.rpc_url,
                                                    config.request_timeout);
  return std::make_unique<anchor_client>(std::move(config),
                                         std::move(transport));
}

}  // namespace glyphvault::chain
