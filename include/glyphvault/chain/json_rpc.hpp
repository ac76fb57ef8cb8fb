#pragma once

#include <json/value.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace glyphvault::chain {

/// The request never produced a JSON-RPC response (connection refused,
/// timeout, HTTP failure). Safe to retry for read calls.
class transport_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// The node answered with a JSON-RPC error object.
class rpc_error final : public std::runtime_error {
 public:
  rpc_error(int64_t code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  int64_t code() const noexcept { return code_; }

 private:
  int64_t code_;
};

/// Moves one JSON-RPC request body to the node and returns the response
/// body. Implementations throw transport_error on delivery failure.
class json_rpc_transport {
 public:
  virtual ~json_rpc_transport() = default;
  virtual std::string post(const std::string& body) = 0;
};

/// HTTP POST through libcurl with a per-request timeout.
class curl_transport final : public json_rpc_transport {
 public:
  curl_transport(std::string url, std::chrono::milliseconds timeout);

  std::string post(const std::string& body) override;

 private:
  std::string url_;
  std::chrono::milliseconds timeout_;
};

/// JSON-RPC 2.0 envelope handling on top of a transport.
class json_rpc_client final {
 public:
  explicit json_rpc_client(std::shared_ptr<json_rpc_transport> transport);

  /// Returns the `result` member. A node error object raises rpc_error; a
  /// body that is not a JSON-RPC response raises transport_error.
  Json::Value call(std::string_view method, const Json::Value& params);

 private:
  std::shared_ptr<json_rpc_transport> transport_;
  std::atomic<uint64_t> next_id_{1};
};

/// "0x"-prefixed minimal hex quantity.
std::string to_quantity(uint64_t value);

/// Parses a hex quantity string. std::nullopt for anything else, including
/// values wider than 64 bits.
std::optional<uint64_t> parse_quantity(const Json::Value& value);

}  // namespace glyphvault::chain
