#include <glyphvault/chain/json_rpc.hpp>
#include <glyphvault/schema/json.hpp>

#include <spdlog/spdlog.h>

#include <spdlog/fmt/fmt.h>

namespace glyphvault::chain {

json_rpc_client::json_rpc_client(std::shared_ptr<json_rpc_transport> transport)
    : transport_(std::move(transport)) {}

Json::Value json_rpc_client::call(const std::string_view method,
                                  const Json::Value& params) {
  auto request = Json::Value{Json::objectValue};
  request["jsonrpc"] = "2.0";
  request["id"] = Json::UInt64{next_id_++};
  request["method"] = std::string{method};
  request["params"] = params;

  spdlog::debug("JSON-RPC -> {}", method);
  auto body =
      transport_->post(glyphvault::schema::write_canonical_json(request));
  auto response = glyphvault::schema::try_parse_json(body);
  if (!response.has_value() || !response->isObject()) {
    throw transport_error(fmt::format("malformed JSON-RPC response to {}",
                                      method));
  }
  if (response->isMember("error") && !(*response)["error"].isNull()) {
    const auto& error = (*response)["error"];
    auto code = error["code"].isIntegral() ? error["code"].asInt64() : 0;
    auto message = error["message"].isString() ? error["message"].asString()
                                               : std::string{"unknown error"};
    throw rpc_error(code, message);
  }
  if (!response->isMember("result")) {
    throw transport_error(fmt::format("JSON-RPC response to {} has no result",
                                      method));
  }
  return (*response)["result"];
}

std::string to_quantity(const uint64_t value) {
  return fmt::format("0x{:x}", value);
}

std::optional<uint64_t> parse_quantity(const Json::Value& value) {
  if (!value.isString()) {
    return std::nullopt;
  }
  auto text = std::string_view{value.asCString()};
  if (!text.starts_with("0x") || text.size() < 3 || text.size() > 18) {
    return std::nullopt;
  }
  auto out = uint64_t{};
  for (auto c : text.substr(2)) {
    auto nibble = uint64_t{};
    if (c >= '0' && c <= '9') {
      nibble = static_cast<uint64_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      nibble = static_cast<uint64_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      nibble = static_cast<uint64_t>(c - 'A' + 10);
    } else {
      return std::nullopt;
    }
    out = (out << 4u) | nibble;
  }
  return out;
}

}  // namespace glyphvault::chain
