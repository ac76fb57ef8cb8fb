#include <glyphvault/chain/json_rpc.hpp>
#include <glyphvault/schema/json.hpp>
#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace {

// Transport answering every request through a callback.
class scripted_transport final : public glyphvault::chain::json_rpc_transport {
 public:
  explicit scripted_transport(
      std::function<std::string(const Json::Value&)> handler)
      : handler_(std::move(handler)) {}

  std::string post(const std::string& body) override {
    auto request = glyphvault::schema::try_parse_json(body);
    if (!request.has_value()) {
      throw glyphvault::chain::transport_error("unparseable request");
    }
    last_request = *request;
    return handler_(*request);
  }

  Json::Value last_request;

 private:
  std::function<std::string(const Json::Value&)> handler_;
};

std::string respond(const Json::Value& request, const Json::Value& result) {
  auto response = Json::Value{Json::objectValue};
  response["jsonrpc"] = "2.0";
  response["id"] = request["id"];
  response["result"] = result;
  return glyphvault::schema::write_canonical_json(response);
}

}  // namespace

TEST(json_rpc, quantities_are_minimal_hex) {
  EXPECT_EQ(glyphvault::chain::to_quantity(0), "0x0");
  EXPECT_EQ(glyphvault::chain::to_quantity(1024), "0x400");
  EXPECT_EQ(glyphvault::chain::to_quantity(UINT64_MAX), "0xffffffffffffffff");
}

TEST(json_rpc, parse_quantity_accepts_hex_strings_only) {
  using glyphvault::chain::parse_quantity;
  EXPECT_EQ(parse_quantity(Json::Value{"0x0"}), 0u);
  EXPECT_EQ(parse_quantity(Json::Value{"0x400"}), 1024u);
  EXPECT_EQ(parse_quantity(Json::Value{"0xFF"}), 255u);
  EXPECT_EQ(parse_quantity(Json::Value{"0xffffffffffffffff"}), UINT64_MAX);

  EXPECT_FALSE(parse_quantity(Json::Value{"0x"}).has_value());
  EXPECT_FALSE(parse_quantity(Json::Value{"400"}).has_value());
  EXPECT_FALSE(parse_quantity(Json::Value{"0xg1"}).has_value());
  EXPECT_FALSE(parse_quantity(Json::Value{"0x10000000000000000"}).has_value());
  EXPECT_FALSE(parse_quantity(Json::Value{5}).has_value());
  EXPECT_FALSE(parse_quantity(Json::Value{Json::nullValue}).has_value());
}

TEST(json_rpc, call_wraps_request_and_returns_result) {
  auto transport = std::make_shared<scripted_transport>(
      [](const Json::Value& request) {
        return respond(request, Json::Value{"0x539"});
      });
  auto client = glyphvault::chain::json_rpc_client{transport};

  auto params = Json::Value{Json::arrayValue};
  params.append("latest");
  auto result = client.call("eth_chainId", params);
  EXPECT_EQ(result.asString(), "0x539");

  EXPECT_EQ(transport->last_request["jsonrpc"].asString(), "2.0");
  EXPECT_EQ(transport->last_request["method"].asString(), "eth_chainId");
  EXPECT_EQ(transport->last_request["params"][0].asString(), "latest");
  auto first_id = transport->last_request["id"].asUInt64();

  client.call("eth_chainId", Json::Value{Json::arrayValue});
  EXPECT_GT(transport->last_request["id"].asUInt64(), first_id);
}

TEST(json_rpc, null_result_is_returned_as_null) {
  auto transport = std::make_shared<scripted_transport>(
      [](const Json::Value& request) {
        return respond(request, Json::Value{Json::nullValue});
      });
  auto client = glyphvault::chain::json_rpc_client{transport};
  EXPECT_TRUE(client.call("eth_getTransactionReceipt",
                          Json::Value{Json::arrayValue})
                  .isNull());
}

TEST(json_rpc, error_object_raises_rpc_error_with_code) {
  auto transport =
      std::make_shared<scripted_transport>([](const Json::Value& request) {
        auto response = Json::Value{Json::objectValue};
        response["jsonrpc"] = "2.0";
        response["id"] = request["id"];
        response["error"]["code"] = -32000;
        response["error"]["message"] = "nonce too low";
        return glyphvault::schema::write_canonical_json(response);
      });
  auto client = glyphvault::chain::json_rpc_client{transport};
  try {
    client.call("eth_sendRawTransaction", Json::Value{Json::arrayValue});
    FAIL() << "expected rpc_error";
  } catch (const glyphvault::chain::rpc_error& e) {
    EXPECT_EQ(e.code(), -32000);
    EXPECT_STREQ(e.what(), "nonce too low");
  }
}

TEST(json_rpc, malformed_responses_raise_transport_error) {
  auto garbage = std::make_shared<scripted_transport>(
      [](const Json::Value&) { return std::string{"<html>bad gateway"}; });
  auto client = glyphvault::chain::json_rpc_client{garbage};
  EXPECT_THROW(client.call("eth_chainId", Json::Value{Json::arrayValue}),
               glyphvault::chain::transport_error);

  auto no_result = std::make_shared<scripted_transport>(
      [](const Json::Value& request) {
        auto response = Json::Value{Json::objectValue};
        response["jsonrpc"] = "2.0";
        response["id"] = request["id"];
        return glyphvault::schema::write_canonical_json(response);
      });
  auto other = glyphvault::chain::json_rpc_client{no_result};
  EXPECT_THROW(other.call("eth_chainId", Json::Value{Json::arrayValue}),
               glyphvault::chain::transport_error);
}
