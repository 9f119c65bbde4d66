// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "client.hpp"

#include <string>

#include <absl/strings/match.h>
#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>
#include <catch2/catch_test_macros.hpp>
#include <gmock/gmock.h>

#include <tally/infra/test_util/log.hpp>
#include <tally/infra/test_util/task_runner.hpp>
#include <tally/rpc/test_util/mock_transport.hpp>

namespace tally::rpc::json_rpc {

using testing::_;
using testing::Truly;

static bool is_get_block_request(const std::string& body) {
    return nlohmann::json::parse(body) ==
           R"({"jsonrpc":"2.0","id":1,"method":"eth_getBlockByNumber","params":["0x0",true]})"_json;
}

TEST_CASE("json_rpc::Client::call", "[rpc][json_rpc][client]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    test::TransportMock transport;
    Client client{transport};
    const auto params = nlohmann::json::array({"0x0", true});

    SECTION("result returned verbatim") {
        EXPECT_CALL(transport, post(Truly(is_get_block_request)))
            .WillOnce(test::reply_with(200, R"({"jsonrpc":"2.0","id":1,"result":{"number":"0x0"}})"));
        const auto result = runner.run(client.call("eth_getBlockByNumber", params));
        REQUIRE(result);
        CHECK(*result == R"({"number":"0x0"})"_json);
    }

    SECTION("null result") {
        EXPECT_CALL(transport, post(_)).WillOnce(test::reply_with(200, R"({"jsonrpc":"2.0","id":1,"result":null})"));
        const auto result = runner.run(client.call("eth_getBlockByNumber", params));
        REQUIRE(result);
        CHECK(result->is_null());
    }

    SECTION("absent result") {
        EXPECT_CALL(transport, post(_)).WillOnce(test::reply_with(200, R"({"jsonrpc":"2.0","id":1})"));
        const auto result = runner.run(client.call("eth_getBlockByNumber", params));
        REQUIRE(result);
        CHECK(result->is_null());
    }

    SECTION("JSON-RPC error object") {
        EXPECT_CALL(transport, post(_))
            .WillOnce(test::reply_with(200, R"({"jsonrpc":"2.0","id":1,"error":{"code":-32602,"message":"invalid argument"}})"));
        const auto result = runner.run(client.call("eth_getBlockByNumber", params));
        REQUIRE(!result);
        CHECK(result.error().kind == ErrorKind::kRpcProtocolError);
        CHECK(absl::StartsWith(result.error().message, "RPC error: "));
        CHECK(absl::StrContains(result.error().message, "invalid argument"));
    }

    SECTION("JSON-RPC error object wins over HTTP status") {
        EXPECT_CALL(transport, post(_))
            .WillOnce(test::reply_with(429, R"({"jsonrpc":"2.0","id":1,"error":{"code":-32005,"message":"rate limited"}})"));
        const auto result = runner.run(client.call("eth_getBlockByNumber", params));
        REQUIRE(!result);
        CHECK(result.error().kind == ErrorKind::kRpcProtocolError);
    }

    SECTION("non-2xx HTTP status") {
        EXPECT_CALL(transport, post(_)).WillOnce(test::reply_with(503, "Service Unavailable"));
        const auto result = runner.run(client.call("eth_getBlockByNumber", params));
        REQUIRE(!result);
        CHECK(result.error().kind == ErrorKind::kTransportError);
        CHECK(result.error().message == "Network or HTTP error while calling RPC: HTTP status 503");
    }

    SECTION("malformed JSON") {
        EXPECT_CALL(transport, post(_)).WillOnce(test::reply_with(200, "{\"result\":"));
        const auto result = runner.run(client.call("eth_getBlockByNumber", params));
        REQUIRE(!result);
        CHECK(result.error().kind == ErrorKind::kRpcProtocolError);
    }

    SECTION("JSON but not an object") {
        EXPECT_CALL(transport, post(_)).WillOnce(test::reply_with(200, "[1,2,3]"));
        const auto result = runner.run(client.call("eth_getBlockByNumber", params));
        REQUIRE(!result);
        CHECK(result.error().kind == ErrorKind::kRpcProtocolError);
    }

    SECTION("connection refused, single attempt") {
        EXPECT_CALL(transport, post(_)).Times(1).WillOnce(test::fail_with(boost::asio::error::connection_refused));
        const auto result = runner.run(client.call("eth_getBlockByNumber", params));
        REQUIRE(!result);
        CHECK(result.error().kind == ErrorKind::kTransportError);
        CHECK(absl::StartsWith(result.error().message, "Network or HTTP error while calling RPC: "));
    }

    SECTION("cancellation propagates") {
        EXPECT_CALL(transport, post(_)).WillOnce(test::fail_with(boost::asio::error::operation_aborted));
        CHECK_THROWS_AS(runner.run(client.call("eth_getBlockByNumber", params)), boost::system::system_error);
    }

    CHECK(testing::Mock::VerifyAndClearExpectations(&transport));
}

}  // namespace tally::rpc::json_rpc
