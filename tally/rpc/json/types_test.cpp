// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <limits>

#include <catch2/catch_test_macros.hpp>

namespace tally::rpc {

TEST_CASE("convert uint64 to quantity", "[rpc][to_quantity]") {
    CHECK(to_quantity(0) == "0x0");
    CHECK(to_quantity(1) == "0x1");
    CHECK(to_quantity(100) == "0x64");
    CHECK(to_quantity(255) == "0xff");
    CHECK(to_quantity(21000000) == "0x1406f40");
    CHECK(to_quantity(std::numeric_limits<uint64_t>::max()) == "0xffffffffffffffff");
}

TEST_CASE("parse quantity", "[rpc][from_quantity]") {
    CHECK(from_quantity("0x0") == 0u);
    CHECK(from_quantity("0x1406f40") == 21000000u);
    CHECK(from_quantity("0XFF") == 255u);
    CHECK(from_quantity("ff") == 255u);
    CHECK(from_quantity("0xffffffffffffffff") == std::numeric_limits<uint64_t>::max());

    SECTION("malformed quantities") {
        CHECK(!from_quantity(""));
        CHECK(!from_quantity("0x"));
        CHECK(!from_quantity("0xzz"));
        CHECK(!from_quantity("0x12g"));
        CHECK(!from_quantity("-0x1"));
        CHECK(!from_quantity("0x10000000000000000"));
    }
}

TEST_CASE("make_json_request", "[rpc][to_json]") {
    const auto request = make_json_request(1, "eth_getBlockByNumber", nlohmann::json::array({"latest", true}));
    CHECK(request == R"({"jsonrpc":"2.0","id":1,"method":"eth_getBlockByNumber","params":["latest",true]})"_json);
}

TEST_CASE("make_json_detail", "[rpc][to_json]") {
    CHECK(make_json_detail("Block number cannot be negative") == R"({"detail":"Block number cannot be negative"})"_json);
}

TEST_CASE("deserialize block", "[rpc][from_json]") {
    SECTION("full transactions") {
        const auto json = R"({
            "number": "0x1406f40",
            "hash": "0xabc",
            "transactions": [
                {"from": "0xa", "to": "0xb"},
                {"from": "0xa", "to": null},
                {"from": "0xc"}
            ]
        })"_json;
        const auto block = json.get<Block>();
        CHECK(block.number == "0x1406f40");
        CHECK(block.hash == "0xabc");
        REQUIRE(block.transactions.size() == 3);
        CHECK(block.transactions[0].from == "0xa");
        CHECK(block.transactions[0].to == "0xb");
        CHECK(!block.transactions[1].to);
        CHECK(!block.transactions[2].to);
    }

    SECTION("missing fields") {
        const auto block = R"({})"_json.get<Block>();
        CHECK(!block.number);
        CHECK(!block.hash);
        CHECK(block.transactions.empty());
    }

    SECTION("malformed transaction entries") {
        const auto block = R"({"transactions": ["0xdeadbeef", {"from": 12, "to": ["0xb"]}]})"_json.get<Block>();
        REQUIRE(block.transactions.size() == 2);
        CHECK(!block.transactions[0].from);
        CHECK(!block.transactions[0].to);
        CHECK(!block.transactions[1].from);
        CHECK(!block.transactions[1].to);
    }

    SECTION("transactions not an array") {
        const auto block = R"({"number": "0x1", "transactions": "oops"})"_json.get<Block>();
        CHECK(block.number == "0x1");
        CHECK(block.transactions.empty());
    }
}

TEST_CASE("serialize block summary", "[rpc][to_json]") {
    SECTION("populated") {
        BlockSummary summary{
            .block_number = 21000000,
            .block_hash = "0xabc",
            .total_transactions = 3,
            .by_sender = {{"A", 2}, {"C", 1}},
            .by_receiver = {{"B", 2}, {"null", 1}},
        };
        CHECK(nlohmann::json(summary) == R"({
            "block_number": 21000000,
            "block_hash": "0xabc",
            "total_transactions": 3,
            "by_sender": {"A": 2, "C": 1},
            "by_receiver": {"B": 2, "null": 1}
        })"_json);
    }

    SECTION("empty") {
        CHECK(nlohmann::json(BlockSummary{}) == R"({
            "block_number": null,
            "block_hash": null,
            "total_transactions": 0,
            "by_sender": {},
            "by_receiver": {}
        })"_json);
    }
}

}  // namespace tally::rpc
