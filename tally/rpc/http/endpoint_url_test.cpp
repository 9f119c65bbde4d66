// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "endpoint_url.hpp"

#include <catch2/catch_test_macros.hpp>

namespace tally::rpc::http {

TEST_CASE("parse_endpoint_url", "[rpc][http][endpoint_url]") {
    SECTION("https default port and target") {
        const auto url = parse_endpoint_url("https://ethereum.publicnode.com");
        REQUIRE(url);
        CHECK(url->use_tls);
        CHECK(url->host == "ethereum.publicnode.com");
        CHECK(url->port == 443);
        CHECK(url->target == "/");
        CHECK(url->to_string() == "https://ethereum.publicnode.com:443/");
    }

    SECTION("http with port and path") {
        const auto url = parse_endpoint_url("http://127.0.0.1:8545/v1/mainnet?key=abc");
        REQUIRE(url);
        CHECK(!url->use_tls);
        CHECK(url->host == "127.0.0.1");
        CHECK(url->port == 8545);
        CHECK(url->target == "/v1/mainnet?key=abc");
    }

    SECTION("query without path") {
        const auto url = parse_endpoint_url("HTTPS://node.example.org?apikey=1");
        REQUIRE(url);
        CHECK(url->target == "/?apikey=1");
    }

    SECTION("IPv6 host") {
        const auto url = parse_endpoint_url("http://[::1]:8545");
        REQUIRE(url);
        CHECK(url->host == "::1");
        CHECK(url->port == 8545);
    }

    SECTION("invalid URLs") {
        CHECK(!parse_endpoint_url(""));
        CHECK(!parse_endpoint_url("ftp://node.example.org"));
        CHECK(!parse_endpoint_url("node.example.org:8545"));
        CHECK(!parse_endpoint_url("https://"));
        CHECK(!parse_endpoint_url("https://:8545"));
        CHECK(!parse_endpoint_url("https://node.example.org:0"));
        CHECK(!parse_endpoint_url("https://node.example.org:70000"));
        CHECK(!parse_endpoint_url("https://node.example.org:port"));
        CHECK(!parse_endpoint_url("https://user:pw@node.example.org"));
        CHECK(!parse_endpoint_url("http://[::1"));
    }
}

}  // namespace tally::rpc::http
