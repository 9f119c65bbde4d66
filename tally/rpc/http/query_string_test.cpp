// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "query_string.hpp"

#include <catch2/catch_test_macros.hpp>

namespace tally::rpc::http {

TEST_CASE("split_target", "[rpc][http][query_string]") {
    CHECK(split_target("/block").path == "/block");
    CHECK(split_target("/block").query.empty());
    CHECK(split_target("/block?number=1").path == "/block");
    CHECK(split_target("/block?number=1").query == "number=1");
    CHECK(split_target("/block?number=1#top").query == "number=1");
    CHECK(split_target("/?").query.empty());
}

TEST_CASE("percent_decode", "[rpc][http][query_string]") {
    CHECK(percent_decode("abc") == "abc");
    CHECK(percent_decode("%2D5") == "-5");
    CHECK(percent_decode("a+b") == "a b");
    CHECK(percent_decode("%7e%7E") == "~~");
    CHECK(percent_decode("100%") == "100%");
    CHECK(percent_decode("%zz") == "%zz");
    CHECK(percent_decode("%4") == "%4");
}

TEST_CASE("find_query_param", "[rpc][http][query_string]") {
    CHECK(find_query_param("number=21000000", "number") == "21000000");
    CHECK(find_query_param("foo=1&number=2", "number") == "2");
    CHECK(find_query_param("number=1&number=2", "number") == "2");
    CHECK(find_query_param("number=", "number") == "");
    CHECK(find_query_param("number", "number") == "");
    CHECK(find_query_param("num%62er=%2D5", "number") == "-5");
    CHECK(!find_query_param("", "number"));
    CHECK(!find_query_param("numbers=1", "number"));
}

}  // namespace tally::rpc::http
