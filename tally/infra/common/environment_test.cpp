// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "environment.hpp"

#include <catch2/catch_test_macros.hpp>

namespace tally {

TEST_CASE("Environment", "[infra][common][environment]") {
    SECTION("set/get rpc_url") {
        Environment::set_rpc_url("https://rpc.example.org");
        REQUIRE(Environment::get_rpc_url() == "https://rpc.example.org");
        Environment::set_rpc_url("");
        CHECK(!Environment::get_rpc_url().has_value());
    }
}

}  // namespace tally
