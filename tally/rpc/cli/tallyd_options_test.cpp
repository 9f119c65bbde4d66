// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "tallyd_options.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <tally/infra/common/environment.hpp>

namespace tally::cmd::common {

using namespace std::chrono_literals;

//! Restore an empty RPC_URL whatever the test outcome
struct RpcUrlEnvironmentGuard {
    ~RpcUrlEnvironmentGuard() { Environment::set_rpc_url(""); }
};

TEST_CASE("add_tallyd_options", "[rpc][cli]") {
    RpcUrlEnvironmentGuard env_guard;
    rpc::ServiceSettings settings;
    CLI::App cli;

    SECTION("defaults") {
        Environment::set_rpc_url("");
        add_tallyd_options(cli, settings);
        cli.parse("", /*program_name_included=*/false);
        CHECK(settings.http_end_point == "0.0.0.0:8000");
        CHECK(settings.rpc_url == "https://ethereum.publicnode.com");
        CHECK(settings.rpc_timeout == 10s);
        CHECK(settings.cors_domain.empty());
    }

    SECTION("environment overrides default RPC URL") {
        Environment::set_rpc_url("https://rpc.example.org/v1");
        add_tallyd_options(cli, settings);
        cli.parse("", /*program_name_included=*/false);
        CHECK(settings.rpc_url == "https://rpc.example.org/v1");
    }

    SECTION("command line overrides environment") {
        Environment::set_rpc_url("https://rpc.example.org/v1");
        add_tallyd_options(cli, settings);
        cli.parse("--rpc.url http://127.0.0.1:8545 --rpc.timeout 2500 --http.addr 127.0.0.1:9000 --http.cors.domain a.org,b.org",
                  /*program_name_included=*/false);
        CHECK(settings.rpc_url == "http://127.0.0.1:8545");
        CHECK(settings.rpc_timeout == 2500ms);
        CHECK(settings.http_end_point == "127.0.0.1:9000");
        CHECK(settings.cors_domain == std::vector<std::string>{"a.org", "b.org"});
    }

    SECTION("invalid values rejected") {
        Environment::set_rpc_url("");
        add_tallyd_options(cli, settings);
        CHECK_THROWS_AS(cli.parse("--rpc.url ftp://host", false), CLI::ValidationError);
        CHECK_THROWS_AS(cli.parse("--rpc.timeout 0", false), CLI::ValidationError);
    }
}

}  // namespace tally::cmd::common
