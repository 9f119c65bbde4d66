// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "tallyd_options.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include <tally/infra/cli/ip_endpoint_option.hpp>
#include <tally/infra/common/environment.hpp>
#include <tally/rpc/http/endpoint_url.hpp>

namespace tally::cmd::common {

RpcUrlValidator::RpcUrlValidator() {
    func_ = [](const std::string& value) -> std::string {
        const auto url = rpc::http::parse_endpoint_url(value);
        if (!url) {
            return "Value " + value + " is not a valid RPC URL: " + url.error();
        }
        return {};
    };
}

void add_tallyd_options(CLI::App& cli, rpc::ServiceSettings& settings) {
    if (auto rpc_url = Environment::get_rpc_url()) {
        settings.rpc_url = std::move(*rpc_url);
    }

    add_option_ip_endpoint(cli, "--http.addr", settings.http_end_point,
                           "Block summary HTTP API local end-point as <address>:<port>");

    cli.add_option("--rpc.url", settings.rpc_url)
        ->description("Ethereum JSON RPC node URL as http[s]://<host>[:<port>][/<path>] (env: RPC_URL)")
        ->check(RpcUrlValidator())
        ->capture_default_str();

    cli.add_option_function<uint64_t>(
           "--rpc.timeout",
           [&settings](const uint64_t& timeout) { settings.rpc_timeout = std::chrono::milliseconds{timeout}; },
           "Timeout in milliseconds for each JSON RPC call, from connect to reply")
        ->check(CLI::Range(uint64_t{1}, uint64_t{600'000}))
        ->default_str(std::to_string(settings.rpc_timeout.count()));

    cli.add_option("--http.cors.domain", settings.cors_domain)
        ->description("Comma separated list of domains from which to accept cross origin requests (browser enforced)")
        ->delimiter(',')
        ->required(false);
}

}  // namespace tally::cmd::common
