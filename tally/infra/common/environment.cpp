// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "environment.hpp"

#include <boost/process/environment.hpp>

namespace tally {

static constexpr const char* kRpcUrlVar{"RPC_URL"};

std::optional<std::string> Environment::get_rpc_url() {
    std::optional<std::string> rpc_url;
    auto environment = boost::this_process::environment();
    auto env_var = environment[kRpcUrlVar];
    if (!env_var.empty()) {
        rpc_url = env_var.to_string();
    }
    return rpc_url;
}

void Environment::set_rpc_url(std::string_view url) {
    auto environment = boost::this_process::environment();
    environment[kRpcUrlVar] = std::string{url};
}

}  // namespace tally
