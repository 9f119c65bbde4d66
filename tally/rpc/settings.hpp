// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <tally/infra/common/log.hpp>
#include <tally/infra/concurrency/context_pool_settings.hpp>
#include <tally/rpc/common/constants.hpp>

namespace tally::rpc {

struct ServiceSettings {
    log::Settings log_settings;
    concurrency::ContextPoolSettings context_pool_settings;
    std::string http_end_point{kDefaultHttpEndPoint};
    std::string rpc_url{kDefaultRpcUrl};
    std::chrono::milliseconds rpc_timeout{kDefaultRpcTimeout};
    std::vector<std::string> cors_domain;
};

}  // namespace tally::rpc
