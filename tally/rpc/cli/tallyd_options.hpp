// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <tally/rpc/settings.hpp>

namespace tally::cmd::common {

//! CLI11 validator for http[s] JSON-RPC endpoint URLs
struct RpcUrlValidator : public CLI::Validator {
    RpcUrlValidator();
};

//! \brief Set up options to populate the service settings after cli.parse()
//! \warning The RPC_URL environment variable is read here, so it overrides the default but not the CLI
void add_tallyd_options(CLI::App& cli, rpc::ServiceSettings& settings);

}  // namespace tally::cmd::common
