// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <CLI/CLI.hpp>

namespace tally::cmd::common {

//! CLI11 validator for <ip-address>:<port> endpoints
struct IPEndpointValidator : public CLI::Validator {
    explicit IPEndpointValidator(bool allow_empty = false);
};

//! \brief Set up parsing of the specified IP:port endpoint
void add_option_ip_endpoint(CLI::App& cli, const std::string& name, std::string& address, const std::string& description);

}  // namespace tally::cmd::common
