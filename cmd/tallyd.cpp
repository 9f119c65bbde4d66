// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <CLI/CLI.hpp>

#include <tally/infra/cli/common.hpp>
#include <tally/rpc/cli/tallyd_options.hpp>
#include <tally/rpc/daemon.hpp>

using namespace tally;
using namespace tally::cmd::common;
using namespace tally::rpc;

int main(int argc, char* argv[]) {
    CLI::App cli{"Tallyd - Ethereum block summary HTTP service"};

    ServiceSettings settings;

    try {
        // Parse and validate program arguments
        add_logging_options(cli, settings.log_settings);
        add_context_pool_options(cli, settings.context_pool_settings);
        add_tallyd_options(cli, settings);
        cli.parse(argc, argv);

        return Daemon::run(settings);
    } catch (const CLI::ParseError& pe) {
        return cli.exit(pe);
    }
}
