// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <tally/infra/common/log.hpp>
#include <tally/infra/concurrency/context_pool_settings.hpp>

namespace tally::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up context pool options
void add_context_pool_options(CLI::App& cli, concurrency::ContextPoolSettings& settings);

}  // namespace tally::cmd::common
