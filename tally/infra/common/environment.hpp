// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tally {

//! Process environment variables understood by tallyd
class Environment {
  public:
    //! The JSON-RPC endpoint URL from RPC_URL, if set and non-empty
    static std::optional<std::string> get_rpc_url();
    static void set_rpc_url(std::string_view url);
};

}  // namespace tally
