// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace tally::rpc::json_rpc::method {

// Constants defined here have a different naming from our standard: k_<JSON_RPC_API>
// where <JSON_RPC_API> is *exactly* the JSON RPC API method
inline constexpr const char* k_eth_getBlockByNumber{"eth_getBlockByNumber"};

}  // namespace tally::rpc::json_rpc::method
