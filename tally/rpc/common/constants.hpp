// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace tally {

inline constexpr std::string_view kAddressPortSeparator{":"};

inline constexpr std::string_view kDefaultHttpEndPoint{"0.0.0.0:8000"};
inline constexpr std::string_view kDefaultRpcUrl{"https://ethereum.publicnode.com"};
inline constexpr std::chrono::milliseconds kDefaultRpcTimeout{10000};

//! Maximum size of inbound HTTP request payloads
inline constexpr std::size_t kMaxRequestSize{1 * 1024 * 1024};

//! Maximum size of JSON-RPC response payloads (full-transaction blocks can be large)
inline constexpr std::size_t kMaxRpcResponseSize{64 * 1024 * 1024};

}  // namespace tally
