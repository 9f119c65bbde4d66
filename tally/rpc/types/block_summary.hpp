// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <absl/container/btree_map.h>

namespace tally::rpc {

//! Receiver key used for transactions without recipient (contract creation)
inline constexpr const char* kContractCreationReceiver{"null"};

//! Address -> number of occurrences, ordered by address
using AddressTally = absl::btree_map<std::string, uint64_t>;

struct BlockSummary {
    std::optional<uint64_t> block_number;
    std::optional<std::string> block_hash;
    uint64_t total_transactions{0};
    AddressTally by_sender;
    AddressTally by_receiver;
};

}  // namespace tally::rpc
