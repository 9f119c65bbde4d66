// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_summarizer.hpp"

#include <tally/rpc/json/types.hpp>

namespace tally::rpc::core {

BlockSummary summarize(const Block& block) {
    BlockSummary summary;
    if (block.number) {
        summary.block_number = from_quantity(*block.number);
    }
    summary.block_hash = block.hash;
    summary.total_transactions = block.transactions.size();
    for (const auto& tx : block.transactions) {
        if (tx.from && !tx.from->empty()) {
            ++summary.by_sender[*tx.from];
        }
        ++summary.by_receiver[tx.to.value_or(kContractCreationReceiver)];
    }
    return summary;
}

}  // namespace tally::rpc::core
