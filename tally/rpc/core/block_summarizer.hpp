// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <tally/rpc/types/block.hpp>
#include <tally/rpc/types/block_summary.hpp>

namespace tally::rpc::core {

//! Reduce the block to transaction count plus per-address sender and receiver tallies.
//! Transactions without sender are left out of by_sender, those without receiver are
//! tallied under kContractCreationReceiver. An unparsable block number yields no number.
BlockSummary summarize(const Block& block);

}  // namespace tally::rpc::core
