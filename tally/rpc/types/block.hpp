// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace tally::rpc {

//! Transaction fields relevant to address tallies, as returned by eth_getBlockByNumber with full transactions
struct Transaction {
    std::optional<std::string> from;
    std::optional<std::string> to;  // absent for contract creation
};

//! Block as returned by eth_getBlockByNumber, number kept in its hex quantity form
struct Block {
    std::optional<std::string> number;
    std::optional<std::string> hash;
    std::vector<Transaction> transactions;
};

std::ostream& operator<<(std::ostream& out, const Block& b);

}  // namespace tally::rpc
