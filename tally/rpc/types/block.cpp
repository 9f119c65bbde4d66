// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

namespace tally::rpc {

std::ostream& operator<<(std::ostream& out, const Block& b) {
    out << "number: " << b.number.value_or("null")
        << " hash: " << b.hash.value_or("null")
        << " #transactions: " << b.transactions.size();
    return out;
}

}  // namespace tally::rpc
