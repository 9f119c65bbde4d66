// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <tally/infra/concurrency/task.hpp>

#include <tally/rpc/json_rpc/client.hpp>
#include <tally/rpc/types/block.hpp>
#include <tally/rpc/types/error.hpp>

namespace tally::rpc::core {

inline constexpr const char* kLatestBlockId{"latest"};

//! Wire identifier of the block: "latest" when absent, hex quantity otherwise
//! \return InvalidArgument for negative block numbers
Result<std::string> to_block_id(std::optional<int64_t> block_num);

//! Retrieve the block with full transaction objects
//! \return InvalidArgument before any network call for negative block numbers
//! \return NotFound when the node has no such block
Task<Result<Block>> fetch_block(json_rpc::Client& client, std::optional<int64_t> block_num);

}  // namespace tally::rpc::core
