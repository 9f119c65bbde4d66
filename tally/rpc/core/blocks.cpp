// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "blocks.hpp"

#include <utility>

#include <absl/strings/str_cat.h>

#include <tally/infra/common/log.hpp>
#include <tally/rpc/json/types.hpp>
#include <tally/rpc/json_rpc/methods.hpp>

namespace tally::rpc::core {

Result<std::string> to_block_id(std::optional<int64_t> block_num) {
    if (!block_num) {
        return kLatestBlockId;
    }
    if (*block_num < 0) {
        return make_error(ErrorKind::kInvalidArgument, "Block number cannot be negative");
    }
    return to_quantity(static_cast<uint64_t>(*block_num));
}

Task<Result<Block>> fetch_block(json_rpc::Client& client, std::optional<int64_t> block_num) {
    const auto block_id = to_block_id(block_num);
    if (!block_id) {
        co_return tl::unexpected{block_id.error()};
    }

    auto result = co_await client.call(json_rpc::method::k_eth_getBlockByNumber, nlohmann::json::array({*block_id, true}));
    if (!result) {
        co_return tl::unexpected{std::move(result.error())};
    }
    if (result->is_null()) {
        TALLY_DEBUG << "fetch_block no block found for " << *block_id;
        co_return make_error(ErrorKind::kNotFound, absl::StrCat("No block found for ", *block_id));
    }
    if (!result->is_object()) {
        co_return make_error(ErrorKind::kRpcProtocolError,
                             absl::StrCat("Unexpected ", json_rpc::method::k_eth_getBlockByNumber, " result: ", result->dump()));
    }

    auto block = result->get<Block>();
    TALLY_DEBUG << "fetch_block block_id: " << *block_id << " " << block;
    co_return block;
}

}  // namespace tally::rpc::core
