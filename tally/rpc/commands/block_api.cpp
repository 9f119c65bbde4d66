// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_api.hpp"

#include <exception>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>
#include <nlohmann/json.hpp>

#include <tally/infra/common/log.hpp>
#include <tally/rpc/core/block_summarizer.hpp>
#include <tally/rpc/core/blocks.hpp>
#include <tally/rpc/http/query_string.hpp>
#include <tally/rpc/json/types.hpp>

namespace tally::rpc::commands {

namespace beast = boost::beast;

static constexpr std::string_view kRootPath{"/"};
static constexpr std::string_view kBlockPath{"/block"};
static constexpr std::string_view kNumberParam{"number"};

//! Messages may echo caller input, so invalid UTF-8 is replaced rather than thrown on
static http::Reply make_detail_reply(beast::http::status status, std::string_view message) {
    return http::Reply{status, make_json_detail(message).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)};
}

static http::Reply make_error_reply(const Error& error) {
    const auto status = static_cast<beast::http::status>(to_http_status(error.kind));
    return make_detail_reply(status, error.message);
}

Result<std::optional<int64_t>> parse_block_number(const std::optional<std::string>& number) {
    if (!number) {
        return std::nullopt;
    }
    int64_t block_num{0};
    if (number->empty() || !absl::SimpleAtoi(*number, &block_num)) {
        return make_error(ErrorKind::kInvalidArgument, absl::StrCat("Invalid block number: ", *number));
    }
    return block_num;
}

Task<http::Reply> BlockApi::handle(const http::Request& request) {
    const auto [path, query] = http::split_target(request.target);
    if (path != kRootPath && path != kBlockPath) {
        co_return make_detail_reply(beast::http::status::not_found, "Not Found");
    }
    if (request.method != beast::http::verb::get && request.method != beast::http::verb::head) {
        co_return make_detail_reply(beast::http::status::method_not_allowed, "Method Not Allowed");
    }
    if (path == kRootPath) {
        co_return http::Reply{beast::http::status::ok, std::string{kRootDescription}};
    }
    co_return co_await handle_block(query);
}

Task<http::Reply> BlockApi::handle_block(std::string_view query) {
    const auto block_num = parse_block_number(http::find_query_param(query, kNumberParam));
    if (!block_num) {
        TALLY_DEBUG << "BlockApi::handle_block rejected query: " << query << " error: " << block_num.error();
        co_return make_error_reply(block_num.error());
    }

    try {
        const auto block = co_await core::fetch_block(client_, *block_num);
        if (!block) {
            TALLY_WARN << "BlockApi::handle_block failed: " << block.error();
            co_return make_error_reply(block.error());
        }
        const auto summary = core::summarize(*block);
        co_return http::Reply{beast::http::status::ok, nlohmann::json(summary).dump()};
    } catch (const boost::system::system_error& se) {
        if (se.code() == boost::asio::error::operation_aborted) {
            throw;
        }
        TALLY_ERROR << "BlockApi::handle_block system_error: " << se.what();
    } catch (const std::exception& e) {
        TALLY_ERROR << "BlockApi::handle_block exception: " << e.what();
    }
    co_return make_detail_reply(beast::http::status::internal_server_error, "Unexpected server error");
}

}  // namespace tally::rpc::commands
