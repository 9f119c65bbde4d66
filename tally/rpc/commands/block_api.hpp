// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <tally/infra/concurrency/task.hpp>

#include <tally/rpc/http/request_handler.hpp>
#include <tally/rpc/http/transport.hpp>
#include <tally/rpc/json_rpc/client.hpp>
#include <tally/rpc/types/error.hpp>

namespace tally::rpc::commands {

//! Capability description served on the root route
inline constexpr std::string_view kRootDescription{
    R"({"message":"Ethereum block summary API","endpoints":{"/block":{"method":"GET",)"
    R"("query_params":{"number":"optional integer block number; if omitted, uses 'latest'"},)"
    R"("examples":["/block","/block?number=21000000"]}}})"};

//! Value of the number query parameter: absent stays absent, anything but a decimal integer is rejected
Result<std::optional<int64_t>> parse_block_number(const std::optional<std::string>& number);

//! HTTP handler for the root and /block routes
class BlockApi : public http::RequestHandler {
  public:
    explicit BlockApi(http::Transport& transport) : client_{transport} {}
    ~BlockApi() override = default;

    BlockApi(const BlockApi&) = delete;
    BlockApi& operator=(const BlockApi&) = delete;

    Task<http::Reply> handle(const http::Request& request) override;

  protected:
    Task<http::Reply> handle_block(std::string_view query);

  private:
    json_rpc::Client client_;
};

}  // namespace tally::rpc::commands
