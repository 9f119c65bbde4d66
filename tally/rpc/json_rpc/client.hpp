// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string_view>

#include <tally/infra/concurrency/task.hpp>

#include <nlohmann/json.hpp>

#include <tally/rpc/http/transport.hpp>
#include <tally/rpc/types/error.hpp>

namespace tally::rpc::json_rpc {

//! Requests are never pipelined, so the id carries no correlation information
inline constexpr uint32_t kRequestId{1};

//! JSON-RPC 2.0 client performing exactly one attempt per call over the given transport
class Client {
  public:
    explicit Client(http::Transport& transport) : transport_{transport} {}

    //! Invoke the method and return its result verbatim (JSON null if absent)
    //! \return TransportError for connection, timeout or HTTP status failures
    //! \return RpcProtocolError for JSON-RPC error objects or malformed responses
    Task<Result<nlohmann::json>> call(std::string_view method, nlohmann::json params);

  private:
    http::Transport& transport_;
};

}  // namespace tally::rpc::json_rpc
