// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <tally/infra/concurrency/task.hpp>

namespace tally::rpc::http {

//! Status and body of the reply to a POST request
struct PostReply {
    unsigned status{0};
    std::string body;
};

//! Request/reply exchange with the JSON-RPC node
class Transport {
  public:
    virtual ~Transport() = default;

    //! Send one POST request carrying the JSON body and await its reply
    //! \throws boost::system::system_error on connection, timeout or protocol failures
    virtual Task<PostReply> post(std::string body) = 0;
};

}  // namespace tally::rpc::http
