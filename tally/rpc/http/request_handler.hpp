// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>

#include <tally/infra/concurrency/task.hpp>

#include <absl/functional/any_invocable.h>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>

namespace tally::rpc::http {

//! Inbound request as seen by handlers: method plus request-target (path and query)
struct Request {
    boost::beast::http::verb method{boost::beast::http::verb::get};
    std::string target;
};

//! JSON reply produced by handlers
struct Reply {
    boost::beast::http::status status{boost::beast::http::status::ok};
    std::string content;
};

class RequestHandler {
  public:
    virtual ~RequestHandler() = default;

    //! Produce the reply for the request; cancellation of the awaiting coroutine aborts it
    virtual Task<Reply> handle(const Request& request) = 0;
};

using RequestHandlerPtr = std::unique_ptr<RequestHandler>;

//! Creates one handler per accepted connection
using RequestHandlerFactory = absl::AnyInvocable<RequestHandlerPtr()>;

}  // namespace tally::rpc::http
