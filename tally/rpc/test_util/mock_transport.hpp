// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <utility>

#include <tally/infra/concurrency/task.hpp>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <gmock/gmock.h>

#include <tally/rpc/http/transport.hpp>

namespace tally::rpc::test {

class TransportMock : public http::Transport {  // NOLINT
  public:
    MOCK_METHOD((Task<http::PostReply>), post, (std::string), (override));
};

inline Task<http::PostReply> make_reply(unsigned status, std::string body) {
    co_return http::PostReply{status, std::move(body)};
}

inline Task<http::PostReply> make_failure(boost::system::error_code ec) {
    throw boost::system::system_error{ec};
    co_return http::PostReply{};
}

//! Action replying with the given status and body
inline auto reply_with(unsigned status, std::string body) {
    return testing::InvokeWithoutArgs([=]() { return make_reply(status, body); });
}

//! Action failing as the transport does on network errors
inline auto fail_with(boost::system::error_code ec) {
    return testing::InvokeWithoutArgs([=]() { return make_failure(ec); });
}

}  // namespace tally::rpc::test
