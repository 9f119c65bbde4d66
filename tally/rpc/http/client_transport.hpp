// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <tally/infra/concurrency/task.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <tally/rpc/common/constants.hpp>
#include <tally/rpc/http/endpoint_url.hpp>
#include <tally/rpc/http/transport.hpp>

namespace tally::rpc::http {

//! Transport issuing each POST on a fresh HTTP/1.1 connection, TLS-protected for https endpoints
class ClientTransport : public Transport {
  public:
    ClientTransport(EndpointUrl url, boost::asio::ssl::context& ssl_context, std::chrono::milliseconds timeout = kDefaultRpcTimeout);

    ClientTransport(const ClientTransport&) = delete;
    ClientTransport& operator=(const ClientTransport&) = delete;

    //! The whole exchange from connect to reply must complete within the configured timeout
    Task<PostReply> post(std::string body) override;

  private:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;

    Request make_request(std::string body) const;

    template <typename Stream>
    Task<PostReply> exchange(Stream& stream, Request request);

    EndpointUrl url_;
    boost::asio::ssl::context& ssl_context_;
    std::chrono::milliseconds timeout_;
};

//! Resolve host and port, failing with beast::error::timeout once the deadline has passed
Task<boost::asio::ip::tcp::resolver::results_type> resolve(const std::string& host, uint16_t port,
                                                           std::chrono::steady_clock::time_point deadline);

//! TLS client context verifying peers against the system trust store
boost::asio::ssl::context make_client_ssl_context();

}  // namespace tally::rpc::http
