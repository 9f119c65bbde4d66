// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <tally/infra/concurrency/task.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <tally/rpc/http/request_handler.hpp>

namespace tally::rpc::http {

//! The top-level class of the HTTP server.
class Server {
  public:
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //! Construct the server to listen on the specified local TCP end-point as <address>:<port>
    Server(std::string_view end_point,
           RequestHandlerFactory&& handler_factory,
           boost::asio::io_context& ioc,
           std::vector<std::string> allowed_origins);

    void start();

    //! Close the acceptor, so that the accept loop terminates
    void stop();

    boost::asio::ip::tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }

  private:
    static std::tuple<std::string, std::string> parse_endpoint(std::string_view tcp_end_point);

    Task<void> run();

    //! The factory of request handlers, one per connection
    RequestHandlerFactory handler_factory_;

    //! The acceptor used to listen for incoming TCP connections
    boost::asio::ip::tcp::acceptor acceptor_;

    //! The list of allowed origins for CORS
    std::vector<std::string> allowed_origins_;
};

}  // namespace tally::rpc::http
