// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "server.hpp"

#include <exception>
#include <memory>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <tally/infra/common/log.hpp>
#include <tally/rpc/common/constants.hpp>
#include <tally/rpc/http/connection.hpp>

namespace tally::rpc::http {

using reuse_port = boost::asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>;

std::tuple<std::string, std::string> Server::parse_endpoint(std::string_view tcp_end_point) {
    // Last separator splits the port, so that IPv6 addresses keep their colons
    const auto separator = tcp_end_point.rfind(kAddressPortSeparator);
    std::string_view host = tcp_end_point.substr(0, separator);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    const auto port = separator == std::string_view::npos ? std::string_view{} : tcp_end_point.substr(separator + 1);
    return {std::string{host}, std::string{port}};
}

Server::Server(std::string_view end_point,
               RequestHandlerFactory&& handler_factory,
               boost::asio::io_context& ioc,
               std::vector<std::string> allowed_origins)
    : handler_factory_{std::move(handler_factory)},
      acceptor_{ioc},
      allowed_origins_{std::move(allowed_origins)} {
    const auto [host, port] = parse_endpoint(end_point);

    // Open the acceptor with the options to share the end-point among all the servers in the pool
    boost::asio::ip::tcp::resolver resolver{acceptor_.get_executor()};
    boost::asio::ip::tcp::endpoint endpoint = *resolver.resolve(host, port).begin();
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.set_option(reuse_port(true));
    acceptor_.bind(endpoint);
}

void Server::start() {
    boost::asio::co_spawn(acceptor_.get_executor(), run(), [&](const std::exception_ptr& eptr) {
        if (eptr) std::rethrow_exception(eptr);
    });
}

void Server::stop() {
    boost::asio::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            TALLY_WARN << "Server::stop close error: " << ec.message();
        }
    });
}

Task<void> Server::run() {
    auto this_executor = co_await boost::asio::this_coro::executor;
    try {
        acceptor_.listen();
        while (acceptor_.is_open()) {
            TALLY_TRACE << "Server::run accepting using executor " << &this_executor << "...";

            boost::asio::ip::tcp::socket socket{this_executor};
            co_await acceptor_.async_accept(socket, boost::asio::use_awaitable);
            if (!acceptor_.is_open()) {
                TALLY_TRACE << "Server::run returning...";
                co_return;
            }

            std::shared_ptr<Connection> new_connection;
            try {
                new_connection = std::make_shared<Connection>(std::move(socket), handler_factory_, allowed_origins_);
            } catch (const boost::system::system_error& se) {
                // Peer already gone before the connection could be set up
                TALLY_DEBUG << "Server::run connection setup failed: " << se.what();
                continue;
            }
            boost::asio::co_spawn(this_executor, Connection::run_read_loop(new_connection), boost::asio::detached);
        }
    } catch (const boost::system::system_error& se) {
        if (se.code() != boost::asio::error::operation_aborted) {
            TALLY_ERROR << "Server::run system_error: " << se.what();
            throw;
        }
        TALLY_DEBUG << "Server::run operation_aborted: " << se.what();
    }
    TALLY_DEBUG << "Server::run exiting...";
}

}  // namespace tally::rpc::http
