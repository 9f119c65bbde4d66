// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "client_transport.hpp"

#include <utility>
#include <variant>

#include <absl/strings/str_cat.h>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/system_error.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <tally/infra/common/log.hpp>

namespace tally::rpc::http {

namespace beast = boost::beast;
namespace ssl = boost::asio::ssl;
using boost::asio::use_awaitable;
using boost::asio::ip::tcp;

static constexpr std::string_view kUserAgent{"tallyd"};

static bool is_ip_address(const std::string& host) {
    boost::system::error_code ec;
    boost::asio::ip::make_address(host, ec);
    return !ec;
}

//! Value of the Host header: port omitted when it is the scheme default, IPv6 literals in brackets
static std::string host_header(const EndpointUrl& url) {
    const bool is_ipv6 = url.host.find(':') != std::string::npos;
    std::string host = is_ipv6 ? absl::StrCat("[", url.host, "]") : url.host;
    const uint16_t default_port = url.use_tls ? 443 : 80;
    if (url.port != default_port) {
        absl::StrAppend(&host, ":", url.port);
    }
    return host;
}

ssl::context make_client_ssl_context() {
    ssl::context ssl_context{ssl::context::tls_client};
    ssl_context.set_default_verify_paths();
    ssl_context.set_verify_mode(ssl::verify_peer);
    return ssl_context;
}

ClientTransport::ClientTransport(EndpointUrl url, ssl::context& ssl_context, std::chrono::milliseconds timeout)
    : url_{std::move(url)}, ssl_context_{ssl_context}, timeout_{timeout} {}

ClientTransport::Request ClientTransport::make_request(std::string body) const {
    Request request{beast::http::verb::post, url_.target, 11};
    request.set(beast::http::field::host, host_header(url_));
    request.set(beast::http::field::user_agent, kUserAgent);
    request.set(beast::http::field::content_type, "application/json");
    request.set(beast::http::field::accept, "application/json");
    request.keep_alive(false);
    request.body() = std::move(body);
    request.prepare_payload();
    return request;
}

template <typename Stream>
Task<PostReply> ClientTransport::exchange(Stream& stream, Request request) {
    const auto bytes_written = co_await beast::http::async_write(stream, request, use_awaitable);
    TALLY_TRACE << "ClientTransport::exchange bytes_written: " << bytes_written;

    beast::flat_buffer buffer;
    beast::http::response_parser<beast::http::string_body> parser;
    parser.body_limit(kMaxRpcResponseSize);
    const auto bytes_read = co_await beast::http::async_read(stream, buffer, parser, use_awaitable);
    auto response = parser.release();
    TALLY_TRACE << "ClientTransport::exchange bytes_read: " << bytes_read << " status: " << response.result_int();

    co_return PostReply{response.result_int(), std::move(response.body())};
}

//! Fire the resolver deadline: in-flight lookups complete as aborted, queued ones never start
static Task<void> expire_resolve(tcp::resolver& resolver, std::chrono::steady_clock::time_point deadline) {
    boost::asio::steady_timer timer{resolver.get_executor(), deadline};
    co_await timer.async_wait(use_awaitable);
    resolver.cancel();
}

Task<tcp::resolver::results_type> resolve(const std::string& host, uint16_t port, std::chrono::steady_clock::time_point deadline) {
    using namespace boost::asio::experimental::awaitable_operators;

    if (std::chrono::steady_clock::now() >= deadline) {
        throw boost::system::system_error{beast::error::timeout, "resolve"};
    }
    tcp::resolver resolver{co_await boost::asio::this_coro::executor};
    auto outcome = co_await (resolver.async_resolve(host, std::to_string(port), use_awaitable) || expire_resolve(resolver, deadline));
    if (outcome.index() == 1) {
        throw boost::system::system_error{beast::error::timeout, "resolve"};
    }
    co_return std::get<0>(std::move(outcome));
}

Task<PostReply> ClientTransport::post(std::string body) {
    auto executor = co_await boost::asio::this_coro::executor;
    TALLY_TRACE << "ClientTransport::post " << url_ << " request: " << body;

    // Absolute deadline shared by every operation below, name resolution included
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    const auto endpoints = co_await resolve(url_.host, url_.port, deadline);

    auto request = make_request(std::move(body));
    if (!url_.use_tls) {
        beast::tcp_stream stream{executor};
        stream.expires_at(deadline);
        co_await stream.async_connect(endpoints, use_awaitable);
        co_return co_await exchange(stream, std::move(request));
    }

    beast::ssl_stream<beast::tcp_stream> stream{executor, ssl_context_};
    if (!is_ip_address(url_.host) && !SSL_set_tlsext_host_name(stream.native_handle(), url_.host.c_str())) {
        const boost::system::error_code ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
        throw boost::system::system_error{ec, "cannot set SNI host name"};
    }
    stream.set_verify_callback(ssl::host_name_verification{url_.host});

    beast::get_lowest_layer(stream).expires_at(deadline);
    co_await beast::get_lowest_layer(stream).async_connect(endpoints, use_awaitable);
    co_await stream.async_handshake(ssl::stream_base::client, use_awaitable);

    // Reply already complete: the connection is dropped without awaiting the TLS close_notify exchange
    co_return co_await exchange(stream, std::move(request));
}

}  // namespace tally::rpc::http
