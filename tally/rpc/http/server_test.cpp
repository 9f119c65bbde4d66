// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "server.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/system/system_error.hpp>
#include <catch2/catch_test_macros.hpp>

#include <tally/infra/test_util/log.hpp>
#include <tally/infra/test_util/task_runner.hpp>

namespace tally::rpc::http {

namespace beast = boost::beast;
using namespace std::chrono_literals;
using boost::asio::ip::tcp;
using boost::asio::use_awaitable;

using TestRequest = beast::http::request<beast::http::string_body>;
using TestResponse = beast::http::response<beast::http::string_body>;

//! Echo the request-target back as JSON content
class EchoHandler : public RequestHandler {
  public:
    Task<Reply> handle(const Request& request) override {
        co_return Reply{beast::http::status::ok, R"({"target":")" + request.target + R"("})"};
    }
};

//! Never reply, recording whether the pending handler got cancelled
class StuckHandler : public RequestHandler {
  public:
    explicit StuckHandler(bool& cancelled) : cancelled_{cancelled} {}

    Task<Reply> handle(const Request& /*request*/) override {
        boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor, boost::asio::steady_timer::time_point::max()};
        try {
            co_await timer.async_wait(use_awaitable);
        } catch (const boost::system::system_error& se) {
            cancelled_ = se.code() == boost::asio::error::operation_aborted;
            throw;
        }
        co_return Reply{};
    }

  private:
    bool& cancelled_;
};

static Task<TestResponse> send_request(tcp::endpoint endpoint, TestRequest request) {
    tcp::socket socket{co_await boost::asio::this_coro::executor};
    co_await socket.async_connect(endpoint, use_awaitable);
    request.prepare_payload();
    co_await beast::http::async_write(socket, request, use_awaitable);

    beast::flat_buffer buffer;
    beast::http::response_parser<beast::http::string_body> parser;
    parser.skip(request.method() == beast::http::verb::head);
    co_await beast::http::async_read(socket, buffer, parser, use_awaitable);
    co_return parser.release();
}

//! Send the request and hang up before any reply, then wait a bounded time for the flag
static Task<void> send_and_disconnect(tcp::endpoint endpoint, TestRequest request, const bool& cancelled) {
    tcp::socket socket{co_await boost::asio::this_coro::executor};
    co_await socket.async_connect(endpoint, use_awaitable);
    request.prepare_payload();
    co_await beast::http::async_write(socket, request, use_awaitable);
    boost::asio::steady_timer timer{socket.get_executor()};
    timer.expires_after(50ms);
    co_await timer.async_wait(use_awaitable);
    socket.close();

    for (int i = 0; i < 200 && !cancelled; ++i) {
        timer.expires_after(10ms);
        co_await timer.async_wait(use_awaitable);
    }
}

static Task<void> settle() {
    boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor, 20ms};
    co_await timer.async_wait(use_awaitable);
}

static TestRequest make_request(beast::http::verb method, std::string target) {
    TestRequest request{method, target, 11};
    request.set(beast::http::field::host, "localhost");
    request.keep_alive(false);
    return request;
}

#ifndef TALLY_SANITIZE
TEST_CASE("Server serves handler replies", "[rpc][http][server]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    Server server{"127.0.0.1:0", [] { return std::make_unique<EchoHandler>(); }, runner.ioc(), {"http://allowed.org"}};
    server.start();
    const auto endpoint = server.local_endpoint();

    SECTION("GET carries JSON content") {
        const auto response = runner.run(send_request(endpoint, make_request(beast::http::verb::get, "/block?number=1")));
        CHECK(response.result() == beast::http::status::ok);
        CHECK(response[beast::http::field::content_type] == "application/json");
        CHECK(!response[beast::http::field::date].empty());
        CHECK(response.body() == R"({"target":"/block?number=1"})");
    }

    SECTION("HEAD carries headers only") {
        const auto response = runner.run(send_request(endpoint, make_request(beast::http::verb::head, "/")));
        CHECK(response.result() == beast::http::status::ok);
        CHECK(response[beast::http::field::content_length] == "14");
        CHECK(response.body().empty());
    }

    SECTION("allowed origin is echoed") {
        auto request = make_request(beast::http::verb::get, "/");
        request.set(beast::http::field::origin, "http://allowed.org");
        const auto response = runner.run(send_request(endpoint, std::move(request)));
        CHECK(response[beast::http::field::access_control_allow_origin] == "http://allowed.org");
    }

    SECTION("unknown origin gets no CORS header") {
        auto request = make_request(beast::http::verb::get, "/");
        request.set(beast::http::field::origin, "http://other.org");
        const auto response = runner.run(send_request(endpoint, std::move(request)));
        CHECK(response[beast::http::field::access_control_allow_origin].empty());
    }

    SECTION("preflight answered without calling the handler") {
        auto request = make_request(beast::http::verb::options, "/block");
        request.set(beast::http::field::origin, "http://allowed.org");
        request.set(beast::http::field::access_control_request_method, "GET");
        const auto response = runner.run(send_request(endpoint, std::move(request)));
        CHECK(response.result() == beast::http::status::no_content);
        CHECK(response[beast::http::field::access_control_allow_methods] == "GET, HEAD, OPTIONS");
    }

    server.stop();
    runner.run(settle());
}

TEST_CASE("Server cancels handler on client disconnect", "[rpc][http][server]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    bool cancelled{false};
    Server server{"127.0.0.1:0", [&] { return std::make_unique<StuckHandler>(cancelled); }, runner.ioc(), {}};
    server.start();

    runner.run(send_and_disconnect(server.local_endpoint(), make_request(beast::http::verb::get, "/block"), cancelled));
    CHECK(cancelled);

    server.stop();
    runner.run(settle());
}
#endif  // TALLY_SANITIZE

}  // namespace tally::rpc::http
