// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "connection.hpp"

#include <algorithm>
#include <cstdint>
#include <shared_mutex>
#include <string_view>
#include <utility>
#include <variant>

#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/system/system_error.hpp>

#include <tally/infra/common/log.hpp>
#include <tally/rpc/common/constants.hpp>

namespace tally::rpc::http {

namespace beast = boost::beast;
using boost::asio::use_awaitable;

static constexpr std::string_view kMaxAge{"600"};

Task<void> Connection::run_read_loop(std::shared_ptr<Connection> connection) {
    co_await connection->read_loop();
}

Connection::Connection(boost::asio::ip::tcp::socket socket,
                       RequestHandlerFactory& handler_factory,
                       const std::vector<std::string>& allowed_origins)
    : socket_{std::move(socket)},
      handler_{handler_factory()},
      allowed_origins_{allowed_origins} {
    socket_.set_option(boost::asio::ip::tcp::socket::keep_alive(true));
    TALLY_TRACE << "Connection::Connection created for " << socket_.remote_endpoint();
}

Connection::~Connection() {
    boost::system::error_code ec;
    socket_.close(ec);
    TALLY_TRACE << "Connection::~Connection socket " << &socket_ << " deleted";
}

Task<void> Connection::read_loop() {
    try {
        bool continue_processing{true};
        while (continue_processing) {
            continue_processing = co_await do_read();
        }
    } catch (const boost::system::system_error& se) {
        if (se.code() == beast::http::error::end_of_stream) {
            TALLY_TRACE << "Connection::read_loop received graceful close";
        } else {
            TALLY_TRACE << "Connection::read_loop system_error: " << se.code();
        }
    } catch (const std::exception& e) {
        TALLY_ERROR << "Connection::read_loop exception: " << e.what();
    }
}

Task<bool> Connection::do_read() {
    TALLY_TRACE << "Connection::do_read going to read...";

    beast::http::request_parser<beast::http::string_body> parser;
    parser.body_limit(kMaxRequestSize);

    const auto bytes_transferred = co_await beast::http::async_read(socket_, data_, parser, use_awaitable);
    TALLY_TRACE << "Connection::do_read bytes_read: " << bytes_transferred << " message: " << parser.get().target();

    if (!parser.is_done()) {
        co_return true;
    }

    const auto req = parser.release();
    const RequestData request_data{
        .request_keep_alive = req.keep_alive(),
        .request_http_version = req.version(),
        .vary = std::string{req[beast::http::field::vary]},
        .origin = std::string{req[beast::http::field::origin]},
        .method = req.method(),
    };

    if (req.method() == beast::http::verb::options && !req[beast::http::field::access_control_request_method].empty()) {
        co_await handle_preflight(req, request_data);
        co_return request_data.request_keep_alive;
    }
    co_return co_await handle_actual_request(req, request_data);
}

Task<void> Connection::handle_preflight(const RequestWithStringBody& req, const RequestData& request_data) {
    beast::http::response<beast::http::string_body> res{beast::http::status::no_content, request_data.request_http_version};
    if (request_data.vary.empty()) {
        res.set(beast::http::field::vary, "Origin, Access-Control-Request-Method, Access-Control-Request-Headers");
    } else {
        res.set(beast::http::field::vary, request_data.vary + " Origin");
    }

    const auto requested_method = beast::http::string_to_verb(req[beast::http::field::access_control_request_method]);
    if (!request_data.origin.empty() && is_origin_allowed(request_data.origin) && is_method_allowed(requested_method)) {
        res.set(beast::http::field::access_control_allow_origin, allowed_origins_.at(0) == "*" ? "*" : request_data.origin);
        res.set(beast::http::field::access_control_allow_methods, "GET, HEAD, OPTIONS");
        res.set(beast::http::field::access_control_allow_headers, "*");
        res.set(beast::http::field::access_control_max_age, kMaxAge);
    }
    res.set(beast::http::field::date, get_date_time());
    res.keep_alive(request_data.request_keep_alive);
    res.prepare_payload();
    co_await beast::http::async_write(socket_, res, use_awaitable);
}

Task<bool> Connection::handle_actual_request(const RequestWithStringBody& req, const RequestData& request_data) {
    using namespace boost::asio::experimental::awaitable_operators;

    const Request request{.method = req.method(), .target = std::string{req.target()}};
    TALLY_TRACE << "Connection::handle_actual_request " << req.method_string() << " " << request.target;

    // Client going away while the handler is in flight cancels the handler (and its outbound calls)
    auto outcome = co_await (handler_->handle(request) || wait_for_disconnect());
    if (outcome.index() == 1) {
        TALLY_DEBUG << "Connection::handle_actual_request client disconnected, request cancelled: " << request.target;
        co_return false;
    }

    auto reply = std::get<0>(std::move(outcome));
    co_await do_write(std::move(reply.content), reply.status, request_data);
    co_return request_data.request_keep_alive;
}

Task<void> Connection::wait_for_disconnect() {
    co_await socket_.async_wait(boost::asio::ip::tcp::socket::wait_read, use_awaitable);

    // Readable with no pending bytes means EOF or reset from the peer
    boost::system::error_code ec;
    const auto pending = socket_.available(ec);
    if (ec || pending == 0) {
        co_return;
    }

    // Pipelined request bytes: they are read after the current reply, so just park here until cancelled
    boost::asio::steady_timer parked{socket_.get_executor(), boost::asio::steady_timer::time_point::max()};
    co_await parked.async_wait(use_awaitable);
}

Task<void> Connection::do_write(std::string content, beast::http::status http_status, const RequestData& request_data) {
    try {
        TALLY_TRACE << "Connection::do_write response: " << http_status << " content: " << content;
        beast::http::response<beast::http::string_body> res{http_status, request_data.request_http_version};
        res.set(beast::http::field::content_type, "application/json");
        res.set(beast::http::field::date, get_date_time());
        res.keep_alive(request_data.request_keep_alive);
        set_cors(res, request_data);

        const auto content_length = content.size();
        if (request_data.method != beast::http::verb::head) {
            res.body() = std::move(content);
        }
        res.content_length(content_length);

        const auto bytes_transferred = co_await beast::http::async_write(socket_, res, use_awaitable);
        TALLY_TRACE << "Connection::do_write bytes_transferred: " << bytes_transferred;
    } catch (const boost::system::system_error& se) {
        TALLY_TRACE << "Connection::do_write system_error: " << se.what();
        throw;
    }
}

template <class Body>
void Connection::set_cors(beast::http::response<Body>& res, const RequestData& request_data) const {
    if (request_data.vary.empty()) {
        res.set(beast::http::field::vary, "Origin");
    } else {
        res.set(beast::http::field::vary, request_data.vary + " Origin");
    }
    if (request_data.origin.empty() || !is_origin_allowed(request_data.origin) || !is_method_allowed(request_data.method)) {
        return;
    }
    res.set(beast::http::field::access_control_allow_origin, allowed_origins_.at(0) == "*" ? "*" : request_data.origin);
}

bool Connection::is_origin_allowed(const std::string& origin) const {
    if (allowed_origins_.size() == 1 && allowed_origins_[0] == "*") {
        return true;
    }
    return std::ranges::any_of(allowed_origins_, [&](const auto& allowed) { return origin == allowed; });
}

bool Connection::is_method_allowed(beast::http::verb method) {
    return method == beast::http::verb::options ||
           method == beast::http::verb::get ||
           method == beast::http::verb::head;
}

std::string Connection::get_date_time() {
    static std::pair<int64_t, std::string> cache;
    static std::shared_mutex cache_mutex;

    std::pair<int64_t, std::string> result;
    {
        std::shared_lock lock{cache_mutex};
        result = cache;
    }

    const int64_t ts = absl::ToUnixSeconds(absl::Now());
    if (ts == result.first) {
        return std::move(result.second);
    }

    result = {ts, absl::FormatTime("%a, %d %b %Y %H:%M:%S GMT", absl::FromUnixSeconds(ts), absl::UTCTimeZone())};
    {
        std::unique_lock lock{cache_mutex};
        if (ts > cache.first) {
            cache = result;
        }
    }
    return std::move(result.second);
}

}  // namespace tally::rpc::http
