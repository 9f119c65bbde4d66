// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <tally/infra/concurrency/task.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>

#include <tally/rpc/http/request_handler.hpp>

namespace tally::rpc::http {

//! Represents a single HTTP/1.1 connection from a client.
class Connection {
  public:
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    //! Serve requests until the client closes, keeping the connection alive for the whole loop
    static Task<void> run_read_loop(std::shared_ptr<Connection> connection);

    Connection(boost::asio::ip::tcp::socket socket,
               RequestHandlerFactory& handler_factory,
               const std::vector<std::string>& allowed_origins);
    ~Connection();

  private:
    using RequestWithStringBody = boost::beast::http::request<boost::beast::http::string_body>;

    struct RequestData {
        bool request_keep_alive{false};
        unsigned int request_http_version{11};
        std::string vary;
        std::string origin;
        boost::beast::http::verb method{boost::beast::http::verb::unknown};
    };

    Task<void> read_loop();

    //! \return true if the connection must keep on reading
    Task<bool> do_read();

    Task<void> handle_preflight(const RequestWithStringBody& req, const RequestData& request_data);

    //! \return true if the connection must keep on reading
    Task<bool> handle_actual_request(const RequestWithStringBody& req, const RequestData& request_data);

    //! Completes when the peer closes its side of the connection
    Task<void> wait_for_disconnect();

    Task<void> do_write(std::string content, boost::beast::http::status http_status, const RequestData& request_data);

    template <class Body>
    void set_cors(boost::beast::http::response<Body>& res, const RequestData& request_data) const;

    bool is_origin_allowed(const std::string& origin) const;

    static bool is_method_allowed(boost::beast::http::verb method);

    //! Current date in IMF-fixdate format, formatted at most once per second
    static std::string get_date_time();

    boost::asio::ip::tcp::socket socket_;

    RequestHandlerPtr handler_;

    //! The list of allowed origins for CORS
    const std::vector<std::string>& allowed_origins_;

    //! The incoming data buffer
    boost::beast::flat_buffer data_;
};

}  // namespace tally::rpc::http
