// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include <boost/asio/ssl/context.hpp>

#include <tally/infra/concurrency/context_pool.hpp>
#include <tally/rpc/http/client_transport.hpp>
#include <tally/rpc/http/endpoint_url.hpp>
#include <tally/rpc/http/server.hpp>

#include "settings.hpp"

namespace tally::rpc {

class Daemon {
  public:
    //! Run the block summary service until a termination signal arrives
    //! \return 0 on clean shutdown, -1 on fatal error
    static int run(const ServiceSettings& settings);

    //! \throws std::invalid_argument if the settings are not valid
    explicit Daemon(ServiceSettings settings);

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    concurrency::ContextPool& context_pool() { return context_pool_; }

    void start();
    void stop();

    void join();

  protected:
    //! \return the parsed RPC endpoint URL
    //! \throws std::invalid_argument if the settings are not valid
    static http::EndpointUrl validate_settings(const ServiceSettings& settings);

  private:
    //! The service configuration settings.
    ServiceSettings settings_;

    //! The JSON RPC node location.
    http::EndpointUrl rpc_url_;

    //! The TLS client configuration shared by all the outbound connections.
    boost::asio::ssl::context ssl_context_;

    //! The execution contexts capturing the asynchronous scheduling model.
    concurrency::ContextPool context_pool_;

    //! The outbound JSON RPC transports, one per execution context.
    std::vector<std::unique_ptr<http::ClientTransport>> transports_;

    //! The block summary HTTP services, one per execution context.
    std::vector<std::unique_ptr<http::Server>> services_;
};

}  // namespace tally::rpc
