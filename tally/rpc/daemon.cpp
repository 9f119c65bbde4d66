// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "daemon.hpp"

#include <csignal>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/version.hpp>
#include <boost/process/environment.hpp>
#include <openssl/opensslv.h>

#include <tally/infra/common/log.hpp>
#include <tally/rpc/commands/block_api.hpp>

namespace tally::rpc {

//! Assemble the relevant library version information
static std::string get_library_versions() {
    std::string library_versions{"Boost Asio: "};
    library_versions.append(std::to_string(BOOST_ASIO_VERSION));
    library_versions.append(" OpenSSL: ");
    library_versions.append(OPENSSL_VERSION_TEXT);
    return library_versions;
}

int Daemon::run(const ServiceSettings& settings) {
    log::init(settings.log_settings);
    log::set_thread_name("main-thread");

    TALLY_INFO << "Tallyd starting " << get_library_versions();

    const auto pid = boost::this_process::get_id();
    const auto tid = std::this_thread::get_id();

    int exit_code{0};
    try {
        TALLY_INFO << "Tallyd launched with RPC URL " << settings.rpc_url << " timeout " << settings.rpc_timeout.count()
                   << "ms using " << settings.context_pool_settings.num_contexts << " contexts";

        // Create the one-and-only block summary daemon
        Daemon daemon{settings};

        // Any execution loop dying abnormally brings the whole daemon down
        daemon.context_pool().set_exception_handler([&](std::exception_ptr) {
            exit_code = -1;
            daemon.stop();
        });

        // Start execution context dedicated to handling termination signals
        boost::asio::io_context shutdown_signal_ioc;
        boost::asio::signal_set shutdown_signal{shutdown_signal_ioc, SIGINT, SIGTERM};
        shutdown_signal.async_wait([&](const boost::system::error_code& error, int signal_number) {
            if (signal_number == SIGINT) std::cout << "\n";
            TALLY_INFO << "Signal number: " << signal_number << " caught" << (error ? ", error: " + error.message() : "");
            daemon.stop();
        });

        TALLY_INFO << "Starting block summary API at " << settings.http_end_point;

        daemon.start();

        TALLY_LOG << "Tallyd is now running [pid=" << pid << ", main thread=" << tid << "]";

        // Run the signal handler in background so that the pool can also stop on its own
        std::thread shutdown_signal_thread{[&]() { shutdown_signal_ioc.run(); }};
        daemon.join();
        shutdown_signal_ioc.stop();
        shutdown_signal_thread.join();
    } catch (const std::exception& e) {
        TALLY_CRIT << "Exception: " << e.what();
        exit_code = -1;
    }

    TALLY_LOG << "Tallyd exiting [pid=" << pid << ", main thread=" << tid << "]";

    return exit_code;
}

http::EndpointUrl Daemon::validate_settings(const ServiceSettings& settings) {
    if (settings.http_end_point.empty()) {
        throw std::invalid_argument{"HTTP end-point cannot be empty, use --http.addr to specify it"};
    }
    if (settings.rpc_timeout.count() <= 0) {
        throw std::invalid_argument{"RPC timeout must be positive, use --rpc.timeout to specify it"};
    }
    auto rpc_url = http::parse_endpoint_url(settings.rpc_url);
    if (!rpc_url) {
        throw std::invalid_argument{"Invalid RPC URL " + settings.rpc_url + ": " + rpc_url.error()};
    }
    return std::move(*rpc_url);
}

Daemon::Daemon(ServiceSettings settings)
    : settings_{std::move(settings)},
      rpc_url_{validate_settings(settings_)},
      ssl_context_{http::make_client_ssl_context()},
      context_pool_{settings_.context_pool_settings} {}

void Daemon::start() {
    // Create and start the HTTP services for each execution context
    for (size_t i{0}; i < context_pool_.size(); ++i) {
        auto& ioc = context_pool_.next_ioc();

        auto& transport = *transports_.emplace_back(
            std::make_unique<http::ClientTransport>(rpc_url_, ssl_context_, settings_.rpc_timeout));
        auto make_block_api = [&transport]() -> http::RequestHandlerPtr {
            return std::make_unique<commands::BlockApi>(transport);
        };
        services_.emplace_back(std::make_unique<http::Server>(
            settings_.http_end_point, std::move(make_block_api), ioc, settings_.cors_domain));
    }

    for (auto& service : services_) {
        service->start();
    }

    context_pool_.start();
}

void Daemon::stop() {
    for (auto& service : services_) {
        service->stop();
    }
    context_pool_.stop();
}

void Daemon::join() {
    context_pool_.join();
}

}  // namespace tally::rpc
