// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <future>
#include <utility>

#include <tally/infra/concurrency/task.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

namespace tally::test_util {

/**
 * Runs Task-s to completion on a private io_context in tests
 */
class TaskRunner {
  public:
    template <typename TResult>
    TResult run(Task<TResult> task) {
        auto future = boost::asio::co_spawn(ioc_, std::move(task), boost::asio::use_future);
        ioc_.restart();
        while (future.wait_for(std::chrono::seconds{0}) != std::future_status::ready) {
            ioc_.poll_one();
        }
        return future.get();
    }

    boost::asio::io_context& ioc() { return ioc_; }

  private:
    boost::asio::io_context ioc_;
};

}  // namespace tally::test_util
