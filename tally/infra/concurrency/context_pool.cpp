// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "context_pool.hpp"

#include <stdexcept>
#include <string>
#include <thread>

#include <tally/infra/common/log.hpp>

namespace tally::concurrency {

std::ostream& operator<<(std::ostream& out, const Context& c) {
    out << "io_context: " << c.ioc() << " id: " << c.id();
    return out;
}

Context::Context(size_t context_id)
    : context_id_{context_id},
      ioc_{std::make_shared<boost::asio::io_context>()},
      work_{boost::asio::make_work_guard(*ioc_)} {}

void Context::execute_loop() {
    TALLY_DEBUG << "Context execution loop start [" << std::this_thread::get_id() << "]";
    ioc_->run();
    TALLY_DEBUG << "Context execution loop end [" << std::this_thread::get_id() << "]";
}

void Context::stop() {
    ioc_->stop();
}

ContextPool::ContextPool(ContextPoolSettings settings) {
    if (settings.num_contexts == 0) {
        throw std::logic_error("ContextPool size is 0");
    }
    contexts_.reserve(settings.num_contexts);
    for (size_t i{0}; i < settings.num_contexts; ++i) {
        contexts_.emplace_back(i);
        TALLY_TRACE << "ContextPool::ContextPool context[" << i << "] " << contexts_.back();
    }
}

ContextPool::~ContextPool() {
    TALLY_TRACE << "ContextPool::~ContextPool START " << this;
    stop();
    join();
    TALLY_TRACE << "ContextPool::~ContextPool END " << this;
}

void ContextPool::start() {
    TALLY_TRACE << "ContextPool::start START";
    for (size_t i{0}; i < contexts_.size(); ++i) {
        auto& context = contexts_[i];
        context_threads_.create_thread([&, i]() {
            log::set_thread_name(("asio_ctx_s" + std::to_string(i)).c_str());
            try {
                context.execute_loop();
            } catch (const std::exception& ex) {
                TALLY_CRIT << "ContextPool context.execute_loop exception: " << ex.what();
                exception_handler_(std::current_exception());
            }
        });
        TALLY_TRACE << "ContextPool::start context[" << i << "] started: " << context.ioc();
    }
    TALLY_TRACE << "ContextPool::start END";
}

void ContextPool::join() {
    TALLY_TRACE << "ContextPool::join START";
    context_threads_.join();
    TALLY_TRACE << "ContextPool::join END";
}

void ContextPool::stop() {
    TALLY_TRACE << "ContextPool::stop START";
    if (!stopped_.exchange(true)) {
        for (auto& context : contexts_) {
            context.stop();
        }
    }
    TALLY_TRACE << "ContextPool::stop END";
}

boost::asio::io_context& ContextPool::next_ioc() {
    // Increment first so that concurrent callers get different contexts
    const size_t index = next_index_.fetch_add(1) % contexts_.size();
    return *contexts_[index].ioc();
}

}  // namespace tally::concurrency
