// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/daemon/components/WorkerPool.h>

#include <spdlog/spdlog.h>

#include <system_error>

namespace synvec::daemon {

WorkerPool::WorkerPool(std::size_t threads) : io_(static_cast<int>(threads == 0 ? 1 : threads)) {
    if (threads == 0)
        threads = 1;
    guard_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(io_));
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this](std::stop_token st) { run_thread(st); });
        active_.fetch_add(1, std::memory_order_relaxed);
    }
    spdlog::info("WorkerPool started with {} threads", threads_.size());
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::stop() {
    if (threads_.empty())
        return;
    spdlog::debug("[WorkerPool] stop() called");

    // Order is critical: first reset guard, then stop io_context
    if (guard_) {
        guard_->reset();
        guard_.reset();
    }
    if (!io_.stopped())
        io_.stop();

    for (auto& t : threads_) {
        if (t.joinable())
            t.request_stop();
    }
    for (size_t i = 0; i < threads_.size(); ++i) {
        auto& t = threads_[i];
        if (!t.joinable())
            continue;
        try {
            t.join();
        } catch (const std::system_error& e) {
            spdlog::warn("WorkerPool::stop() thread {} join failed: {}", i, e.what());
        }
    }
    threads_.clear();
    active_.store(0, std::memory_order_relaxed);
    spdlog::info("[WorkerPool] stopped");
}

void WorkerPool::run_thread(std::stop_token st) {
    while (!st.stop_requested() && !io_.stopped()) {
        try {
            io_.run();
        } catch (const std::exception& e) {
            // A throwing handler must not take the thread down with it
            spdlog::warn("WorkerPool handler threw: {}", e.what());
            continue;
        }
        break;
    }
    active_.fetch_sub(1, std::memory_order_relaxed);
}

} // namespace synvec::daemon
