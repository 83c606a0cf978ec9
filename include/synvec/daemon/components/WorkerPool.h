// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <atomic>
#include <future>
#include <memory>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace synvec::daemon {

// IO-based worker pool; each query runs as an independent handler on one of its threads.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads = 1);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    boost::asio::any_io_executor executor() const { return io_.get_executor(); }

    /// Run fn on a pool thread; the future carries its return value.
    template <typename F> auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto fut = task->get_future();
        boost::asio::post(io_, [task]() { (*task)(); });
        return fut;
    }

    void stop();

    std::size_t threads() const noexcept { return active_.load(std::memory_order_relaxed); }
    bool stopped() const { return io_.stopped(); }

private:
    void run_thread(std::stop_token st);

    mutable boost::asio::io_context io_;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
    std::unique_ptr<WorkGuard> guard_;
    std::vector<std::jthread> threads_;
    std::atomic<std::size_t> active_{0};
};

} // namespace synvec::daemon
