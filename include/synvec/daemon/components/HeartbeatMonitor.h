// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/core/types.h>
#include <synvec/daemon/components/ResourceRouter.h>

#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace synvec::daemon {

/**
 * @brief Periodically probes every registered worker and feeds the router
 *
 * Probe errors become failed heartbeats; they are logged and the next tick probes again.
 * Nothing is propagated to in-flight queries.
 */
class HeartbeatMonitor : public std::enable_shared_from_this<HeartbeatMonitor> {
public:
    using Probe = std::function<Result<HeartbeatMetrics>(const WorkerStats& worker)>;

    HeartbeatMonitor(std::shared_ptr<ResourceRouter> router, Probe probe,
                     std::chrono::milliseconds interval);
    ~HeartbeatMonitor();

    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    /// One probe round over all workers; returns the number of failed probes
    size_t tick();

    /// Requires shared_ptr ownership; runs tick() every interval on the executor
    Result<void> start(boost::asio::any_io_executor executor);
    void stop();

    uint64_t rounds() const { return rounds_.load(std::memory_order_relaxed); }

private:
    std::shared_ptr<ResourceRouter> router_;
    Probe probe_;
    std::chrono::milliseconds interval_;
    std::shared_ptr<std::atomic<bool>> stopRequested_;
    std::atomic<uint64_t> rounds_{0};
};

} // namespace synvec::daemon
