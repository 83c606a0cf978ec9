// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/daemon/components/HeartbeatMonitor.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

namespace synvec::daemon {

HeartbeatMonitor::HeartbeatMonitor(std::shared_ptr<ResourceRouter> router, Probe probe,
                                   std::chrono::milliseconds interval)
    : router_(std::move(router)), probe_(std::move(probe)), interval_(interval) {}

HeartbeatMonitor::~HeartbeatMonitor() {
    stop();
}

size_t HeartbeatMonitor::tick() {
    size_t failures = 0;
    for (const auto& worker : router_->getWorkerStats()) {
        HeartbeatMetrics metrics;
        auto start = std::chrono::steady_clock::now();
        try {
            auto r = probe_(worker);
            if (r) {
                metrics = r.value();
            } else {
                metrics.ok = false;
                metrics.error = r.error().message;
            }
        } catch (const std::exception& e) {
            metrics.ok = false;
            metrics.error = e.what();
        }
        if (metrics.ok && metrics.latencyMs <= 0.0) {
            metrics.latencyMs = std::chrono::duration<double, std::milli>(
                                    std::chrono::steady_clock::now() - start)
                                    .count();
        }
        if (!metrics.ok) {
            ++failures;
            spdlog::warn("[Heartbeat] probe of {} failed: {}", worker.id, metrics.error);
        }
        auto fed = router_->heartbeat(worker.id, metrics);
        if (!fed) {
            // Deregistered between listing and probing
            spdlog::debug("[Heartbeat] {}: {}", worker.id, fed.error().message);
        }
    }
    rounds_.fetch_add(1, std::memory_order_relaxed);
    return failures;
}

Result<void> HeartbeatMonitor::start(boost::asio::any_io_executor executor) {
    std::weak_ptr<HeartbeatMonitor> weak = weak_from_this();
    if (weak.expired()) {
        return Error{ErrorCode::InvalidState, "HeartbeatMonitor requires shared_ptr ownership"};
    }
    auto stop = std::make_shared<std::atomic<bool>>(false);
    if (auto prev = std::atomic_exchange(&stopRequested_, stop))
        prev->store(true, std::memory_order_release);

    auto interval = interval_;
    boost::asio::co_spawn(
        executor,
        [weak, stop, interval]() -> boost::asio::awaitable<void> {
            auto ex = co_await boost::asio::this_coro::executor;
            boost::asio::steady_timer timer(ex);
            while (!stop->load(std::memory_order_acquire)) {
                auto self = weak.lock();
                if (!self)
                    break;
                try {
                    self->tick();
                } catch (const std::exception& e) {
                    spdlog::warn("[Heartbeat] round failed, retrying next interval: {}",
                                 e.what());
                }
                self.reset();

                timer.expires_after(interval);
                try {
                    co_await timer.async_wait(boost::asio::use_awaitable);
                } catch (const boost::system::system_error& e) {
                    if (e.code() == boost::asio::error::operation_aborted)
                        break;
                    spdlog::warn("[Heartbeat] timer error: {}", e.what());
                }
            }
            spdlog::debug("[Heartbeat] monitor stopped");
            co_return;
        },
        boost::asio::detached);
    spdlog::info("[Heartbeat] probing workers every {} ms", interval.count());
    return Result<void>();
}

void HeartbeatMonitor::stop() {
    if (auto prev = std::atomic_exchange(&stopRequested_, std::shared_ptr<std::atomic<bool>>{}))
        prev->store(true, std::memory_order_release);
}

} // namespace synvec::daemon
