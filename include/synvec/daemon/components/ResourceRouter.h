// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/core/types.h>
#include <synvec/daemon/components/WorkerHealthFsm.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace synvec::daemon {

struct WorkerNode {
    std::string id;
    std::string address;
    uint32_t capacity = 0; // max in-flight requests; 0 = router default
    uint32_t maxQueue = 0; // waiting requests beyond capacity; 0 = router default
};

struct HeartbeatMetrics {
    bool ok = true;
    double load = 0.0;      // utilisation reported by the worker, 0..1 (may exceed 1)
    double latencyMs = 0.0; // probe round trip; 0 = not measured
    std::string error;
};

struct WorkerRequirements {
    std::unordered_set<std::string> exclude;
};

struct WorkerStats {
    std::string id;
    std::string address;
    WorkerHealthState state{WorkerHealthState::Registering};
    double load = 0.0;
    double latencyEwmaMs = 0.0;
    double errorRate = 0.0;
    uint32_t inFlight = 0;
    uint32_t queued = 0;
    uint64_t served = 0;
    uint64_t rejected = 0;
    uint64_t transitions = 0;
    std::string lastReason;
};

struct RouterConfig {
    // Selection score weights
    double load_weight = 0.4;
    double latency_weight = 0.4;
    double health_weight = 0.2;
    double latency_reference_ms = 100.0; // latency at which the latency term halves
    double degraded_health = 0.5;        // health term for Degraded (Healthy = 1)

    double slow_threshold_ms = 250.0;
    double ewma_alpha = 0.3;

    uint32_t capacity = 8;
    uint32_t max_queue = 32;

    WorkerHealthPolicy health;
};

class ResourceRouter;

/**
 * @brief One in-flight slot on a worker; released on destruction
 */
class WorkerLease {
public:
    WorkerLease() = default;
    ~WorkerLease();

    WorkerLease(WorkerLease&& other) noexcept;
    WorkerLease& operator=(WorkerLease&& other) noexcept;
    WorkerLease(const WorkerLease&) = delete;
    WorkerLease& operator=(const WorkerLease&) = delete;

    const std::string& workerId() const;
    bool valid() const { return static_cast<bool>(slot_); }
    void release();

private:
    friend class ResourceRouter;
    struct Slot;
    explicit WorkerLease(std::shared_ptr<Slot> slot) : slot_(std::move(slot)) {}

    std::shared_ptr<Slot> slot_;
};

/**
 * Tracks worker health and load and picks a backend per request.
 *
 * The worker table is copy-on-write and read through an atomic shared_ptr load, so selection
 * never blocks on heartbeat updates. Per-worker metrics are updated under that worker's own
 * mutex and mirrored into atomics the selection path reads.
 */
class ResourceRouter {
public:
    explicit ResourceRouter(const RouterConfig& config = {});
    ~ResourceRouter();

    ResourceRouter(const ResourceRouter&) = delete;
    ResourceRouter& operator=(const ResourceRouter&) = delete;

    Result<void> registerWorker(const WorkerNode& node);
    Result<void> deregisterWorker(const std::string& id);

    Result<void> heartbeat(const std::string& id, const HeartbeatMetrics& metrics);

    /// Feed the outcome of a served request (slow or failed responses degrade the worker)
    Result<void> recordResponse(const std::string& id, std::chrono::milliseconds latency,
                                bool success);

    /**
     * @brief Best selectable worker by composite score, round-robin among ties
     * @return NoAvailableWorker if no Healthy or Degraded worker remains
     */
    Result<WorkerNode> selectWorker(const WorkerRequirements& requirements = {});

    /**
     * @brief Reserve an in-flight slot on a worker
     *
     * Waits in the worker's bounded queue while it is at capacity. Overload when the queue is
     * full, Timeout when the deadline passes first.
     */
    Result<WorkerLease> acquire(const std::string& id,
                                std::chrono::steady_clock::time_point deadline);

    std::vector<WorkerStats> getWorkerStats() const;
    size_t workerCount() const;
    const RouterConfig& getConfig() const { return config_; }

    /// Composite selection score from explicit signals
    static double selectionScore(const RouterConfig& config, double load, double latencyMs,
                                 WorkerHealthState state);

private:
    struct Worker;
    using Table = std::vector<std::shared_ptr<Worker>>;

    std::shared_ptr<Worker> find(const std::string& id) const;
    void publishView(Worker& w);

    RouterConfig config_;
    std::mutex tableMutex_; // serialises table writers
    std::shared_ptr<const Table> table_;
    std::atomic<uint64_t> cursor_{0};
};

} // namespace synvec::daemon
