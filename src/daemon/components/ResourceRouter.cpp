// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/daemon/components/ResourceRouter.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace synvec::daemon {

namespace detail {

// Bounded admission for one worker: capacity in-flight slots plus a bounded wait queue
struct AdmissionGate {
    std::mutex mutex;
    std::condition_variable cv;
    uint32_t capacity = 1;
    uint32_t maxQueue = 0;
    bool closed = false;
    std::atomic<uint32_t> inFlight{0}; // written under mutex, read lock-free
    std::atomic<uint32_t> queued{0};
    std::atomic<uint64_t> served{0};
    std::atomic<uint64_t> rejected{0};
};

} // namespace detail

// ============================================================================
// WorkerLease
// ============================================================================

struct WorkerLease::Slot {
    std::string workerId;
    std::shared_ptr<detail::AdmissionGate> gate;

    ~Slot() {
        {
            std::lock_guard<std::mutex> lk(gate->mutex);
            gate->inFlight.fetch_sub(1, std::memory_order_relaxed);
        }
        gate->cv.notify_one();
    }
};

WorkerLease::~WorkerLease() = default;
WorkerLease::WorkerLease(WorkerLease&& other) noexcept = default;
WorkerLease& WorkerLease::operator=(WorkerLease&& other) noexcept = default;

const std::string& WorkerLease::workerId() const {
    static const std::string kEmpty;
    return slot_ ? slot_->workerId : kEmpty;
}

void WorkerLease::release() {
    slot_.reset();
}

// ============================================================================
// ResourceRouter
// ============================================================================

struct ResourceRouter::Worker {
    WorkerNode node;
    std::mutex mutex; // guards fsm and the EWMA state
    WorkerHealthFsm fsm;
    bool hasLatency = false;
    double latencyEwma = 0.0;
    bool hasLoad = false;
    double loadEwma = 0.0;
    std::shared_ptr<detail::AdmissionGate> gate;

    // Mirrors read by selectWorker without taking the mutex
    std::atomic<int> stateView{static_cast<int>(WorkerHealthState::Registering)};
    std::atomic<double> loadView{0.0};
    std::atomic<double> latencyView{0.0};

    Worker(WorkerNode n, const WorkerHealthPolicy& policy)
        : node(std::move(n)), fsm(node.id, policy),
          gate(std::make_shared<detail::AdmissionGate>()) {}
};

namespace {

// First sample seeds the average
double ewma(bool& seeded, double current, double sample, double alpha) {
    if (!seeded) {
        seeded = true;
        return sample;
    }
    return alpha * sample + (1.0 - alpha) * current;
}

} // namespace

ResourceRouter::ResourceRouter(const RouterConfig& config)
    : config_(config), table_(std::make_shared<const Table>()) {}

ResourceRouter::~ResourceRouter() = default;

double ResourceRouter::selectionScore(const RouterConfig& config, double load, double latencyMs,
                                      WorkerHealthState state) {
    double health = 0.0;
    if (state == WorkerHealthState::Healthy)
        health = 1.0;
    else if (state == WorkerHealthState::Degraded)
        health = config.degraded_health;
    double ref = config.latency_reference_ms > 0.0 ? config.latency_reference_ms : 1.0;
    return config.load_weight / (1.0 + std::max(0.0, load)) +
           config.latency_weight / (1.0 + std::max(0.0, latencyMs) / ref) +
           config.health_weight * health;
}

std::shared_ptr<ResourceRouter::Worker> ResourceRouter::find(const std::string& id) const {
    auto table = std::atomic_load(&table_);
    for (const auto& w : *table) {
        if (w->node.id == id)
            return w;
    }
    return nullptr;
}

void ResourceRouter::publishView(Worker& w) {
    w.stateView.store(static_cast<int>(w.fsm.state()), std::memory_order_release);
    w.loadView.store(w.loadEwma, std::memory_order_relaxed);
    w.latencyView.store(w.latencyEwma, std::memory_order_relaxed);
}

Result<void> ResourceRouter::registerWorker(const WorkerNode& node) {
    if (node.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Worker id must not be empty"};
    }
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto current = std::atomic_load(&table_);
    for (const auto& w : *current) {
        if (w->node.id == node.id) {
            return Error{ErrorCode::InvalidState, "Worker already registered: " + node.id};
        }
    }

    WorkerNode n = node;
    if (n.capacity == 0)
        n.capacity = config_.capacity;
    if (n.maxQueue == 0)
        n.maxQueue = config_.max_queue;
    auto worker = std::make_shared<Worker>(n, config_.health);
    worker->gate->capacity = std::max<uint32_t>(n.capacity, 1);
    worker->gate->maxQueue = n.maxQueue;

    auto next = std::make_shared<Table>(*current);
    next->push_back(std::move(worker));
    std::atomic_store(&table_, std::shared_ptr<const Table>(std::move(next)));
    spdlog::info("[Router] registered worker {} at {} (capacity {}, queue {})", n.id, n.address,
                 n.capacity, n.maxQueue);
    return Result<void>();
}

Result<void> ResourceRouter::deregisterWorker(const std::string& id) {
    std::shared_ptr<Worker> removed;
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        auto current = std::atomic_load(&table_);
        auto next = std::make_shared<Table>();
        next->reserve(current->size());
        for (const auto& w : *current) {
            if (w->node.id == id)
                removed = w;
            else
                next->push_back(w);
        }
        if (!removed) {
            return Error{ErrorCode::NotFound, "Unknown worker: " + id};
        }
        std::atomic_store(&table_, std::shared_ptr<const Table>(std::move(next)));
    }
    {
        std::lock_guard<std::mutex> lk(removed->mutex);
        removed->fsm.dispatch(DeregisteredEvent{});
        publishView(*removed);
    }
    {
        std::lock_guard<std::mutex> lk(removed->gate->mutex);
        removed->gate->closed = true;
    }
    removed->gate->cv.notify_all();
    return Result<void>();
}

Result<void> ResourceRouter::heartbeat(const std::string& id, const HeartbeatMetrics& metrics) {
    auto w = find(id);
    if (!w) {
        return Error{ErrorCode::NotFound, "Unknown worker: " + id};
    }
    std::lock_guard<std::mutex> lk(w->mutex);
    if (metrics.ok) {
        w->fsm.dispatch(HeartbeatOkEvent{});
        w->loadEwma = ewma(w->hasLoad, w->loadEwma, metrics.load, config_.ewma_alpha);
        if (metrics.latencyMs > 0.0) {
            w->latencyEwma =
                ewma(w->hasLatency, w->latencyEwma, metrics.latencyMs, config_.ewma_alpha);
        }
    } else {
        w->fsm.dispatch(HeartbeatFailedEvent{metrics.error.empty() ? "probe failed" : metrics.error});
    }
    publishView(*w);
    return Result<void>();
}

Result<void> ResourceRouter::recordResponse(const std::string& id,
                                            std::chrono::milliseconds latency, bool success) {
    auto w = find(id);
    if (!w) {
        return Error{ErrorCode::NotFound, "Unknown worker: " + id};
    }
    auto ms = static_cast<double>(latency.count());
    std::lock_guard<std::mutex> lk(w->mutex);
    w->latencyEwma = ewma(w->hasLatency, w->latencyEwma, ms, config_.ewma_alpha);
    w->fsm.dispatch(ResponseObservedEvent{success, ms > config_.slow_threshold_ms});
    publishView(*w);
    return Result<void>();
}

Result<WorkerNode> ResourceRouter::selectWorker(const WorkerRequirements& requirements) {
    auto table = std::atomic_load(&table_);

    constexpr double kTieEpsilon = 1e-9;
    double best = -1.0;
    std::vector<const Worker*> tied;
    for (const auto& w : *table) {
        if (requirements.exclude.count(w->node.id))
            continue;
        auto state = static_cast<WorkerHealthState>(w->stateView.load(std::memory_order_acquire));
        if (state != WorkerHealthState::Healthy && state != WorkerHealthState::Degraded)
            continue;

        const auto& g = *w->gate;
        double occupancy = static_cast<double>(g.inFlight.load(std::memory_order_relaxed) +
                                               g.queued.load(std::memory_order_relaxed)) /
                           static_cast<double>(g.capacity);
        double load = std::max(w->loadView.load(std::memory_order_relaxed), occupancy);
        double score = selectionScore(config_, load,
                                      w->latencyView.load(std::memory_order_relaxed), state);
        if (score > best + kTieEpsilon) {
            best = score;
            tied.clear();
            tied.push_back(w.get());
        } else if (std::fabs(score - best) <= kTieEpsilon) {
            tied.push_back(w.get());
        }
    }

    if (tied.empty()) {
        spdlog::warn("[Router] no selectable worker among {}", table->size());
        return Error{ErrorCode::NoAvailableWorker, "No healthy or degraded worker available"};
    }
    auto pick = cursor_.fetch_add(1, std::memory_order_relaxed) % tied.size();
    return tied[pick]->node;
}

Result<WorkerLease> ResourceRouter::acquire(const std::string& id,
                                            std::chrono::steady_clock::time_point deadline) {
    auto w = find(id);
    if (!w) {
        return Error{ErrorCode::NotFound, "Unknown worker: " + id};
    }
    auto gate = w->gate;
    std::unique_lock<std::mutex> lk(gate->mutex);
    if (gate->closed) {
        return Error{ErrorCode::NotFound, "Worker deregistered: " + id};
    }

    if (gate->inFlight.load(std::memory_order_relaxed) >= gate->capacity) {
        if (gate->queued.load(std::memory_order_relaxed) >= gate->maxQueue) {
            gate->rejected.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("[Router] worker {} overloaded ({} in flight, {} queued)", id,
                         gate->inFlight.load(), gate->queued.load());
            return Error{ErrorCode::Overload, "Worker " + id + " queue is full"};
        }
        gate->queued.fetch_add(1, std::memory_order_relaxed);
        bool admitted = gate->cv.wait_until(lk, deadline, [&gate]() {
            return gate->closed || gate->inFlight.load(std::memory_order_relaxed) < gate->capacity;
        });
        gate->queued.fetch_sub(1, std::memory_order_relaxed);
        if (gate->closed) {
            return Error{ErrorCode::NotFound, "Worker deregistered: " + id};
        }
        if (!admitted) {
            return Error{ErrorCode::Timeout, "Deadline passed waiting for worker " + id};
        }
    }

    gate->inFlight.fetch_add(1, std::memory_order_relaxed);
    gate->served.fetch_add(1, std::memory_order_relaxed);
    auto slot = std::make_shared<WorkerLease::Slot>();
    slot->workerId = id;
    slot->gate = gate;
    return WorkerLease(std::move(slot));
}

std::vector<WorkerStats> ResourceRouter::getWorkerStats() const {
    auto table = std::atomic_load(&table_);
    std::vector<WorkerStats> out;
    out.reserve(table->size());
    for (const auto& w : *table) {
        WorkerStats s;
        s.id = w->node.id;
        s.address = w->node.address;
        {
            std::lock_guard<std::mutex> lk(w->mutex);
            auto snap = w->fsm.snapshot();
            s.state = snap.state;
            s.errorRate = snap.errorRate;
            s.transitions = snap.transitions;
            s.lastReason = snap.lastReason;
            s.load = w->loadEwma;
            s.latencyEwmaMs = w->latencyEwma;
        }
        s.inFlight = w->gate->inFlight.load(std::memory_order_relaxed);
        s.queued = w->gate->queued.load(std::memory_order_relaxed);
        s.served = w->gate->served.load(std::memory_order_relaxed);
        s.rejected = w->gate->rejected.load(std::memory_order_relaxed);
        out.push_back(std::move(s));
    }
    std::sort(out.begin(), out.end(),
              [](const WorkerStats& a, const WorkerStats& b) { return a.id < b.id; });
    return out;
}

size_t ResourceRouter::workerCount() const {
    return std::atomic_load(&table_)->size();
}

} // namespace synvec::daemon
