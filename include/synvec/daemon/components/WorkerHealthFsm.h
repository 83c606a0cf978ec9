// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>

namespace synvec::daemon {

enum class WorkerHealthState { Registering, Healthy, Degraded, Unhealthy, Removed };

constexpr std::string_view toString(WorkerHealthState s) {
    switch (s) {
        case WorkerHealthState::Registering:
            return "registering";
        case WorkerHealthState::Healthy:
            return "healthy";
        case WorkerHealthState::Degraded:
            return "degraded";
        case WorkerHealthState::Unhealthy:
            return "unhealthy";
        case WorkerHealthState::Removed:
            return "removed";
    }
    return "unknown";
}

struct WorkerHealthPolicy {
    uint32_t degrade_after = 3;    // consecutive slow or failed observations
    uint32_t unhealthy_after = 3;  // consecutive heartbeat failures
    uint32_t recovery_streak = 3;  // consecutive good heartbeats to return to Healthy
    double error_rate_threshold = 0.5;
    uint32_t error_rate_min_samples = 10;
    uint32_t error_window = 20; // most recent responses kept for the error rate
};

struct HealthSnapshot {
    WorkerHealthState state{WorkerHealthState::Registering};
    uint32_t consecutiveHeartbeatFailures{0};
    uint32_t consecutiveBadObservations{0};
    uint32_t goodHeartbeatStreak{0};
    double errorRate{0.0};
    uint32_t errorSamples{0};
    uint64_t transitions{0};
    std::string lastReason;
};

struct HeartbeatOkEvent {};
struct HeartbeatFailedEvent {
    std::string reason;
};
struct ResponseObservedEvent {
    bool ok{true};
    bool slow{false};
};
struct DeregisteredEvent {};

/**
 * Per-worker health state machine:
 *   Registering -> Healthy <-> Degraded -> Unhealthy -> Removed
 *
 * Every transition is driven by an observation and logged; counters are only reset by a
 * transition, never silently. Removed is terminal. Not thread-safe; the router guards it.
 */
class WorkerHealthFsm {
public:
    explicit WorkerHealthFsm(std::string workerId, WorkerHealthPolicy policy = {});

    HealthSnapshot snapshot() const { return snap_; }
    WorkerHealthState state() const { return snap_.state; }

    void dispatch(const HeartbeatOkEvent&);
    void dispatch(const HeartbeatFailedEvent& ev);
    void dispatch(const ResponseObservedEvent& ev);
    void dispatch(const DeregisteredEvent&);

    bool isSelectable() const {
        return snap_.state == WorkerHealthState::Healthy ||
               snap_.state == WorkerHealthState::Degraded;
    }

private:
    void transitionTo(WorkerHealthState next, std::string reason);
    void recordOutcome(bool error);

    std::string workerId_;
    WorkerHealthPolicy policy_;
    HealthSnapshot snap_{};
    std::deque<bool> window_; // true = error
    uint32_t windowErrors_{0};
};

} // namespace synvec::daemon
