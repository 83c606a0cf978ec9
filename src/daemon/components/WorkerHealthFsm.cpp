// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/daemon/components/WorkerHealthFsm.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace synvec::daemon {

WorkerHealthFsm::WorkerHealthFsm(std::string workerId, WorkerHealthPolicy policy)
    : workerId_(std::move(workerId)), policy_(policy) {}

void WorkerHealthFsm::dispatch(const HeartbeatOkEvent&) {
    if (snap_.state == WorkerHealthState::Removed)
        return;
    snap_.consecutiveHeartbeatFailures = 0;
    ++snap_.goodHeartbeatStreak;

    switch (snap_.state) {
        case WorkerHealthState::Registering:
            transitionTo(WorkerHealthState::Healthy, "first heartbeat");
            break;
        case WorkerHealthState::Degraded:
        case WorkerHealthState::Unhealthy:
            if (snap_.goodHeartbeatStreak >= policy_.recovery_streak) {
                transitionTo(WorkerHealthState::Healthy,
                             std::to_string(snap_.goodHeartbeatStreak) + " good heartbeats");
            }
            break;
        default:
            break;
    }
}

void WorkerHealthFsm::dispatch(const HeartbeatFailedEvent& ev) {
    if (snap_.state == WorkerHealthState::Removed)
        return;
    snap_.goodHeartbeatStreak = 0;
    ++snap_.consecutiveHeartbeatFailures;
    ++snap_.consecutiveBadObservations;

    if (snap_.consecutiveHeartbeatFailures >= policy_.unhealthy_after) {
        if (snap_.state != WorkerHealthState::Unhealthy) {
            transitionTo(WorkerHealthState::Unhealthy,
                         std::to_string(snap_.consecutiveHeartbeatFailures) +
                             " consecutive heartbeat failures: " + ev.reason);
        }
        return;
    }
    if (snap_.state == WorkerHealthState::Healthy &&
        snap_.consecutiveBadObservations >= policy_.degrade_after) {
        transitionTo(WorkerHealthState::Degraded, "heartbeat failure: " + ev.reason);
    }
}

void WorkerHealthFsm::dispatch(const ResponseObservedEvent& ev) {
    if (snap_.state == WorkerHealthState::Removed)
        return;
    recordOutcome(!ev.ok);
    if (!ev.ok || ev.slow) {
        ++snap_.consecutiveBadObservations;
    } else {
        snap_.consecutiveBadObservations = 0;
    }

    bool selectable = isSelectable();
    if (selectable && snap_.errorSamples >= policy_.error_rate_min_samples &&
        snap_.errorRate > policy_.error_rate_threshold) {
        transitionTo(WorkerHealthState::Unhealthy,
                     "error rate " + std::to_string(snap_.errorRate) + " over " +
                         std::to_string(snap_.errorSamples) + " responses");
        return;
    }
    if (snap_.state == WorkerHealthState::Healthy &&
        snap_.consecutiveBadObservations >= policy_.degrade_after) {
        transitionTo(WorkerHealthState::Degraded,
                     std::to_string(snap_.consecutiveBadObservations) +
                         " consecutive slow or failed responses");
    }
}

void WorkerHealthFsm::dispatch(const DeregisteredEvent&) {
    if (snap_.state != WorkerHealthState::Removed)
        transitionTo(WorkerHealthState::Removed, "deregistered");
}

void WorkerHealthFsm::recordOutcome(bool error) {
    window_.push_back(error);
    if (error)
        ++windowErrors_;
    while (window_.size() > std::max<uint32_t>(policy_.error_window, 1)) {
        if (window_.front())
            --windowErrors_;
        window_.pop_front();
    }
    snap_.errorSamples = static_cast<uint32_t>(window_.size());
    snap_.errorRate = static_cast<double>(windowErrors_) / static_cast<double>(window_.size());
}

void WorkerHealthFsm::transitionTo(WorkerHealthState next, std::string reason) {
    auto prev = snap_.state;
    if (prev == next)
        return;
    snap_.state = next;
    ++snap_.transitions;
    snap_.lastReason = std::move(reason);

    // Each state starts a fresh observation window
    snap_.goodHeartbeatStreak = 0;
    snap_.consecutiveBadObservations = 0;
    if (next == WorkerHealthState::Healthy || next == WorkerHealthState::Unhealthy) {
        window_.clear();
        windowErrors_ = 0;
        snap_.errorSamples = 0;
        snap_.errorRate = 0.0;
    }

    if (next == WorkerHealthState::Unhealthy || next == WorkerHealthState::Degraded) {
        spdlog::warn("[WorkerHealth] {}: {} -> {} ({})", workerId_, toString(prev), toString(next),
                     snap_.lastReason);
    } else {
        spdlog::info("[WorkerHealth] {}: {} -> {} ({})", workerId_, toString(prev),
                     toString(next), snap_.lastReason);
    }
}

} // namespace synvec::daemon
