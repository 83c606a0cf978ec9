// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <synvec/daemon/components/ResourceRouter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <thread>
#include <vector>

using namespace synvec;
using namespace synvec::daemon;
using namespace std::chrono_literals;

namespace {

HeartbeatMetrics ok(double load = 0.0, double latencyMs = 10.0) {
    HeartbeatMetrics m;
    m.ok = true;
    m.load = load;
    m.latencyMs = latencyMs;
    return m;
}

HeartbeatMetrics failed() {
    HeartbeatMetrics m;
    m.ok = false;
    m.error = "probe timed out";
    return m;
}

} // namespace

class ResourceRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* id : {"worker-1", "worker-2", "worker-3"}) {
            ASSERT_TRUE(router_.registerWorker({id, std::string("inproc://") + id, 2, 1}));
            ASSERT_TRUE(router_.heartbeat(id, ok()));
        }
    }

    std::map<std::string, int> selectMany(int n) {
        std::map<std::string, int> counts;
        for (int i = 0; i < n; ++i) {
            auto w = router_.selectWorker();
            if (w)
                ++counts[w.value().id];
        }
        return counts;
    }

    ResourceRouter router_;
};

TEST_F(ResourceRouterTest, RegistrationValidates) {
    auto dup = router_.registerWorker({"worker-1", "inproc://again"});
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error().code, ErrorCode::InvalidState);

    auto empty = router_.registerWorker({"", "inproc://none"});
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(router_.workerCount(), 3u);
}

TEST_F(ResourceRouterTest, RegisteringWorkerIsNotSelectable) {
    ResourceRouter router;
    ASSERT_TRUE(router.registerWorker({"fresh", "inproc://fresh"}));
    auto w = router.selectWorker();
    ASSERT_FALSE(w);
    EXPECT_EQ(w.error().code, ErrorCode::NoAvailableWorker);

    ASSERT_TRUE(router.heartbeat("fresh", ok()));
    EXPECT_TRUE(router.selectWorker());
}

TEST_F(ResourceRouterTest, EqualWorkersAreRoundRobined) {
    auto counts = selectMany(30);
    ASSERT_EQ(counts.size(), 3u);
    for (const auto& [id, n] : counts)
        EXPECT_EQ(n, 10) << id;
}

TEST_F(ResourceRouterTest, LighterAndFasterWorkerWins) {
    ASSERT_TRUE(router_.heartbeat("worker-1", ok(0.9, 200.0)));
    ASSERT_TRUE(router_.heartbeat("worker-2", ok(0.1, 5.0)));
    ASSERT_TRUE(router_.heartbeat("worker-3", ok(0.9, 200.0)));
    auto w = router_.selectWorker();
    ASSERT_TRUE(w);
    EXPECT_EQ(w.value().id, "worker-2");
}

TEST_F(ResourceRouterTest, SelectionScoreOrdersSignals) {
    RouterConfig cfg;
    auto healthy = ResourceRouter::selectionScore(cfg, 0.0, 0.0, WorkerHealthState::Healthy);
    auto degraded = ResourceRouter::selectionScore(cfg, 0.0, 0.0, WorkerHealthState::Degraded);
    auto loaded = ResourceRouter::selectionScore(cfg, 1.0, 0.0, WorkerHealthState::Healthy);
    auto slow = ResourceRouter::selectionScore(cfg, 0.0, 100.0, WorkerHealthState::Healthy);
    EXPECT_DOUBLE_EQ(healthy, 1.0);
    EXPECT_LT(degraded, healthy);
    EXPECT_DOUBLE_EQ(loaded, 0.8);
    EXPECT_DOUBLE_EQ(slow, 0.8);
}

TEST_F(ResourceRouterTest, FailingWorkerAvoidedUntilRecoveryStreak) {
    for (int i = 0; i < 5; ++i)
        ASSERT_TRUE(router_.heartbeat("worker-2", failed()));

    auto counts = selectMany(60);
    EXPECT_EQ(counts.count("worker-2"), 0u);
    EXPECT_EQ(counts["worker-1"] + counts["worker-3"], 60);

    ASSERT_TRUE(router_.heartbeat("worker-2", ok()));
    ASSERT_TRUE(router_.heartbeat("worker-2", ok()));
    EXPECT_EQ(selectMany(30).count("worker-2"), 0u);

    ASSERT_TRUE(router_.heartbeat("worker-2", ok()));
    EXPECT_GT(selectMany(30).count("worker-2"), 0u);

    auto stats = router_.getWorkerStats();
    ASSERT_EQ(stats.size(), 3u);
    EXPECT_EQ(stats[1].id, "worker-2");
    EXPECT_EQ(stats[1].state, WorkerHealthState::Healthy);
}

TEST_F(ResourceRouterTest, DegradedPreferredOverNothingButNotOverHealthy) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(router_.recordResponse("worker-1", 400ms, true));
    }
    auto stats = router_.getWorkerStats();
    EXPECT_EQ(stats[0].state, WorkerHealthState::Degraded);
    EXPECT_EQ(selectMany(20).count("worker-1"), 0u);

    for (const char* id : {"worker-2", "worker-3"})
        for (int i = 0; i < 3; ++i)
            ASSERT_TRUE(router_.heartbeat(id, failed()));
    auto w = router_.selectWorker();
    ASSERT_TRUE(w);
    EXPECT_EQ(w.value().id, "worker-1");
}

TEST_F(ResourceRouterTest, AllUnhealthyFailsWithNoAvailableWorker) {
    for (const char* id : {"worker-1", "worker-2", "worker-3"})
        for (int i = 0; i < 3; ++i)
            ASSERT_TRUE(router_.heartbeat(id, failed()));
    auto w = router_.selectWorker();
    ASSERT_FALSE(w);
    EXPECT_EQ(w.error().code, ErrorCode::NoAvailableWorker);
}

TEST_F(ResourceRouterTest, ExcludedWorkersAreSkipped) {
    WorkerRequirements req;
    req.exclude = {"worker-1", "worker-3"};
    for (int i = 0; i < 5; ++i) {
        auto w = router_.selectWorker(req);
        ASSERT_TRUE(w);
        EXPECT_EQ(w.value().id, "worker-2");
    }
}

TEST_F(ResourceRouterTest, UnknownWorkerIsNotFound) {
    EXPECT_EQ(router_.heartbeat("ghost", ok()).error().code, ErrorCode::NotFound);
    EXPECT_EQ(router_.recordResponse("ghost", 1ms, true).error().code, ErrorCode::NotFound);
    EXPECT_EQ(router_.acquire("ghost", std::chrono::steady_clock::now() + 10ms).error().code,
              ErrorCode::NotFound);
    EXPECT_EQ(router_.deregisterWorker("ghost").error().code, ErrorCode::NotFound);
}

TEST_F(ResourceRouterTest, FullQueueIsOverload) {
    auto deadline = std::chrono::steady_clock::now() + 2s;
    auto a = router_.acquire("worker-1", deadline);
    auto b = router_.acquire("worker-1", deadline);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);

    // Capacity 2 is used; one caller may wait in the queue of 1
    auto waiter = std::async(std::launch::async,
                             [&] { return router_.acquire("worker-1", deadline); });
    ASSERT_TRUE(std::chrono::steady_clock::now() < deadline);
    bool queued = false;
    for (int i = 0; i < 200 && !queued; ++i) {
        queued = router_.getWorkerStats()[0].queued == 1;
        if (!queued)
            std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(queued);

    auto rejected = router_.acquire("worker-1", deadline);
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code, ErrorCode::Overload);

    a.value().release();
    auto admitted = waiter.get();
    ASSERT_TRUE(admitted);
    EXPECT_EQ(admitted.value().workerId(), "worker-1");
    EXPECT_EQ(router_.getWorkerStats()[0].rejected, 1u);
}

TEST_F(ResourceRouterTest, WaitingPastDeadlineIsTimeout) {
    auto far = std::chrono::steady_clock::now() + 2s;
    auto a = router_.acquire("worker-3", far);
    auto b = router_.acquire("worker-3", far);
    ASSERT_TRUE(a && b);
    auto r = router_.acquire("worker-3", std::chrono::steady_clock::now() + 30ms);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
}

TEST_F(ResourceRouterTest, LeaseReleasesOnDestruction) {
    auto deadline = std::chrono::steady_clock::now() + 1s;
    {
        auto a = router_.acquire("worker-2", deadline);
        ASSERT_TRUE(a);
        EXPECT_EQ(router_.getWorkerStats()[1].inFlight, 1u);
        auto moved = std::move(a).value();
        EXPECT_TRUE(moved.valid());
    }
    EXPECT_EQ(router_.getWorkerStats()[1].inFlight, 0u);
    EXPECT_EQ(router_.getWorkerStats()[1].served, 1u);
}

TEST_F(ResourceRouterTest, DeregisterWakesWaiters) {
    auto far = std::chrono::steady_clock::now() + 5s;
    auto a = router_.acquire("worker-1", far);
    auto b = router_.acquire("worker-1", far);
    ASSERT_TRUE(a && b);
    auto waiter = std::async(std::launch::async, [&] { return router_.acquire("worker-1", far); });
    std::this_thread::sleep_for(30ms);
    ASSERT_TRUE(router_.deregisterWorker("worker-1"));
    auto r = waiter.get();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_EQ(router_.workerCount(), 2u);
}

TEST_F(ResourceRouterTest, HeartbeatLatencyIsSmoothed) {
    ASSERT_TRUE(router_.heartbeat("worker-1", ok(0.0, 100.0)));
    auto before = router_.getWorkerStats()[0].latencyEwmaMs;
    ASSERT_TRUE(router_.heartbeat("worker-1", ok(0.0, 200.0)));
    auto after = router_.getWorkerStats()[0].latencyEwmaMs;
    EXPECT_GT(after, before);
    EXPECT_LT(after, 200.0);
}

TEST_F(ResourceRouterTest, ConcurrentSelectionWhileHealthFlaps) {
    for (int i = 0; i < 3; ++i)
        ASSERT_TRUE(router_.heartbeat("worker-3", failed()));

    std::atomic<bool> stop{false};
    std::thread flapper([&] {
        for (int rounds = 0; !stop.load() || rounds < 10; ++rounds) {
            for (int i = 0; i < 3; ++i)
                (void)router_.heartbeat("worker-2", failed());
            for (int i = 0; i < 3; ++i)
                (void)router_.heartbeat("worker-2", ok());
            (void)router_.getWorkerStats();
        }
    });

    std::atomic<int> pickedUnhealthy{0};
    std::atomic<int> noWorker{0};
    std::atomic<int> served{0};
    std::vector<std::thread> selectors;
    for (int t = 0; t < 4; ++t) {
        selectors.emplace_back([&] {
            for (int i = 0; i < 2000; ++i) {
                auto w = router_.selectWorker();
                if (!w) {
                    ++noWorker;
                    continue;
                }
                if (w.value().id == "worker-3")
                    ++pickedUnhealthy;
                auto lease = router_.acquire(w.value().id,
                                             std::chrono::steady_clock::now() + 20ms);
                if (lease) {
                    ++served;
                    (void)router_.recordResponse(w.value().id, 1ms, true);
                }
            }
        });
    }
    for (auto& th : selectors)
        th.join();
    stop = true;
    flapper.join();

    // worker-1 stays healthy throughout, so a selection never comes back empty
    EXPECT_EQ(pickedUnhealthy.load(), 0);
    EXPECT_EQ(noWorker.load(), 0);
    EXPECT_GT(served.load(), 0);

    auto stats = router_.getWorkerStats();
    ASSERT_EQ(stats.size(), 3u);
    for (const auto& w : stats) {
        EXPECT_EQ(w.inFlight, 0u) << w.id;
        EXPECT_EQ(w.queued, 0u) << w.id;
    }
    EXPECT_EQ(stats[2].state, WorkerHealthState::Unhealthy);
    EXPECT_GT(stats[1].transitions, 2u);
}
