// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/core/types.h>
#include <synvec/daemon/components/ResourceRouter.h>
#include <synvec/daemon/components/WorkerPool.h>
#include <synvec/search/adaptive_cache.h>
#include <synvec/search/query_processor.h>
#include <synvec/search/search_engine.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace synvec::daemon {

/**
 * @brief Execution target behind a routed worker
 */
class ISearchBackend {
public:
    virtual ~ISearchBackend() = default;

    virtual Result<search::SearchResultSet> execute(const search::QueryContext& ctx,
                                                    const std::atomic<bool>* cancelled) = 0;

    /// Liveness and load probe used by the heartbeat monitor
    virtual Result<HeartbeatMetrics> probe() = 0;
};

/**
 * @brief In-process backend over a shared SearchEngine
 */
class LocalSearchBackend final : public ISearchBackend {
public:
    explicit LocalSearchBackend(std::shared_ptr<search::SearchEngine> engine);

    Result<search::SearchResultSet> execute(const search::QueryContext& ctx,
                                            const std::atomic<bool>* cancelled) override;
    Result<HeartbeatMetrics> probe() override;

private:
    std::shared_ptr<search::SearchEngine> engine_;
    std::atomic<uint32_t> active_{0};
};

struct CoordinatorConfig {
    size_t default_top_k = 10;
    size_t max_top_k = 100;
    std::chrono::milliseconds default_timeout{2000};
    std::chrono::milliseconds max_timeout{std::chrono::minutes(10)}; // request timeouts are capped here
};

struct SearchRequest {
    std::string query;
    search::SearchFilters filters;
    size_t topK = 0;                     // 0 = default_top_k
    std::chrono::milliseconds timeout{0}; // <= 0 = default_timeout, capped at max_timeout
};

/**
 * @brief Engine-wide statistics (getIndexStats)
 */
struct EngineStats {
    size_t count = 0;
    double avgQueryLatencyMs = 0.0;   // end to end, cache hits included
    double indexQueryLatencyMs = 0.0; // vector index only
    double cacheHitRate = 0.0;
    uint64_t snapshotVersion = 0;
    bool approximate = false;
    bool stale = false;
    size_t cacheEntries = 0;
    size_t cacheMemoryBytes = 0;
    uint64_t searches = 0;
    uint64_t timeouts = 0;
    uint64_t rejected = 0; // Overload or NoAvailableWorker
};

/**
 * Runs a search request end to end:
 *   optimize -> cache -> select worker -> acquire slot -> execute on the pool -> cache put
 *
 * The caller waits at most until its deadline; a late job is cancelled through its flag and the
 * caller gets Timeout. A job that completes still offers its result to the cache.
 */
class QueryCoordinator {
public:
    QueryCoordinator(std::shared_ptr<search::SearchEngine> engine,
                     std::shared_ptr<search::AdaptiveCache> cache,
                     std::shared_ptr<ResourceRouter> router, std::shared_ptr<WorkerPool> pool,
                     search::QueryProcessor processor = search::QueryProcessor{},
                     const CoordinatorConfig& config = {});
    ~QueryCoordinator();

    QueryCoordinator(const QueryCoordinator&) = delete;
    QueryCoordinator& operator=(const QueryCoordinator&) = delete;

    /// Register a worker with the router and bind it to a backend
    Result<void> addBackend(const WorkerNode& node, std::shared_ptr<ISearchBackend> backend);
    Result<void> removeBackend(const std::string& workerId);

    Result<search::SearchResponse> search(const SearchRequest& request);

    search::IngestReport ingest(std::vector<metadata::PartRecord> batch);

    Result<void> saveSnapshot(const std::filesystem::path& path) const;
    Result<void> loadSnapshot(const std::filesystem::path& path);

    EngineStats getIndexStats() const;
    std::vector<WorkerStats> getWorkerStats() const;

    /// Probe a registered worker's backend; used as the heartbeat probe
    Result<HeartbeatMetrics> probe(const std::string& workerId);

    const std::shared_ptr<search::SearchEngine>& engine() const { return engine_; }
    const std::shared_ptr<search::AdaptiveCache>& cache() const { return cache_; }
    const std::shared_ptr<ResourceRouter>& router() const { return router_; }
    const CoordinatorConfig& getConfig() const { return config_; }

private:
    std::shared_ptr<ISearchBackend> backendFor(const std::string& workerId) const;
    void recordLatency(std::chrono::steady_clock::time_point start);

    std::shared_ptr<search::SearchEngine> engine_;
    std::shared_ptr<search::AdaptiveCache> cache_;
    std::shared_ptr<ResourceRouter> router_;
    std::shared_ptr<WorkerPool> pool_;
    search::QueryProcessor processor_;
    CoordinatorConfig config_;

    mutable std::shared_mutex backendsMutex_;
    std::unordered_map<std::string, std::shared_ptr<ISearchBackend>> backends_;

    std::atomic<uint64_t> searches_{0};
    std::atomic<uint64_t> searchMicros_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace synvec::daemon
