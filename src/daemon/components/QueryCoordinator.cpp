// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/daemon/components/QueryCoordinator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>

namespace synvec::daemon {

// ============================================================================
// LocalSearchBackend
// ============================================================================

LocalSearchBackend::LocalSearchBackend(std::shared_ptr<search::SearchEngine> engine)
    : engine_(std::move(engine)) {}

Result<search::SearchResultSet> LocalSearchBackend::execute(const search::QueryContext& ctx,
                                                            const std::atomic<bool>* cancelled) {
    active_.fetch_add(1, std::memory_order_relaxed);
    struct ActiveGuard {
        std::atomic<uint32_t>& counter;
        ~ActiveGuard() { counter.fetch_sub(1, std::memory_order_relaxed); }
    } guard{active_};
    return engine_->execute(ctx, cancelled);
}

Result<HeartbeatMetrics> LocalSearchBackend::probe() {
    if (!engine_)
        return Error{ErrorCode::NotInitialized, "Backend has no engine"};
    HeartbeatMetrics m;
    m.ok = true;
    // Latency is left to the monitor; load is reported as in-flight executions
    m.load = static_cast<double>(active_.load(std::memory_order_relaxed));
    return m;
}

// ============================================================================
// QueryCoordinator
// ============================================================================

QueryCoordinator::QueryCoordinator(std::shared_ptr<search::SearchEngine> engine,
                                   std::shared_ptr<search::AdaptiveCache> cache,
                                   std::shared_ptr<ResourceRouter> router,
                                   std::shared_ptr<WorkerPool> pool,
                                   search::QueryProcessor processor,
                                   const CoordinatorConfig& config)
    : engine_(std::move(engine)), cache_(std::move(cache)), router_(std::move(router)),
      pool_(std::move(pool)), processor_(std::move(processor)), config_(config) {
    std::weak_ptr<search::AdaptiveCache> weakCache = cache_;
    engine_->setChangeListener([weakCache](const std::vector<PartId>& changed, size_t added) {
        auto cache = weakCache.lock();
        if (!cache)
            return;
        // New records may belong in any cached result set
        if (added > 0) {
            cache->clear();
            spdlog::debug("[Coordinator] {} new records, result cache cleared", added);
            return;
        }
        size_t dropped = 0;
        for (const auto& id : changed)
            dropped += cache->invalidate(id);
        if (dropped > 0)
            spdlog::debug("[Coordinator] invalidated {} cached result sets", dropped);
    });
}

QueryCoordinator::~QueryCoordinator() {
    engine_->setChangeListener(nullptr);
}

Result<void> QueryCoordinator::addBackend(const WorkerNode& node,
                                          std::shared_ptr<ISearchBackend> backend) {
    if (!backend)
        return Error{ErrorCode::InvalidArgument, "Backend for worker '" + node.id + "' is null"};
    {
        std::unique_lock lock(backendsMutex_);
        if (backends_.count(node.id))
            return Error{ErrorCode::InvalidState, "Worker already bound: " + node.id};
        backends_.emplace(node.id, std::move(backend));
    }
    auto registered = router_->registerWorker(node);
    if (!registered) {
        std::unique_lock lock(backendsMutex_);
        backends_.erase(node.id);
        return registered.error();
    }
    return Result<void>();
}

Result<void> QueryCoordinator::removeBackend(const std::string& workerId) {
    auto r = router_->deregisterWorker(workerId);
    std::unique_lock lock(backendsMutex_);
    backends_.erase(workerId);
    return r;
}

std::shared_ptr<ISearchBackend> QueryCoordinator::backendFor(const std::string& workerId) const {
    std::shared_lock lock(backendsMutex_);
    auto it = backends_.find(workerId);
    return it == backends_.end() ? nullptr : it->second;
}

void QueryCoordinator::recordLatency(std::chrono::steady_clock::time_point start) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                  std::chrono::steady_clock::now() - start)
                  .count();
    searches_.fetch_add(1, std::memory_order_relaxed);
    searchMicros_.fetch_add(static_cast<uint64_t>(std::max<int64_t>(us, 0)),
                            std::memory_order_relaxed);
}

Result<search::SearchResponse> QueryCoordinator::search(const SearchRequest& request) {
    const auto start = std::chrono::steady_clock::now();
    const auto timeout = std::min(
        request.timeout.count() > 0 ? request.timeout : config_.default_timeout,
        config_.max_timeout);
    const auto deadline = start + timeout;

    search::QueryContext ctx;
    ctx.rawText = request.query;
    ctx.query = processor_.optimize(request.query, !request.filters.empty());
    ctx.filters = request.filters;
    ctx.topK = std::clamp<size_t>(request.topK ? request.topK : config_.default_top_k, 1,
                                  std::max<size_t>(config_.max_top_k, 1));
    ctx.deadline = deadline;

    search::SearchResponse response;
    response.intent = ctx.query.intent;
    if (engine_->index()->isStale()) {
        response.warnings.push_back(
            Error{ErrorCode::StaleIndex, "Index snapshot is older than the freshness bound"});
        spdlog::warn("[Coordinator] serving '{}' from a stale index", request.query);
    }

    const auto key = search::CacheKey::fromQuery(ctx.query, ctx.filters, ctx.topK);
    // Read before the backend takes its snapshot; invalidations after this refuse the put
    const auto cacheGeneration = cache_->generation();
    if (auto cached = cache_->get(key)) {
        response.hits = (*cached)->hits;
        response.snapshotVersion = (*cached)->snapshotVersion;
        response.fromCache = true;
        response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        recordLatency(start);
        return response;
    }

    auto worker = router_->selectWorker();
    if (!worker) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[Coordinator] no worker for '{}': {}", request.query,
                     worker.error().message);
        recordLatency(start);
        return worker.error();
    }
    const std::string workerId = worker.value().id;

    auto lease = router_->acquire(workerId, deadline);
    if (!lease) {
        if (lease.error().code == ErrorCode::Timeout)
            timeouts_.fetch_add(1, std::memory_order_relaxed);
        else
            rejected_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[Coordinator] {} refused '{}': {}", workerId, request.query,
                     lease.error().message);
        recordLatency(start);
        return lease.error();
    }

    auto backend = backendFor(workerId);
    if (!backend) {
        recordLatency(start);
        return Error{ErrorCode::InvalidState, "Worker '" + workerId + "' has no backend"};
    }

    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    auto job = [backend, ctx, key, cancelled, workerId, cacheGeneration, cache = cache_,
                router = router_, slot = std::move(lease).value()]() mutable -> Result<search::SearchResultSet> {
        const auto t0 = std::chrono::steady_clock::now();
        Result<search::SearchResultSet> r = Error{ErrorCode::InternalError, "Query not run"};
        try {
            r = backend->execute(ctx, cancelled.get());
        } catch (const std::exception& e) {
            r = Error{ErrorCode::InternalError, e.what()};
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0);

        // Cancellation and deadline expiry are not the worker's fault
        bool workerOk = r || r.error().code == ErrorCode::OperationCancelled ||
                        r.error().code == ErrorCode::Timeout;
        if (auto fed = router->recordResponse(workerId, elapsed, workerOk); !fed)
            spdlog::debug("[Coordinator] {}: {}", workerId, fed.error().message);

        if (r) {
            auto set = std::make_shared<const search::SearchResultSet>(r.value());
            if (!cache->put(key, std::move(set), elapsed, cacheGeneration))
                spdlog::trace("[Coordinator] result for '{}' not cached", ctx.rawText);
        }
        slot.release();
        return r;
    };
    auto future = pool_->submit(std::move(job));

    if (future.wait_until(deadline) != std::future_status::ready) {
        cancelled->store(true, std::memory_order_relaxed);
        timeouts_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[Coordinator] '{}' on {} exceeded {} ms", request.query, workerId,
                     timeout.count());
        recordLatency(start);
        return Error{ErrorCode::Timeout, "Search exceeded its deadline"};
    }

    auto result = future.get();
    recordLatency(start);
    if (!result) {
        if (result.error().code == ErrorCode::Timeout)
            timeouts_.fetch_add(1, std::memory_order_relaxed);
        return result.error();
    }
    response.hits = std::move(result.value().hits);
    response.snapshotVersion = result.value().snapshotVersion;
    response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return response;
}

search::IngestReport QueryCoordinator::ingest(std::vector<metadata::PartRecord> batch) {
    return engine_->ingest(std::move(batch));
}

Result<void> QueryCoordinator::saveSnapshot(const std::filesystem::path& path) const {
    return engine_->index()->saveSnapshot(path);
}

Result<void> QueryCoordinator::loadSnapshot(const std::filesystem::path& path) {
    auto r = engine_->index()->loadSnapshot(path);
    if (r)
        cache_->clear();
    return r;
}

EngineStats QueryCoordinator::getIndexStats() const {
    auto index = engine_->index()->getStats();
    auto cache = cache_->getStats();

    EngineStats s;
    s.count = index.count;
    s.indexQueryLatencyMs = index.avgQueryLatencyMs;
    s.snapshotVersion = index.snapshotVersion;
    s.approximate = index.approximate;
    s.stale = engine_->index()->isStale();
    s.cacheHitRate = cache.hitRate();
    s.cacheEntries = cache.currentSize.load();
    s.cacheMemoryBytes = cache.memoryUsage.load();
    s.searches = searches_.load(std::memory_order_relaxed);
    s.timeouts = timeouts_.load(std::memory_order_relaxed);
    s.rejected = rejected_.load(std::memory_order_relaxed);
    if (s.searches > 0) {
        s.avgQueryLatencyMs = static_cast<double>(searchMicros_.load(std::memory_order_relaxed)) /
                              1000.0 / static_cast<double>(s.searches);
    }
    return s;
}

std::vector<WorkerStats> QueryCoordinator::getWorkerStats() const {
    return router_->getWorkerStats();
}

Result<HeartbeatMetrics> QueryCoordinator::probe(const std::string& workerId) {
    auto backend = backendFor(workerId);
    if (!backend)
        return Error{ErrorCode::NotFound, "No backend for worker: " + workerId};
    return backend->probe();
}

} // namespace synvec::daemon
