// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/core/types.h>
#include <synvec/search/cache_key.h>
#include <synvec/search/cache_stats.h>
#include <synvec/search/search_results.h>

#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace synvec::search {

/**
 * @brief Configuration for the adaptive result cache
 */
struct AdaptiveCacheConfig {
    size_t max_memory_bytes = 64ull * 1024 * 1024; ///< Total budget, split evenly across shards
    size_t shards = 16;
    std::chrono::milliseconds ttl{std::chrono::seconds{300}};

    // Admission: windowed frequency estimate above admit_threshold, or recomputation cost
    // above cost_bound
    uint32_t admit_threshold = 1;
    uint32_t window = 10000; ///< Accesses per shard before sketch counters are halved
    std::chrono::milliseconds cost_bound{50};

    size_t eviction_sample = 8;                 ///< Entries sampled per eviction
    std::chrono::milliseconds sweep_interval{1000}; ///< Background TTL sweep period
};

/**
 * @brief Count-min sketch with periodic halving
 *
 * Approximates access frequency over a sliding window without storing keys. Not thread-safe;
 * each cache shard owns one under its lock.
 */
class FrequencySketch {
public:
    static constexpr size_t kRows = 4;

    FrequencySketch(size_t width, uint32_t window);

    void increment(uint64_t hash);
    uint32_t estimate(uint64_t hash) const;

    /// Halves every counter; called automatically every `window` increments
    void age();

    uint64_t resets() const { return resets_; }

private:
    size_t index(uint64_t hash, size_t row) const;

    size_t mask_;
    uint32_t window_;
    uint32_t additions_ = 0;
    uint64_t resets_ = 0;
    std::vector<uint16_t> table_; // kRows * (mask_ + 1)
};

/**
 * @brief Sharded, memory-bounded cache of ranked result sets
 *
 * get/put lock only the shard owning the key. Admission and eviction follow a TinyLFU-style
 * policy: frequency is tracked for every key seen, including misses, and eviction samples a
 * few resident entries and drops the least frequent. Entries expire after the TTL whatever
 * their frequency. invalidate(id) drops every entry whose result set contains that record.
 */
class AdaptiveCache : public std::enable_shared_from_this<AdaptiveCache> {
public:
    using Clock = std::chrono::steady_clock;

    explicit AdaptiveCache(const AdaptiveCacheConfig& config = {});
    ~AdaptiveCache();

    AdaptiveCache(const AdaptiveCache&) = delete;
    AdaptiveCache& operator=(const AdaptiveCache&) = delete;

    // ===== Core Operations =====

    /**
     * @brief Look up a result set; records the access for admission
     * @return nullopt on miss or expiry
     */
    std::optional<SearchResultSetPtr> get(const CacheKey& key);

    /**
     * @brief Offer a result set to the cache
     * @param cost time spent computing the value
     * @return true if stored; false when the admission policy declined (not an error)
     *
     * @param generation value of generation() read before the computation started; the put
     *        is refused if any invalidation happened since
     *
     * Idempotent: putting the same key again replaces the value and refreshes its TTL.
     */
    bool put(const CacheKey& key, SearchResultSetPtr value,
             std::chrono::milliseconds cost = std::chrono::milliseconds{0},
             std::optional<uint64_t> generation = std::nullopt);

    /// Drop every entry whose result set references the record
    size_t invalidate(const PartId& id);

    bool invalidateKey(const CacheKey& key);

    void clear();

    /// Advanced by every invalidate(), invalidateKey() and clear(), before any shard is touched
    uint64_t generation() const { return generation_.load(std::memory_order_acquire); }

    // ===== Maintenance =====

    /// Sweep expired entries and enforce the budget, one shard at a time
    size_t runMaintenance();

    /**
     * @brief Start a periodic runMaintenance() loop on the executor
     *
     * Requires the cache to be owned by a shared_ptr. Failures in a sweep are logged and the
     * loop continues.
     */
    Result<void> startMaintenance(boost::asio::any_io_executor executor);
    void stopMaintenance();

    // ===== Statistics =====

    CacheStats getStats() const;
    size_t size() const;
    size_t memoryUsage() const;
    const AdaptiveCacheConfig& getConfig() const { return config_; }

private:
    struct Entry {
        SearchResultSetPtr value;
        size_t bytes = 0;
        Clock::time_point expiresAt;
        Clock::time_point lastAccess;
        size_t samplePos = 0; // index into Shard::keys
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<CacheKey, Entry, CacheKeyHash> entries;
        std::vector<CacheKey> keys; // dense list for O(1) random sampling
        std::unordered_map<PartId, std::unordered_set<std::string>> byRecord;
        FrequencySketch sketch;
        size_t memory = 0;
        std::minstd_rand rng;

        Shard(size_t sketchWidth, uint32_t window, uint32_t seed)
            : sketch(sketchWidth, window), rng(seed) {}
    };

    Shard& shardFor(const CacheKey& key) const;
    size_t entryBytes(const CacheKey& key, const SearchResultSet& value) const;

    // Callers hold shard.mutex
    void eraseLocked(Shard& shard, const CacheKey& key);
    bool evictOneLocked(Shard& shard, Clock::time_point now);
    size_t sweepLocked(Shard& shard, Clock::time_point now);

    AdaptiveCacheConfig config_;
    size_t shardBudget_;
    std::vector<std::unique_ptr<Shard>> shards_;
    mutable CacheStats stats_;
    std::atomic<uint64_t> generation_{0};
    std::shared_ptr<std::atomic<bool>> stopMaintenance_;
};

} // namespace synvec::search
