// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/search/adaptive_cache.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace synvec::search {

namespace {

size_t nextPow2(size_t v) {
    size_t p = 1;
    while (p < v)
        p <<= 1;
    return p;
}

uint64_t mix64(uint64_t h) {
    h ^= h >> 33;
    h *= 0xff51afd7ed558ccdULL;
    h ^= h >> 33;
    h *= 0xc4ceb9fe1a85ec53ULL;
    h ^= h >> 33;
    return h;
}

} // namespace

// ============================================================================
// FrequencySketch
// ============================================================================

FrequencySketch::FrequencySketch(size_t width, uint32_t window)
    : mask_(nextPow2(std::max<size_t>(width, 16)) - 1), window_(std::max<uint32_t>(window, 1)),
      table_(kRows * (mask_ + 1), 0) {}

size_t FrequencySketch::index(uint64_t hash, size_t row) const {
    auto h = mix64(hash + (row + 1) * 0x9E3779B97F4A7C15ULL);
    return row * (mask_ + 1) + static_cast<size_t>(h & mask_);
}

void FrequencySketch::increment(uint64_t hash) {
    for (size_t r = 0; r < kRows; ++r) {
        auto& c = table_[index(hash, r)];
        if (c < std::numeric_limits<uint16_t>::max())
            ++c;
    }
    if (++additions_ >= window_)
        age();
}

uint32_t FrequencySketch::estimate(uint64_t hash) const {
    uint32_t best = std::numeric_limits<uint32_t>::max();
    for (size_t r = 0; r < kRows; ++r)
        best = std::min<uint32_t>(best, table_[index(hash, r)]);
    return best;
}

void FrequencySketch::age() {
    for (auto& c : table_)
        c = static_cast<uint16_t>(c >> 1);
    additions_ /= 2;
    ++resets_;
}

// ============================================================================
// AdaptiveCache
// ============================================================================

AdaptiveCache::AdaptiveCache(const AdaptiveCacheConfig& config) : config_(config) {
    if (config_.shards == 0)
        config_.shards = 1;
    shardBudget_ = config_.max_memory_bytes / config_.shards;
    size_t sketchWidth = std::max<size_t>(64, config_.window / 2);
    shards_.reserve(config_.shards);
    for (size_t i = 0; i < config_.shards; ++i) {
        shards_.push_back(std::make_unique<Shard>(sketchWidth, config_.window,
                                                  static_cast<uint32_t>(i + 1)));
    }
    stats_.maxMemory = config_.max_memory_bytes;
    spdlog::debug("AdaptiveCache: {} shards, {} bytes each, ttl {} ms", config_.shards,
                  shardBudget_, config_.ttl.count());
}

AdaptiveCache::~AdaptiveCache() {
    stopMaintenance();
}

AdaptiveCache::Shard& AdaptiveCache::shardFor(const CacheKey& key) const {
    return *shards_[mix64(key.hash()) % shards_.size()];
}

size_t AdaptiveCache::entryBytes(const CacheKey& key, const SearchResultSet& value) const {
    // Key is held by the entry map and the sample list; each hit adds a reverse-index slot
    size_t bytes = sizeof(Entry) + 2 * (sizeof(CacheKey) + key.toString().capacity());
    bytes += value.estimatedBytes();
    for (const auto& h : value.hits)
        bytes += h.id.size() + key.toString().size() + 64;
    return bytes;
}

std::optional<SearchResultSetPtr> AdaptiveCache::get(const CacheKey& key) {
    auto now = Clock::now();
    auto& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.sketch.increment(key.hash());

    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
        stats_.misses.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    if (now >= it->second.expiresAt) {
        eraseLocked(shard, key);
        stats_.ttlExpirations.fetch_add(1, std::memory_order_relaxed);
        stats_.misses.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    it->second.lastAccess = now;
    stats_.hits.fetch_add(1, std::memory_order_relaxed);
    return it->second.value;
}

bool AdaptiveCache::put(const CacheKey& key, SearchResultSetPtr value,
                        std::chrono::milliseconds cost, std::optional<uint64_t> generation) {
    if (!value)
        return false;
    auto now = Clock::now();
    auto& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    // An invalidation bumps the generation before it locks any shard, so a stale value is
    // either refused here or inserted early enough for that invalidation to remove it
    if (generation && *generation != generation_.load(std::memory_order_acquire)) {
        stats_.stalePuts.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    bool resident = shard.entries.count(key) > 0;
    if (!resident) {
        auto freq = shard.sketch.estimate(key.hash());
        bool admit = freq > config_.admit_threshold || cost > config_.cost_bound;
        if (!admit) {
            stats_.rejections.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
    } else {
        eraseLocked(shard, key);
    }

    auto bytes = entryBytes(key, *value);
    if (bytes > shardBudget_) {
        spdlog::debug("AdaptiveCache: result set of {} bytes exceeds shard budget {}", bytes,
                      shardBudget_);
        stats_.rejections.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    while (shard.memory + bytes > shardBudget_ && evictOneLocked(shard, now)) {
    }
    if (shard.memory + bytes > shardBudget_) {
        stats_.rejections.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    Entry e;
    e.bytes = bytes;
    e.expiresAt = now + config_.ttl;
    e.lastAccess = now;
    e.samplePos = shard.keys.size();
    for (const auto& h : value->hits)
        shard.byRecord[h.id].insert(key.toString());
    e.value = std::move(value);
    shard.keys.push_back(key);
    shard.entries.emplace(key, std::move(e));
    shard.memory += bytes;

    stats_.insertions.fetch_add(1, std::memory_order_relaxed);
    stats_.currentSize.fetch_add(1, std::memory_order_relaxed);
    stats_.memoryUsage.fetch_add(bytes, std::memory_order_relaxed);
    return true;
}

void AdaptiveCache::eraseLocked(Shard& shard, const CacheKey& key) {
    auto it = shard.entries.find(key);
    if (it == shard.entries.end())
        return;

    auto pos = it->second.samplePos;
    if (pos + 1 != shard.keys.size()) {
        shard.keys[pos] = std::move(shard.keys.back());
        shard.entries.find(shard.keys[pos])->second.samplePos = pos;
    }
    shard.keys.pop_back();

    if (it->second.value) {
        for (const auto& h : it->second.value->hits) {
            auto r = shard.byRecord.find(h.id);
            if (r == shard.byRecord.end())
                continue;
            r->second.erase(key.toString());
            if (r->second.empty())
                shard.byRecord.erase(r);
        }
    }

    shard.memory -= it->second.bytes;
    stats_.memoryUsage.fetch_sub(it->second.bytes, std::memory_order_relaxed);
    stats_.currentSize.fetch_sub(1, std::memory_order_relaxed);
    shard.entries.erase(it);
}

bool AdaptiveCache::evictOneLocked(Shard& shard, Clock::time_point now) {
    if (shard.keys.empty())
        return false;

    std::uniform_int_distribution<size_t> pick(0, shard.keys.size() - 1);
    size_t samples = std::min(std::max<size_t>(config_.eviction_sample, 1), shard.keys.size());

    const CacheKey* victim = nullptr;
    uint32_t victimFreq = 0;
    Clock::time_point victimAccess;
    for (size_t i = 0; i < samples; ++i) {
        const auto& candidate = shard.keys[pick(shard.rng)];
        const auto& entry = shard.entries.find(candidate)->second;
        if (now >= entry.expiresAt) {
            CacheKey expired = candidate;
            eraseLocked(shard, expired);
            stats_.ttlExpirations.fetch_add(1, std::memory_order_relaxed);
            return true;
        }
        auto freq = shard.sketch.estimate(candidate.hash());
        if (!victim || freq < victimFreq ||
            (freq == victimFreq && entry.lastAccess < victimAccess)) {
            victim = &candidate;
            victimFreq = freq;
            victimAccess = entry.lastAccess;
        }
    }
    CacheKey evicted = *victim;
    eraseLocked(shard, evicted);
    stats_.evictions.fetch_add(1, std::memory_order_relaxed);
    return true;
}

size_t AdaptiveCache::sweepLocked(Shard& shard, Clock::time_point now) {
    std::vector<CacheKey> expired;
    for (const auto& [key, entry] : shard.entries) {
        if (now >= entry.expiresAt)
            expired.push_back(key);
    }
    for (const auto& key : expired)
        eraseLocked(shard, key);
    stats_.ttlExpirations.fetch_add(expired.size(), std::memory_order_relaxed);

    size_t removed = expired.size();
    while (shard.memory > shardBudget_ && evictOneLocked(shard, now))
        ++removed;
    return removed;
}

size_t AdaptiveCache::invalidate(const PartId& id) {
    generation_.fetch_add(1, std::memory_order_acq_rel);
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        auto it = shard->byRecord.find(id);
        if (it == shard->byRecord.end())
            continue;
        auto keys = it->second;
        for (const auto& k : keys) {
            eraseLocked(*shard, CacheKey::fromString(k));
            ++removed;
        }
    }
    if (removed > 0) {
        stats_.invalidations.fetch_add(removed, std::memory_order_relaxed);
        spdlog::debug("AdaptiveCache: invalidated {} entries referencing '{}'", removed, id);
    }
    return removed;
}

bool AdaptiveCache::invalidateKey(const CacheKey& key) {
    generation_.fetch_add(1, std::memory_order_acq_rel);
    auto& shard = shardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    if (!shard.entries.count(key))
        return false;
    eraseLocked(shard, key);
    stats_.invalidations.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void AdaptiveCache::clear() {
    generation_.fetch_add(1, std::memory_order_acq_rel);
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        removed += shard->entries.size();
        stats_.memoryUsage.fetch_sub(shard->memory, std::memory_order_relaxed);
        stats_.currentSize.fetch_sub(shard->entries.size(), std::memory_order_relaxed);
        shard->entries.clear();
        shard->keys.clear();
        shard->byRecord.clear();
        shard->memory = 0;
    }
    stats_.invalidations.fetch_add(removed, std::memory_order_relaxed);
}

size_t AdaptiveCache::runMaintenance() {
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        removed += sweepLocked(*shard, Clock::now());
    }
    return removed;
}

Result<void> AdaptiveCache::startMaintenance(boost::asio::any_io_executor executor) {
    std::weak_ptr<AdaptiveCache> weak = weak_from_this();
    if (weak.expired()) {
        return Error{ErrorCode::InvalidState,
                     "AdaptiveCache maintenance requires shared_ptr ownership"};
    }
    auto stop = std::make_shared<std::atomic<bool>>(false);
    if (auto prev = std::atomic_exchange(&stopMaintenance_, stop))
        prev->store(true, std::memory_order_release);

    auto interval = config_.sweep_interval;
    boost::asio::co_spawn(
        executor,
        [weak, stop, interval]() -> boost::asio::awaitable<void> {
            auto ex = co_await boost::asio::this_coro::executor;
            boost::asio::steady_timer timer(ex);
            while (!stop->load(std::memory_order_acquire)) {
                timer.expires_after(interval);
                try {
                    co_await timer.async_wait(boost::asio::use_awaitable);
                } catch (const boost::system::system_error& e) {
                    if (e.code() == boost::asio::error::operation_aborted)
                        break;
                    spdlog::warn("[CacheMaintenance] timer error: {}", e.what());
                    continue;
                }
                auto cache = weak.lock();
                if (!cache || stop->load(std::memory_order_acquire))
                    break;
                try {
                    auto removed = cache->runMaintenance();
                    if (removed > 0)
                        spdlog::debug("[CacheMaintenance] removed {} entries", removed);
                } catch (const std::exception& e) {
                    spdlog::warn("[CacheMaintenance] sweep failed, retrying next interval: {}",
                                 e.what());
                }
            }
            spdlog::debug("[CacheMaintenance] stopped");
            co_return;
        },
        boost::asio::detached);
    spdlog::debug("AdaptiveCache: maintenance every {} ms", interval.count());
    return Result<void>();
}

void AdaptiveCache::stopMaintenance() {
    if (auto prev = std::atomic_exchange(&stopMaintenance_, std::shared_ptr<std::atomic<bool>>{}))
        prev->store(true, std::memory_order_release);
}

CacheStats AdaptiveCache::getStats() const {
    return stats_;
}

size_t AdaptiveCache::size() const {
    return stats_.currentSize.load(std::memory_order_relaxed);
}

size_t AdaptiveCache::memoryUsage() const {
    return stats_.memoryUsage.load(std::memory_order_relaxed);
}

} // namespace synvec::search
