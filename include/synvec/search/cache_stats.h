// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace synvec::search {

/**
 * @brief Statistics for cache performance monitoring
 */
struct CacheStats {
    // Basic counters
    std::atomic<uint64_t> hits{0};          ///< Number of cache hits
    std::atomic<uint64_t> misses{0};        ///< Number of cache misses
    std::atomic<uint64_t> insertions{0};    ///< Admitted puts
    std::atomic<uint64_t> rejections{0};    ///< Puts declined by the admission policy
    std::atomic<uint64_t> evictions{0};     ///< Entries evicted for memory
    std::atomic<uint64_t> invalidations{0}; ///< Entries dropped by invalidate()
    std::atomic<uint64_t> ttlExpirations{0};
    std::atomic<uint64_t> stalePuts{0}; ///< Puts computed before a later invalidation

    // Size metrics
    std::atomic<size_t> currentSize{0}; ///< Current number of entries
    std::atomic<size_t> memoryUsage{0}; ///< Current memory usage in bytes
    size_t maxMemory = 0;               ///< Memory budget in bytes

    CacheStats() = default;

    // Copy constructor (needed because of atomic members)
    CacheStats(const CacheStats& other) { *this = other; }

    // Assignment operator (needed because of atomic members)
    CacheStats& operator=(const CacheStats& other) {
        if (this != &other) {
            hits.store(other.hits.load());
            misses.store(other.misses.load());
            insertions.store(other.insertions.load());
            rejections.store(other.rejections.load());
            evictions.store(other.evictions.load());
            invalidations.store(other.invalidations.load());
            ttlExpirations.store(other.ttlExpirations.load());
            stalePuts.store(other.stalePuts.load());
            currentSize.store(other.currentSize.load());
            memoryUsage.store(other.memoryUsage.load());
            maxMemory = other.maxMemory;
        }
        return *this;
    }

    /**
     * @brief Calculate hit rate
     */
    double hitRate() const {
        uint64_t total = hits.load() + misses.load();
        return total > 0 ? static_cast<double>(hits.load()) / static_cast<double>(total) : 0.0;
    }

    void reset() {
        hits = 0;
        misses = 0;
        insertions = 0;
        rejections = 0;
        evictions = 0;
        invalidations = 0;
        ttlExpirations = 0;
        stalePuts = 0;
    }
};

} // namespace synvec::search
