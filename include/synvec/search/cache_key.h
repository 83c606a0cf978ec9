// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/search/query_processor.h>
#include <synvec/search/search_filters.h>

#include <string>

namespace synvec::search {

/**
 * @brief Represents a unique key for caching search results
 *
 * Built from the normalized query, expansions lexicon, filter signature and top-k, so two raw
 * queries that normalise identically share an entry.
 */
class CacheKey {
public:
    /**
     * @brief Generate cache key from an optimized query
     */
    static CacheKey fromQuery(const OptimizedQuery& query, const SearchFilters& filters,
                              size_t topK);

    /**
     * @brief Wrap a pre-built key string (tests, persistence)
     */
    static CacheKey fromString(std::string key);

    CacheKey() = default;

    size_t hash() const { return hashValue_; }

    const std::string& toString() const { return keyString_; }

    bool operator==(const CacheKey& other) const {
        return hashValue_ == other.hashValue_ && keyString_ == other.keyString_;
    }

    bool operator!=(const CacheKey& other) const { return !(*this == other); }

private:
    std::string keyString_;
    size_t hashValue_ = 0;
};

/**
 * @brief Hash function for CacheKey (for use in unordered containers)
 */
struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const { return key.hash(); }
};

} // namespace synvec::search
