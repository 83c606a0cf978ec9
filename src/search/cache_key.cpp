// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/search/cache_key.h>

#include <functional>

namespace synvec::search {

CacheKey CacheKey::fromQuery(const OptimizedQuery& query, const SearchFilters& filters,
                             size_t topK) {
    std::string key;
    key.reserve(query.normalized.size() + 64);
    key += "q:";
    key += query.normalized;
    key += "|lx:";
    key += query.lexiconVersion;
    key += "|f:";
    key += filters.signature();
    key += "|k:";
    key += std::to_string(topK);
    return fromString(std::move(key));
}

CacheKey CacheKey::fromString(std::string key) {
    CacheKey k;
    k.keyString_ = std::move(key);
    k.hashValue_ = std::hash<std::string>{}(k.keyString_);
    return k;
}

} // namespace synvec::search
