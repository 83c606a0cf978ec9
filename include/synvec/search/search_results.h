// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/core/types.h>
#include <synvec/metadata/part_catalog.h>
#include <synvec/search/query_processor.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace synvec::search {

/**
 * @brief One ranked search result
 */
struct SearchHit {
    PartId id;
    float score = 0.0f;
    std::vector<std::string> matchedFields; ///< Subset of id, label, description, type, source
};

/**
 * @brief Ranked result set as stored in the cache
 */
struct SearchResultSet {
    std::vector<SearchHit> hits;
    uint64_t snapshotVersion = 0;

    /// Approximate heap footprint, used for the cache memory budget
    size_t estimatedBytes() const;
};

using SearchResultSetPtr = std::shared_ptr<const SearchResultSet>;

/**
 * @brief Response returned to search callers
 */
struct SearchResponse {
    std::vector<SearchHit> hits;
    std::vector<Error> warnings; ///< Non-fatal conditions such as StaleIndex
    QueryIntent intent = QueryIntent::Informational;
    bool fromCache = false;
    uint64_t snapshotVersion = 0;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Paged filter-only listing (browseParts)
 */
struct BrowseResult {
    std::vector<metadata::PartRecordPtr> parts;
    size_t totalCount = 0;
    size_t limit = 0;
    size_t offset = 0;
    metadata::CatalogFacets facets;
};

} // namespace synvec::search
