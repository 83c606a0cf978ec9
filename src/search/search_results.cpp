// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/search/search_results.h>

namespace synvec::search {

size_t SearchResultSet::estimatedBytes() const {
    size_t bytes = sizeof(SearchResultSet) + hits.capacity() * sizeof(SearchHit);
    for (const auto& h : hits) {
        bytes += h.id.capacity();
        bytes += h.matchedFields.capacity() * sizeof(std::string);
        for (const auto& f : h.matchedFields)
            bytes += f.capacity();
    }
    return bytes;
}

} // namespace synvec::search
