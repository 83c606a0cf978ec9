// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <synvec/search/search_results.h>

using namespace synvec::search;

TEST(SearchResultSetTest, EstimatedBytesGrowsWithHits) {
    SearchResultSet empty;
    EXPECT_GE(empty.estimatedBytes(), sizeof(SearchResultSet));

    SearchResultSet one;
    one.hits.push_back(SearchHit{"BBa_J23100", 0.9f, {"label", "description"}});
    EXPECT_GT(one.estimatedBytes(), empty.estimatedBytes() + sizeof(SearchHit));

    SearchResultSet longIds = one;
    longIds.hits[0].id = std::string(4096, 'x');
    EXPECT_GE(longIds.estimatedBytes(), one.estimatedBytes() + 4000);
}
