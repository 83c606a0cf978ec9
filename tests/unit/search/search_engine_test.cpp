// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <synvec/search/search_engine.h>

#include "../../common/synvec_test_helpers.h"

#include <limits>
#include <set>

using namespace synvec;
using namespace synvec::search;

namespace {

constexpr size_t kDim = 8;

std::vector<float> vec(std::initializer_list<float> head) {
    std::vector<float> v(kDim, 0.0f);
    size_t i = 0;
    for (float x : head)
        v[i++] = x;
    return v;
}

} // namespace

class SearchEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<test::TableEmbeddingProvider>(kDim, "test-model");
        index_ = std::make_shared<vector::VectorIndexManager>(test::smallIndexConfig(kDim));
        catalog_ = std::make_shared<metadata::PartCatalog>();
        engine_ = std::make_unique<SearchEngine>(provider_, index_, catalog_);
    }

    metadata::PartRecord pinned(metadata::PartRecord rec, std::vector<float> v) {
        provider_->pin(rec.searchText(), std::move(v));
        return rec;
    }

    QueryContext context(const std::string& text, SearchFilters filters = {}, size_t topK = 10) {
        QueryContext ctx;
        ctx.rawText = text;
        ctx.filters = std::move(filters);
        ctx.query = processor_.optimize(text, !ctx.filters.empty());
        ctx.topK = topK;
        return ctx;
    }

    std::shared_ptr<test::TableEmbeddingProvider> provider_;
    std::shared_ptr<vector::VectorIndexManager> index_;
    std::shared_ptr<metadata::PartCatalog> catalog_;
    std::unique_ptr<SearchEngine> engine_;
    QueryProcessor processor_;
};

TEST_F(SearchEngineTest, NearestNeighboursComeBackInOrder) {
    auto a = pinned(test::makePart("A", "part a", "first", "DNA"), vec({1.0f, 0.05f}));
    auto b = pinned(test::makePart("B", "part b", "second", "DNA"), vec({0.9f, 0.2f}));
    auto c = pinned(test::makePart("C", "part c", "third", "Protein"), vec({0.0f, 0.0f, 1.0f}));
    auto report = engine_->ingest({a, b, c});
    ASSERT_EQ(report.inserted, 3u);
    ASSERT_TRUE(report.failures.empty());

    auto r = engine_->searchByVector(vec({1.0f, 0.05f}), {}, 2);
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_EQ(r.value().hits.size(), 2u);
    EXPECT_EQ(r.value().hits[0].id, "A");
    EXPECT_EQ(r.value().hits[1].id, "B");
    EXPECT_GT(r.value().hits[0].score, r.value().hits[1].score);
    EXPECT_EQ(r.value().snapshotVersion, report.snapshotVersion);
}

TEST_F(SearchEngineTest, FiltersApplyToVectorCandidates) {
    auto a = pinned(test::makePart("A", "part a", "first", "DNA"), vec({1.0f}));
    auto c = pinned(test::makePart("C", "part c", "third", "Protein"), vec({0.0f, 1.0f}));
    engine_->ingest({a, c});

    SearchFilters proteins;
    proteins.types = {"protein"};
    auto r = engine_->searchByVector(vec({1.0f}), proteins, 5);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().hits.size(), 1u);
    EXPECT_EQ(r.value().hits[0].id, "C");
}

TEST_F(SearchEngineTest, TextQueryRanksMatchingPartsFirst) {
    engine_->ingest(test::sampleParts());
    auto r = engine_->execute(context("green fluorescent reporter"));
    ASSERT_TRUE(r) << r.error().message;
    ASSERT_FALSE(r.value().hits.empty());
    EXPECT_EQ(r.value().hits[0].id, "BBa_E0040");
    EXPECT_LE(r.value().hits.size(), 7u);
}

TEST_F(SearchEngineTest, ExactIdIsPinnedFirst) {
    engine_->ingest(test::sampleParts());
    auto r = engine_->execute(context("bba_j23100", {}, 3));
    ASSERT_TRUE(r);
    ASSERT_FALSE(r.value().hits.empty());
    EXPECT_EQ(r.value().hits[0].id, "BBa_J23100");
    EXPECT_EQ(r.value().hits[0].matchedFields.front(), "id");
    EXPECT_LE(r.value().hits.size(), 3u);
    size_t count = 0;
    for (const auto& h : r.value().hits)
        count += h.id == "BBa_J23100" ? 1 : 0;
    EXPECT_EQ(count, 1u);
}

TEST_F(SearchEngineTest, EmptyQueryTakesFilterOnlyPath) {
    engine_->ingest(test::sampleParts());
    auto callsBefore = provider_->calls();

    SearchFilters filters;
    filters.types = {"promoter"};
    auto r = engine_->execute(context("", filters));
    ASSERT_TRUE(r);
    EXPECT_EQ(provider_->calls(), callsBefore);

    std::vector<std::string> ids;
    for (const auto& h : r.value().hits)
        ids.push_back(h.id);
    std::vector<std::string> expected = {"BBa_J23100", "BBa_R0040", "BBa_J23106"};
    EXPECT_EQ(ids, expected);
}

TEST_F(SearchEngineTest, SourceFilterUsesCanonicalNames) {
    engine_->ingest(test::sampleParts());
    SearchFilters filters;
    filters.sources = {"laboratory"};
    auto r = engine_->execute(context("", filters));
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().hits.size(), 1u);
    EXPECT_EQ(r.value().hits[0].id, "LAB_0007");
    EXPECT_EQ(catalog_->find("BBa_J23100")->sourceCollection, "igem");
}

TEST_F(SearchEngineTest, ZeroTopKAndPastDeadline) {
    engine_->ingest(test::sampleParts());
    auto zero = engine_->execute(context("promoter", {}, 0));
    ASSERT_TRUE(zero);
    EXPECT_TRUE(zero.value().hits.empty());

    auto late = context("promoter");
    late.deadline = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
    auto r = engine_->execute(late);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
}

TEST_F(SearchEngineTest, CancellationIsReported) {
    engine_->ingest(test::sampleParts());
    std::atomic<bool> cancelled{true};
    auto r = engine_->execute(context("promoter"), &cancelled);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
}

TEST_F(SearchEngineTest, ReingestOnlyReembedsChangedText) {
    auto parts = test::sampleParts();
    auto first = engine_->ingest(parts);
    EXPECT_EQ(first.inserted, 7u);
    auto calls = provider_->calls();

    parts[0].usageCount = 5000;
    auto second = engine_->ingest(parts);
    EXPECT_EQ(second.updated, 7u);
    EXPECT_EQ(second.reembedded, 0u);
    EXPECT_EQ(provider_->calls(), calls);

    parts[3].description = "Enhanced green fluorescent protein";
    auto third = engine_->ingest({parts[3]});
    EXPECT_EQ(third.reembedded, 1u);
    EXPECT_EQ(provider_->calls(), calls + 1);
    EXPECT_EQ(catalog_->find("BBa_J23100")->usageCount, 5000u);
}

TEST_F(SearchEngineTest, FailedEmbeddingOnlyRejectsThatRecord) {
    auto parts = test::sampleParts();
    provider_->failOn(parts[2].searchText());
    auto report = engine_->ingest(parts);
    EXPECT_EQ(report.inserted, 6u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].id, "BBa_R0040");
    EXPECT_FALSE(catalog_->find("BBa_R0040"));
    EXPECT_FALSE(index_->acquire()->contains("BBa_R0040"));
}

TEST_F(SearchEngineTest, InvalidRecordsAreRejected) {
    metadata::PartRecord noId = test::makePart("", "x", "y", "Coding");
    metadata::PartRecord noText;
    noText.id = "EMPTY_1";
    auto report = engine_->ingest({noId, noText});
    EXPECT_EQ(report.accepted(), 0u);
    ASSERT_EQ(report.failures.size(), 2u);
    EXPECT_EQ(report.failures[0].error.code, ErrorCode::InvalidArgument);
    EXPECT_EQ(report.failures[1].id, "EMPTY_1");
}

TEST_F(SearchEngineTest, ModelMismatchIsRejected) {
    auto other = std::make_shared<test::TableEmbeddingProvider>(kDim, "other-model");
    SearchEngine engine(other, index_, catalog_);
    auto report = engine.ingest({test::makePart("A", "a", "b", "Coding")});
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].error.code, ErrorCode::InvalidData);
    EXPECT_EQ(index_->size(), 0u);
}

TEST_F(SearchEngineTest, UnavailableProviderRejectsBatch) {
    SearchEngine engine(std::make_shared<ml::HashingEmbeddingProvider>(0, "test-model"), index_,
                        catalog_);
    auto report = engine.ingest(test::sampleParts());
    EXPECT_EQ(report.failures.size(), 7u);
    EXPECT_EQ(report.failures[0].error.code, ErrorCode::NotInitialized);
}

TEST_F(SearchEngineTest, ChangeListenerSeesAddsAndChanges) {
    std::vector<PartId> lastChanged;
    size_t lastAdded = 0;
    int calls = 0;
    engine_->setChangeListener([&](const std::vector<PartId>& changed, size_t added) {
        lastChanged = changed;
        lastAdded = added;
        ++calls;
    });

    auto parts = test::sampleParts();
    engine_->ingest(parts);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(lastAdded, 7u);
    EXPECT_TRUE(lastChanged.empty());

    parts[1].label = "J23106 medium promoter";
    engine_->ingest({parts[1]});
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(lastAdded, 0u);
    ASSERT_EQ(lastChanged.size(), 1u);
    EXPECT_EQ(lastChanged[0], "BBa_J23106");

    ASSERT_TRUE(engine_->removePart("BBa_B0015"));
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(lastChanged[0], "BBa_B0015");
    auto missing = engine_->removePart("BBa_B0015");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_F(SearchEngineTest, GetPartByIdIgnoringCase) {
    engine_->ingest(test::sampleParts());
    auto d = engine_->getPart("bba_j23100");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->record.id, "BBa_J23100");
    EXPECT_GT(d->sequenceLength, 0u);
    EXPECT_FALSE(engine_->getPart("BBa_NOPE").has_value());
}

TEST_F(SearchEngineTest, BrowsePagesThroughFilteredParts) {
    engine_->ingest(test::sampleParts());

    auto page1 = engine_->browseParts({}, 3, 0);
    EXPECT_EQ(page1.totalCount, 7u);
    ASSERT_EQ(page1.parts.size(), 3u);
    EXPECT_EQ(page1.parts[0]->id, "ADD_12345");

    auto last = engine_->browseParts({}, 3, 6);
    EXPECT_EQ(last.parts.size(), 1u);

    auto beyond = engine_->browseParts({}, 3, 10);
    EXPECT_TRUE(beyond.parts.empty());
    EXPECT_EQ(beyond.totalCount, 7u);

    SearchFilters dna;
    dna.types = {"DNA Elements"};
    auto filtered = engine_->browseParts(dna, 10, 0);
    EXPECT_EQ(filtered.totalCount, 4u);
    ASSERT_FALSE(filtered.facets.types.empty());
    EXPECT_EQ(filtered.facets.types.front().name, "DNA Elements");
}

TEST_F(SearchEngineTest, BrowseByKeyword) {
    engine_->ingest(test::sampleParts());

    SearchFilters keyword;
    keyword.text = "Fluorescent";
    auto r = engine_->browseParts(keyword, 10, 0);
    EXPECT_EQ(r.totalCount, 2u);
    std::set<std::string> ids;
    for (const auto& p : r.parts)
        ids.insert(p->id);
    EXPECT_EQ(ids, (std::set<std::string>{"BBa_E0040", "ADD_12345"}));

    keyword.types = {"Coding"};
    EXPECT_EQ(engine_->browseParts(keyword, 10, 0).totalCount, 1u);

    SearchFilters byId;
    byId.text = "bba_j231";
    EXPECT_EQ(engine_->browseParts(byId, 10, 0).totalCount, 2u);
}

TEST_F(SearchEngineTest, BrowseWithUnboundedLimit) {
    engine_->ingest(test::sampleParts());
    auto r = engine_->browseParts({}, std::numeric_limits<size_t>::max(), 1);
    EXPECT_EQ(r.totalCount, 7u);
    EXPECT_EQ(r.parts.size(), 6u);
}

TEST_F(SearchEngineTest, CatalogStatsReflectIngest) {
    engine_->ingest(test::sampleParts());
    auto stats = engine_->getCatalogStats();
    EXPECT_EQ(stats.totalParts, 7u);
}
