// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <synvec/vector/vector_index_manager.h>

#include "../../common/synvec_test_helpers.h"

#include <atomic>
#include <cmath>
#include <limits>
#include <thread>

using namespace synvec;
using namespace synvec::vector;

namespace {

constexpr size_t kDim = 16;

std::string partId(size_t i) {
    return "BBa_T" + std::to_string(10000 + i);
}

std::vector<VectorEntry> entriesFor(const std::vector<std::vector<float>>& vectors) {
    std::vector<VectorEntry> entries;
    for (size_t i = 0; i < vectors.size(); ++i)
        entries.push_back(VectorEntry{partId(i), vectors[i]});
    return entries;
}

} // namespace

class VectorIndexManagerTest : public ::testing::Test {
protected:
    VectorIndexManager index_{test::smallIndexConfig(kDim)};
};

TEST_F(VectorIndexManagerTest, EmptyIndexReturnsNoNeighbors) {
    auto r = index_.query(test::unitVector(kDim, 0), 5);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_TRUE(r.value().empty());
    EXPECT_EQ(index_.size(), 0u);
}

TEST_F(VectorIndexManagerTest, InsertedVectorIsItsOwnNearestNeighbor) {
    auto vectors = test::randomVectors(50, kDim, 7);
    auto report = index_.insertBatch(entriesFor(vectors));
    EXPECT_EQ(report.inserted, 50u);
    EXPECT_TRUE(report.failures.empty());

    for (size_t i = 0; i < vectors.size(); i += 7) {
        auto r = index_.query(vectors[i], 1);
        ASSERT_TRUE(r);
        ASSERT_EQ(r.value().size(), 1u);
        EXPECT_EQ(r.value()[0].id, partId(i));
        EXPECT_NEAR(r.value()[0].distance, 0.0f, 1e-5);
    }
}

TEST_F(VectorIndexManagerTest, ResultsOrderedByDistanceThenId) {
    ASSERT_TRUE(index_.insert("B", test::unitVector(kDim, 0)));
    ASSERT_TRUE(index_.insert("A", test::unitVector(kDim, 0)));
    ASSERT_TRUE(index_.insert("C", test::unitVector(kDim, 1)));

    auto r = index_.query(test::unitVector(kDim, 0), 3);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 3u);
    EXPECT_EQ(r.value()[0].id, "A");
    EXPECT_EQ(r.value()[1].id, "B");
    EXPECT_EQ(r.value()[2].id, "C");
    EXPECT_NEAR(r.value()[2].distance, 1.0f, 1e-5);
}

TEST_F(VectorIndexManagerTest, KLargerThanIndexReturnsAll) {
    ASSERT_TRUE(index_.insert("A", test::unitVector(kDim, 0)));
    ASSERT_TRUE(index_.insert("B", test::unitVector(kDim, 1)));
    auto r = index_.query(test::unitVector(kDim, 0), 10);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().size(), 2u);

    auto none = index_.query(test::unitVector(kDim, 0), 0);
    ASSERT_TRUE(none);
    EXPECT_TRUE(none.value().empty());
}

TEST_F(VectorIndexManagerTest, DimensionMismatchOnInsertAndQuery) {
    auto ins = index_.insert("short", std::vector<float>(kDim - 1, 0.5f));
    ASSERT_FALSE(ins);
    EXPECT_EQ(ins.error().code, ErrorCode::DimensionMismatch);

    auto empty = index_.insert("empty", std::vector<float>{});
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::DimensionMismatch);

    auto q = index_.query(std::vector<float>(kDim + 3, 0.1f), 3);
    ASSERT_FALSE(q);
    EXPECT_EQ(q.error().code, ErrorCode::DimensionMismatch);
    EXPECT_EQ(index_.size(), 0u);
}

TEST_F(VectorIndexManagerTest, NonFiniteValuesAreRejected) {
    auto v = test::unitVector(kDim, 2);
    v[3] = std::numeric_limits<float>::quiet_NaN();
    auto r = index_.insert("nan", v);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST_F(VectorIndexManagerTest, ModelVersionMustMatch) {
    ml::EmbeddingVector ev{test::unitVector(kDim, 0), "some-other-model"};
    auto r = index_.insert("X", ev);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidData);
    EXPECT_EQ(index_.size(), 0u);

    ev.modelVersion = "test-model";
    EXPECT_TRUE(index_.insert("X", ev));
}

TEST_F(VectorIndexManagerTest, BatchContinuesPastBadEntries) {
    std::vector<VectorEntry> entries;
    entries.push_back({"good1", test::unitVector(kDim, 0)});
    entries.push_back({"bad", std::vector<float>(3, 1.0f)});
    entries.push_back({"", test::unitVector(kDim, 1)});
    entries.push_back({"good2", test::unitVector(kDim, 1)});

    auto report = index_.insertBatch(std::move(entries));
    EXPECT_EQ(report.inserted, 2u);
    ASSERT_EQ(report.failures.size(), 2u);
    EXPECT_EQ(report.failures[0].id, "bad");
    EXPECT_EQ(report.failures[0].error.code, ErrorCode::DimensionMismatch);
    EXPECT_EQ(report.failures[1].error.code, ErrorCode::InvalidArgument);
    EXPECT_EQ(index_.size(), 2u);
    EXPECT_GT(report.snapshotVersion, 0u);
}

TEST_F(VectorIndexManagerTest, ReinsertReplacesVector) {
    ASSERT_TRUE(index_.insert("P", test::unitVector(kDim, 0)));
    auto report = index_.insertBatch({VectorEntry{"P", test::unitVector(kDim, 5)}});
    EXPECT_EQ(report.replaced, 1u);
    EXPECT_EQ(report.inserted, 0u);
    EXPECT_EQ(index_.size(), 1u);

    auto r = index_.query(test::unitVector(kDim, 5), 1);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].id, "P");
    EXPECT_NEAR(r.value()[0].distance, 0.0f, 1e-5);
}

TEST_F(VectorIndexManagerTest, RemoveHidesVector) {
    ASSERT_TRUE(index_.insert("A", test::unitVector(kDim, 0)));
    ASSERT_TRUE(index_.insert("B", test::unitVector(kDim, 1)));
    ASSERT_TRUE(index_.remove("A"));

    auto r = index_.query(test::unitVector(kDim, 0), 5);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].id, "B");

    auto again = index_.remove("A");
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::NotFound);
}

TEST_F(VectorIndexManagerTest, CancelledQueryReportsCancellation) {
    index_.insertBatch(entriesFor(test::randomVectors(20, kDim, 3)));
    std::atomic<bool> cancelled{true};
    auto r = index_.query(test::unitVector(kDim, 0), 5, &cancelled);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::OperationCancelled);
}

TEST_F(VectorIndexManagerTest, HeldSnapshotIsUnaffectedByLaterWrites) {
    ASSERT_TRUE(index_.insert("A", test::unitVector(kDim, 0)));
    auto held = index_.acquire();
    auto heldVersion = held->version();

    ASSERT_TRUE(index_.insert("B", test::unitVector(kDim, 1)));
    ASSERT_TRUE(index_.remove("A"));

    EXPECT_EQ(held->version(), heldVersion);
    EXPECT_EQ(held->size(), 1u);
    EXPECT_TRUE(held->contains("A"));
    EXPECT_FALSE(held->contains("B"));
    auto r = held->query(test::unitVector(kDim, 0), 5);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].id, "A");

    auto now = index_.acquire();
    EXPECT_GT(now->version(), heldVersion);
    EXPECT_FALSE(now->contains("A"));
}

TEST_F(VectorIndexManagerTest, VectorOfReturnsNormalisedCopy) {
    std::vector<float> v(kDim, 0.0f);
    v[0] = 3.0f;
    v[1] = 4.0f;
    ASSERT_TRUE(index_.insert("N", v));
    auto stored = index_.acquire()->vectorOf("N");
    ASSERT_TRUE(stored.has_value());
    EXPECT_NEAR((*stored)[0], 0.6f, 1e-6);
    EXPECT_NEAR((*stored)[1], 0.8f, 1e-6);
    EXPECT_FALSE(index_.acquire()->vectorOf("missing").has_value());
}

TEST_F(VectorIndexManagerTest, ReplaceAllDropsPreviousContent) {
    ASSERT_TRUE(index_.insert("old", test::unitVector(kDim, 0)));
    auto report = index_.replaceAll({VectorEntry{"new1", test::unitVector(kDim, 1)},
                                     VectorEntry{"new2", test::unitVector(kDim, 2)}});
    EXPECT_EQ(report.inserted, 2u);
    auto snap = index_.acquire();
    EXPECT_EQ(snap->size(), 2u);
    EXPECT_FALSE(snap->contains("old"));
}

TEST_F(VectorIndexManagerTest, StatsTrackQueries) {
    index_.insertBatch(entriesFor(test::randomVectors(10, kDim, 11)));
    ASSERT_TRUE(index_.query(test::unitVector(kDim, 0), 3));
    ASSERT_TRUE(index_.query(test::unitVector(kDim, 1), 3));
    auto stats = index_.getStats();
    EXPECT_EQ(stats.count, 10u);
    EXPECT_EQ(stats.dimension, kDim);
    EXPECT_EQ(stats.modelVersion, "test-model");
    EXPECT_EQ(stats.totalQueries, 2u);
    EXPECT_FALSE(stats.approximate);
}

TEST_F(VectorIndexManagerTest, NeverStaleWithoutThreshold) {
    EXPECT_FALSE(index_.isStale());
}

TEST(VectorIndexStalenessTest, OldSnapshotIsStale) {
    auto cfg = test::smallIndexConfig(kDim);
    cfg.stale_after = std::chrono::seconds(1);
    VectorIndexManager index(cfg);
    EXPECT_FALSE(index.isStale());
    EXPECT_TRUE(test::waitFor([&] { return index.isStale(); }, std::chrono::milliseconds(3000)));
    ASSERT_TRUE(index.insert("fresh", test::unitVector(kDim, 0)));
    EXPECT_FALSE(index.isStale());
}

// Above the exact threshold queries go through the HNSW graph plus the delta scan

class ApproximateIndexTest : public ::testing::Test {
protected:
    ApproximateIndexTest() : index_(test::smallIndexConfig(kDim, 64)) {}

    VectorIndexManager index_;
};

TEST_F(ApproximateIndexTest, SelfRecallThroughGraph) {
    auto vectors = test::randomVectors(400, kDim, 42);
    index_.insertBatch(entriesFor(vectors));
    auto snap = index_.acquire();
    EXPECT_TRUE(snap->approximate());
    EXPECT_GT(snap->graphSlots(), 0u);

    size_t hits = 0;
    for (size_t i = 0; i < vectors.size(); i += 10) {
        auto r = index_.query(vectors[i], 1);
        ASSERT_TRUE(r);
        if (!r.value().empty() && r.value()[0].id == partId(i))
            ++hits;
    }
    EXPECT_GE(hits, 38u);
}

TEST_F(ApproximateIndexTest, DeltaEntriesAreVisibleBeforeRebuild) {
    index_.insertBatch(entriesFor(test::randomVectors(200, kDim, 5)));
    auto graphSlots = index_.acquire()->graphSlots();

    std::vector<float> target(kDim, 0.0f);
    target[0] = 0.3f;
    target[kDim - 1] = -0.9f;
    ASSERT_TRUE(index_.insert("delta-part", target));

    auto snap = index_.acquire();
    EXPECT_EQ(snap->graphSlots(), graphSlots);
    auto r = snap->query(target, 1);
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].id, "delta-part");
}

TEST_F(ApproximateIndexTest, RemovedEntriesAreFilteredFromGraph) {
    auto vectors = test::randomVectors(150, kDim, 9);
    index_.insertBatch(entriesFor(vectors));
    ASSERT_TRUE(index_.remove(partId(3)));
    auto r = index_.query(vectors[3], 5);
    ASSERT_TRUE(r);
    for (const auto& n : r.value())
        EXPECT_NE(n.id, partId(3));
}

TEST_F(ApproximateIndexTest, RebuildCoversEverySlot) {
    index_.insertBatch(entriesFor(test::randomVectors(100, kDim, 1)));
    ASSERT_TRUE(index_.insert("late", test::unitVector(kDim, 4)));
    ASSERT_TRUE(index_.rebuild());
    auto snap = index_.acquire();
    EXPECT_EQ(snap->graphSlots(), snap->arenaSlots());
    EXPECT_EQ(snap->size(), 101u);
}

TEST_F(ApproximateIndexTest, ReadersSeeWholeSnapshotsDuringReplace) {
    auto setA = test::randomVectors(120, kDim, 100);
    std::vector<VectorEntry> entriesA;
    std::vector<VectorEntry> entriesB;
    for (size_t i = 0; i < setA.size(); ++i) {
        entriesA.push_back({"A_" + std::to_string(i), setA[i]});
        entriesB.push_back({"B_" + std::to_string(i), setA[i]});
    }
    index_.replaceAll(entriesA);

    std::atomic<bool> stop{false};
    std::atomic<size_t> mixed{0};
    std::atomic<size_t> reads{0};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&, t] {
            size_t i = static_cast<size_t>(t);
            while (!stop.load()) {
                auto r = index_.query(setA[i % setA.size()], 10);
                if (!r)
                    continue;
                bool sawA = false;
                bool sawB = false;
                for (const auto& n : r.value()) {
                    sawA = sawA || n.id.rfind("A_", 0) == 0;
                    sawB = sawB || n.id.rfind("B_", 0) == 0;
                }
                if (sawA && sawB)
                    mixed.fetch_add(1);
                reads.fetch_add(1);
                ++i;
            }
        });
    }

    for (int round = 0; round < 20; ++round) {
        index_.replaceAll(round % 2 == 0 ? entriesB : entriesA);
    }
    stop.store(true);
    for (auto& t : readers)
        t.join();

    EXPECT_GT(reads.load(), 0u);
    EXPECT_EQ(mixed.load(), 0u);
}

// ===== Arena sharing between snapshots =====

class ArenaSharingTest : public ::testing::Test {
protected:
    // Exact search throughout so recall checks stay deterministic
    VectorIndexManager index_{test::smallIndexConfig(kDim, 1000000)};
};

TEST_F(ArenaSharingTest, AppendCopiesOnlyTheSharedTailBlock) {
    auto first = test::randomVectors(1500, kDim, 11);
    auto r1 = index_.insertBatch(entriesFor(first));
    ASSERT_EQ(r1.inserted, 1500u);
    EXPECT_EQ(r1.copiedBlocks, 0u);

    std::vector<VectorEntry> more;
    auto second = test::randomVectors(3000, kDim, 12);
    for (size_t i = 0; i < second.size(); ++i)
        more.push_back(VectorEntry{partId(1500 + i), second[i]});
    auto r2 = index_.insertBatch(std::move(more));
    EXPECT_EQ(r2.inserted, 3000u);
    EXPECT_EQ(r2.copiedBlocks, 1u);

    auto r3 = index_.insertBatch({VectorEntry{"BBa_single", test::unitVector(kDim, 3)}});
    EXPECT_EQ(r3.inserted, 1u);
    EXPECT_EQ(r3.copiedBlocks, 1u);
    EXPECT_EQ(index_.size(), 4501u);

    for (size_t i : {size_t{0}, size_t{1023}, size_t{1024}, size_t{1499}}) {
        auto q = index_.query(first[i], 1);
        ASSERT_TRUE(q);
        ASSERT_EQ(q.value().size(), 1u);
        EXPECT_EQ(q.value()[0].id, partId(i));
    }
    for (size_t i : {size_t{0}, size_t{2999}}) {
        auto q = index_.query(second[i], 1);
        ASSERT_TRUE(q);
        ASSERT_EQ(q.value()[0].id, partId(1500 + i));
    }
}

TEST_F(ArenaSharingTest, RemovalCopiesNoVectorBlocks) {
    ASSERT_EQ(index_.insertBatch(entriesFor(test::randomVectors(2048, kDim, 5))).inserted, 2048u);
    auto report = index_.insertBatch({VectorEntry{"BBa_new", test::unitVector(kDim, 0)}});
    EXPECT_EQ(report.copiedBlocks, 0u); // tail block was full, new block is private
    ASSERT_TRUE(index_.remove(partId(7)));
    EXPECT_FALSE(index_.acquire()->contains(partId(7)));
    EXPECT_EQ(index_.size(), 2048u);
}

TEST_F(ArenaSharingTest, HeldSnapshotKeepsItsViewOfSharedBlocks) {
    auto vectors = test::randomVectors(1100, kDim, 21);
    ASSERT_EQ(index_.insertBatch(entriesFor(vectors)).inserted, 1100u);
    auto held = index_.acquire();

    auto replacement = test::unitVector(kDim, 4);
    auto report = index_.insertBatch({VectorEntry{partId(10), replacement}});
    EXPECT_EQ(report.replaced, 1u);
    ASSERT_TRUE(index_.remove(partId(1050)));

    auto oldVec = held->vectorOf(partId(10));
    ASSERT_TRUE(oldVec.has_value());
    for (size_t d = 0; d < kDim; ++d)
        EXPECT_NEAR((*oldVec)[d], vector_utils::normalize(vectors[10])[d], 1e-6);
    EXPECT_TRUE(held->contains(partId(1050)));
    EXPECT_EQ(held->size(), 1100u);

    auto now = index_.acquire();
    auto newVec = now->vectorOf(partId(10));
    ASSERT_TRUE(newVec.has_value());
    EXPECT_NEAR((*newVec)[4], 1.0f, 1e-6);
    EXPECT_FALSE(now->contains(partId(1050)));
    EXPECT_EQ(now->size(), 1099u);
}

TEST(VectorUtilsTest, NormalizeLeavesZeroVectorAlone) {
    std::vector<float> zero(4, 0.0f);
    EXPECT_EQ(vector_utils::normalize(zero), zero);
    auto n = vector_utils::normalize({3.0f, 4.0f});
    EXPECT_FLOAT_EQ(n[0], 0.6f);
    EXPECT_FLOAT_EQ(n[1], 0.8f);
}
