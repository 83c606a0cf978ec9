// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/core/types.h>
#include <synvec/ml/embedding_provider.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace synvec::vector {

/**
 * Configuration for the vector index
 */
struct IndexConfig {
    size_t dimension = 384;
    std::string model_version = "all-MiniLM-L6-v2";

    // HNSW parameters
    size_t hnsw_m = 16;                // Number of connections per node
    size_t hnsw_ef_construction = 200; // Construction time accuracy
    size_t hnsw_ef_search = 64;        // Search time breadth
    size_t hnsw_seed = 100;            // Random seed for level assignment

    // Below this many live vectors queries use an exact linear scan
    size_t exact_threshold = 1000;
    // Vectors appended after the last graph build are scanned exactly; once this many
    // accumulate the graph is rebuilt on the next publish
    size_t delta_threshold = 256;
    // Compact the arena on rebuild when dead slots exceed this fraction
    double compaction_ratio = 0.25;

    bool normalize_vectors = true; // Normalize vectors before indexing

    // Snapshots published longer ago than this are reported as stale (0 = never)
    std::chrono::seconds stale_after{0};
};

/**
 * One (id, distance) pair from a k-NN query. Distance is 1 - inner product, i.e. cosine
 * distance for normalised vectors.
 */
struct Neighbor {
    PartId id;
    float distance = 0.0f;

    bool operator==(const Neighbor&) const = default;
};

struct VectorEntry {
    PartId id;
    std::vector<float> values;
};

/**
 * Per-entry failure from a batch insert; the rest of the batch is still applied
 */
struct InsertFailure {
    PartId id;
    Error error;
};

struct BatchInsertReport {
    size_t inserted = 0;
    size_t replaced = 0;
    std::vector<InsertFailure> failures;
    uint64_t snapshotVersion = 0;
    size_t copiedBlocks = 0; // shared arena blocks this write had to copy
};

struct IndexStats {
    size_t count = 0;       // live vectors
    size_t dimension = 0;
    std::string modelVersion;
    uint64_t snapshotVersion = 0;
    size_t arenaSlots = 0;  // live + dead
    size_t graphSlots = 0;  // slots covered by the HNSW graph
    size_t deltaSlots = 0;  // slots scanned exactly
    bool approximate = false;
    uint64_t totalQueries = 0;
    double avgQueryLatencyMs = 0.0;
    std::chrono::system_clock::time_point publishedAt;
};

class IndexSnapshot;
using SnapshotHandle = std::shared_ptr<const IndexSnapshot>;

/**
 * Immutable index version.
 *
 * Vectors live in an append-only arena addressed by stable integer slots. Slots below
 * graphSlots() are covered by an HNSW graph; later slots form the delta and are scanned
 * exactly. A replaced record keeps its old slot but marks it dead. Nothing in a snapshot
 * changes after publication, so any number of threads may query it without locking.
 */
class IndexSnapshot {
public:
    struct Arena;
    struct Graph;

    IndexSnapshot(uint64_t version, std::shared_ptr<const Arena> arena,
                  std::shared_ptr<const Graph> graph, size_t exactThreshold,
                  std::chrono::system_clock::time_point publishedAt);
    ~IndexSnapshot();

    /**
     * k nearest live vectors, ordered by distance then id. Exact below the configured
     * threshold, graph search plus exact delta scan above it.
     * @param cancelled optional flag polled during the scan; set means OperationCancelled
     */
    Result<std::vector<Neighbor>> query(const std::vector<float>& vector, size_t k,
                                        const std::atomic<bool>* cancelled = nullptr) const;

    bool contains(const PartId& id) const;
    std::optional<std::vector<float>> vectorOf(const PartId& id) const;

    /// Live ids in slot order
    std::vector<PartId> ids() const;

    uint64_t version() const { return version_; }
    size_t size() const;
    size_t dimension() const;
    const std::string& modelVersion() const;
    size_t arenaSlots() const;
    size_t graphSlots() const;
    bool approximate() const;
    std::chrono::system_clock::time_point publishedAt() const { return publishedAt_; }

    const std::shared_ptr<const Arena>& arena() const { return arena_; }
    const std::shared_ptr<const Graph>& graph() const { return graph_; }

private:
    void exactScan(const float* q, size_t fromSlot, size_t k,
                   std::vector<std::pair<float, uint32_t>>& out,
                   const std::atomic<bool>* cancelled, bool& wasCancelled) const;

    uint64_t version_;
    std::shared_ptr<const Arena> arena_;
    std::shared_ptr<const Graph> graph_;
    size_t exactThreshold_;
    std::chrono::system_clock::time_point publishedAt_;
};

/**
 * Owns the current snapshot and serialises writers.
 *
 * Readers call acquire() (an atomic shared_ptr load) and never block. Writers build the next
 * snapshot under writeMutex_ and publish it with a single atomic store.
 */
class VectorIndexManager {
public:
    explicit VectorIndexManager(const IndexConfig& config = {});
    ~VectorIndexManager();

    VectorIndexManager(const VectorIndexManager&) = delete;
    VectorIndexManager& operator=(const VectorIndexManager&) = delete;

    // Vector operations
    Result<void> insert(const PartId& id, const std::vector<float>& vector);
    Result<void> insert(const PartId& id, const ml::EmbeddingVector& vector);

    /// Applies all valid entries and publishes once. Later duplicates of an id win.
    BatchInsertReport insertBatch(std::vector<VectorEntry> entries);

    Result<void> remove(const PartId& id);

    /// Replaces the whole index with the given entries in one publish.
    BatchInsertReport replaceAll(std::vector<VectorEntry> entries);

    /// Forces compaction and a fresh graph over all live vectors.
    Result<void> rebuild();

    // Search operations
    Result<std::vector<Neighbor>> query(const std::vector<float>& vector, size_t k,
                                        const std::atomic<bool>* cancelled = nullptr);

    SnapshotHandle acquire() const;

    /// True when the served snapshot is older than stale_after.
    bool isStale() const;

    // Persistence
    Result<void> saveSnapshot(const std::filesystem::path& path) const;
    Result<void> loadSnapshot(const std::filesystem::path& path);

    // Statistics and monitoring
    IndexStats getStats() const;
    size_t size() const;
    size_t dimension() const { return config_.dimension; }
    const IndexConfig& getConfig() const { return config_; }

private:
    struct Mutation {
        PartId id;
        std::vector<float> values;
        bool erase = false;
    };

    BatchInsertReport applyLocked(std::vector<Mutation> mutations, bool forceRebuild,
                                  bool startEmpty);
    void publishLocked(SnapshotHandle next);
    void recordQuery(std::chrono::microseconds elapsed);

    IndexConfig config_;
    std::mutex writeMutex_;
    SnapshotHandle current_;
    uint64_t nextVersion_ = 1;

    std::atomic<uint64_t> totalQueries_{0};
    std::atomic<uint64_t> totalQueryMicros_{0};
};

/**
 * Utility functions for vector operations
 */
namespace vector_utils {

/// Normalize a vector to unit length (zero vectors are returned unchanged)
std::vector<float> normalize(const std::vector<float>& vector);

float innerProduct(const float* a, const float* b, size_t dim);

/// 1 - <a,b>
float cosineDistance(const float* a, const float* b, size_t dim);

} // namespace vector_utils

} // namespace synvec::vector
