// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/core/types.h>
#include <synvec/metadata/part_catalog.h>
#include <synvec/ml/embedding_provider.h>
#include <synvec/search/query_processor.h>
#include <synvec/search/search_filters.h>
#include <synvec/search/search_results.h>
#include <synvec/search/similarity_ranker.h>
#include <synvec/vector/vector_index_manager.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace synvec::search {

/**
 * @brief Everything known about one query once it has been optimized
 */
struct QueryContext {
    std::string rawText;
    OptimizedQuery query;
    SearchFilters filters;
    size_t topK = 10;
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
};

struct IngestFailure {
    PartId id;
    Error error;
};

/**
 * @brief Outcome of an ingestion batch; failures are per record
 */
struct IngestReport {
    size_t inserted = 0;   ///< New records
    size_t reembedded = 0; ///< Existing records whose embedding inputs changed
    size_t updated = 0;    ///< Existing records with unchanged embedding inputs
    std::vector<IngestFailure> failures;
    uint64_t snapshotVersion = 0;

    size_t accepted() const { return inserted + reembedded + updated; }
};

/**
 * @brief Local execution of search, browse and ingestion over one catalog and index
 *
 * Read paths are safe to call concurrently with ingest(); ingest() calls are serialised.
 */
class SearchEngine {
public:
    /// Called after ingest with the ids whose cached results may be stale and the count of
    /// newly added records
    using ChangeListener = std::function<void(const std::vector<PartId>& changed, size_t added)>;

    SearchEngine(std::shared_ptr<ml::IEmbeddingProvider> provider,
                 std::shared_ptr<vector::VectorIndexManager> index,
                 std::shared_ptr<metadata::PartCatalog> catalog,
                 const RankingConfig& ranking = {});

    IngestReport ingest(std::vector<metadata::PartRecord> batch);

    Result<void> removePart(const PartId& id);

    /**
     * @brief Run a query against the current index snapshot
     *
     * Empty query text takes the filter-only path. Returns Timeout once the deadline passes and
     * OperationCancelled when the flag is raised.
     */
    Result<SearchResultSet> execute(const QueryContext& ctx,
                                    const std::atomic<bool>* cancelled = nullptr) const;

    /// Nearest records to a raw vector, filtered and ranked like a text query
    Result<SearchResultSet> searchByVector(const std::vector<float>& vector,
                                           const SearchFilters& filters, size_t topK,
                                           const std::atomic<bool>* cancelled = nullptr) const;

    std::optional<metadata::PartDetails> getPart(const PartId& id) const;
    BrowseResult browseParts(const SearchFilters& filters, size_t limit, size_t offset) const;
    metadata::CatalogStats getCatalogStats() const;

    void setChangeListener(ChangeListener listener);

    const std::shared_ptr<vector::VectorIndexManager>& index() const { return index_; }
    const std::shared_ptr<metadata::PartCatalog>& catalog() const { return catalog_; }
    const SimilarityRanker& ranker() const { return ranker_; }

private:
    Result<SearchResultSet> rankNeighbors(const std::vector<float>& vector,
                                          const OptimizedQuery& query,
                                          const SearchFilters& filters, size_t topK,
                                          const vector::SnapshotHandle& snapshot,
                                          const metadata::PartRecordPtr& pinned,
                                          const std::atomic<bool>* cancelled) const;
    SearchResultSet filterOnly(const OptimizedQuery& query, const SearchFilters& filters,
                               size_t topK, uint64_t snapshotVersion) const;
    std::vector<Result<ml::EmbeddingVector>> embedAll(const std::vector<std::string>& texts) const;

    std::shared_ptr<ml::IEmbeddingProvider> provider_;
    std::shared_ptr<vector::VectorIndexManager> index_;
    std::shared_ptr<metadata::PartCatalog> catalog_;
    SimilarityRanker ranker_;

    std::mutex ingestMutex_;
    ChangeListener listener_;
};

} // namespace synvec::search
