// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/search/search_engine.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace synvec::search {

namespace {

bool pastDeadline(const QueryContext& ctx) {
    return std::chrono::steady_clock::now() >= ctx.deadline;
}

} // namespace

SearchEngine::SearchEngine(std::shared_ptr<ml::IEmbeddingProvider> provider,
                           std::shared_ptr<vector::VectorIndexManager> index,
                           std::shared_ptr<metadata::PartCatalog> catalog,
                           const RankingConfig& ranking)
    : provider_(std::move(provider)), index_(std::move(index)), catalog_(std::move(catalog)),
      ranker_(ranking) {}

void SearchEngine::setChangeListener(ChangeListener listener) {
    std::lock_guard<std::mutex> lock(ingestMutex_);
    listener_ = std::move(listener);
}

// ============================================================================
// Ingestion
// ============================================================================

std::vector<Result<ml::EmbeddingVector>>
SearchEngine::embedAll(const std::vector<std::string>& texts) const {
    std::vector<Result<ml::EmbeddingVector>> out;
    out.reserve(texts.size());
    if (texts.empty())
        return out;

    auto batch = provider_->encodeBatch(texts);
    if (batch && batch.value().size() == texts.size()) {
        for (auto& v : batch.value())
            out.emplace_back(std::move(v));
        return out;
    }
    // Batch failed as a whole: retry one text at a time so a bad record only fails itself
    spdlog::debug("Ingest: batch encode failed ({}), encoding individually",
                  batch ? std::string("size mismatch") : batch.error().message);
    for (const auto& t : texts)
        out.push_back(provider_->encode(t));
    return out;
}

IngestReport SearchEngine::ingest(std::vector<metadata::PartRecord> batch) {
    std::lock_guard<std::mutex> lock(ingestMutex_);
    IngestReport report;
    if (!provider_ || !provider_->isAvailable()) {
        for (const auto& r : batch) {
            report.failures.push_back(
                {r.id, Error{ErrorCode::NotInitialized, "Embedding provider unavailable"}});
        }
        spdlog::error("Ingest: embedding provider unavailable, rejected {} records", batch.size());
        return report;
    }

    auto snapshot = index_->acquire();
    const auto& modelVersion = index_->getConfig().model_version;

    struct Pending {
        metadata::PartRecord record;
        std::optional<size_t> textSlot; // index into texts when (re)embedding is needed
    };
    std::vector<Pending> pending;
    std::vector<std::string> texts;
    pending.reserve(batch.size());

    auto reject = [&report](const PartId& id, Error err) {
        spdlog::warn("Ingest: rejected '{}': {} ({})", id, err.message, err.code);
        report.failures.push_back({id, std::move(err)});
    };

    for (auto& rec : batch) {
        if (rec.id.empty()) {
            reject(rec.id, Error{ErrorCode::InvalidArgument, "Record has an empty id"});
            continue;
        }
        rec.sourceCollection = normalizeSourceCollection(rec.sourceCollection);
        auto text = rec.searchText();
        if (text.empty()) {
            reject(rec.id, Error{ErrorCode::InvalidArgument, "Record has no text to embed"});
            continue;
        }
        auto existing = catalog_->find(rec.id);
        // A vector restored from a snapshot is reused until the record's text changes
        bool needsEmbedding = !snapshot->contains(rec.id) ||
                              (existing && existing->embeddingInputsDiffer(rec));
        Pending p{std::move(rec), std::nullopt};
        if (needsEmbedding) {
            p.textSlot = texts.size();
            texts.push_back(std::move(text));
        }
        pending.push_back(std::move(p));
    }

    auto embeddings = embedAll(texts);
    std::vector<vector::VectorEntry> entries;
    std::unordered_set<PartId> rejected;
    for (auto& p : pending) {
        if (!p.textSlot)
            continue;
        auto& emb = embeddings[*p.textSlot];
        if (!emb) {
            reject(p.record.id, emb.error());
            rejected.insert(p.record.id);
            continue;
        }
        if (emb.value().modelVersion != modelVersion) {
            reject(p.record.id, Error{ErrorCode::InvalidData,
                                      "Embedding model '" + emb.value().modelVersion +
                                          "' does not match index model '" + modelVersion + "'"});
            rejected.insert(p.record.id);
            continue;
        }
        entries.push_back(vector::VectorEntry{p.record.id, std::move(emb.value().values)});
    }

    report.snapshotVersion = snapshot->version();
    if (!entries.empty()) {
        auto indexReport = index_->insertBatch(std::move(entries));
        report.snapshotVersion = indexReport.snapshotVersion;
        for (auto& f : indexReport.failures) {
            rejected.insert(f.id);
            reject(f.id, std::move(f.error));
        }
    }

    std::vector<PartId> changed;
    for (auto& p : pending) {
        if (rejected.count(p.record.id))
            continue;
        auto id = p.record.id;
        switch (catalog_->upsert(std::move(p.record))) {
            case metadata::UpsertOutcome::Inserted:
                ++report.inserted;
                break;
            case metadata::UpsertOutcome::TextChanged:
                ++report.reembedded;
                changed.push_back(std::move(id));
                break;
            case metadata::UpsertOutcome::Replaced:
                ++report.updated;
                changed.push_back(std::move(id));
                break;
        }
    }

    spdlog::info("Ingest: {} new, {} re-embedded, {} updated, {} rejected (snapshot v{})",
                 report.inserted, report.reembedded, report.updated, report.failures.size(),
                 report.snapshotVersion);
    if (listener_ && (!changed.empty() || report.inserted > 0))
        listener_(changed, report.inserted);
    return report;
}

Result<void> SearchEngine::removePart(const PartId& id) {
    std::lock_guard<std::mutex> lock(ingestMutex_);
    bool inCatalog = catalog_->remove(id);
    auto indexed = index_->remove(id);
    if (!inCatalog && !indexed) {
        return Error{ErrorCode::NotFound, "Part not found: " + id};
    }
    spdlog::info("Removed part '{}'", id);
    if (listener_)
        listener_({id}, 0);
    return Result<void>();
}

// ============================================================================
// Query execution
// ============================================================================

Result<SearchResultSet> SearchEngine::execute(const QueryContext& ctx,
                                              const std::atomic<bool>* cancelled) const {
    if (pastDeadline(ctx))
        return Error{ErrorCode::Timeout, "Deadline passed before execution"};

    auto snapshot = index_->acquire();
    if (ctx.topK == 0) {
        SearchResultSet empty;
        empty.snapshotVersion = snapshot->version();
        return empty;
    }

    metadata::PartRecordPtr pinned;
    if (ctx.query.intent == QueryIntent::ExactIdLookup && !ctx.query.tokens.empty()) {
        pinned = catalog_->findIgnoreCase(ctx.query.tokens.front());
        if (pinned && !ctx.filters.matches(*pinned))
            pinned.reset();
    }

    if (ctx.query.empty())
        return filterOnly(ctx.query, ctx.filters, ctx.topK, snapshot->version());

    auto embedding = provider_->encode(ctx.query.embeddingText());
    if (!embedding)
        return embedding.error();
    if (pastDeadline(ctx))
        return Error{ErrorCode::Timeout, "Deadline passed during query embedding"};

    auto result = rankNeighbors(embedding.value().values, ctx.query, ctx.filters, ctx.topK,
                                snapshot, pinned, cancelled);
    if (result && pastDeadline(ctx))
        return Error{ErrorCode::Timeout, "Deadline passed during ranking"};
    return result;
}

Result<SearchResultSet> SearchEngine::searchByVector(const std::vector<float>& vector,
                                                     const SearchFilters& filters, size_t topK,
                                                     const std::atomic<bool>* cancelled) const {
    auto snapshot = index_->acquire();
    return rankNeighbors(vector, OptimizedQuery{}, filters, topK, snapshot, nullptr, cancelled);
}

Result<SearchResultSet> SearchEngine::rankNeighbors(const std::vector<float>& vector,
                                                    const OptimizedQuery& query,
                                                    const SearchFilters& filters, size_t topK,
                                                    const vector::SnapshotHandle& snapshot,
                                                    const metadata::PartRecordPtr& pinned,
                                                    const std::atomic<bool>* cancelled) const {
    SearchResultSet out;
    out.snapshotVersion = snapshot->version();
    if (topK == 0)
        return out;

    const size_t available = snapshot->size();
    size_t fetch = std::max<size_t>(topK * std::max<size_t>(ranker_.getConfig().overfetch, 1), 1);
    std::vector<ScoredCandidate> candidates;

    // Widen the neighbourhood until enough candidates survive the filters
    while (true) {
        auto neighbors = snapshot->query(vector, fetch, cancelled);
        if (!neighbors)
            return neighbors.error();

        candidates.clear();
        for (const auto& n : neighbors.value()) {
            if (pinned && n.id == pinned->id)
                continue;
            auto record = catalog_->find(n.id);
            if (!record || !filters.matches(*record))
                continue;
            candidates.push_back(ranker_.evaluate(
                std::move(record), SimilarityRanker::similarityFromDistance(n.distance), query));
        }
        if (candidates.size() >= topK || neighbors.value().size() < fetch || fetch >= available)
            break;
        fetch = std::min(fetch * 4, available);
    }

    if (cancelled && cancelled->load(std::memory_order_relaxed))
        return Error{ErrorCode::OperationCancelled, "Query cancelled during ranking"};

    ranker_.rank(candidates);
    if (pinned) {
        float sim = 0.0f;
        if (auto v = snapshot->vectorOf(pinned->id))
            sim = SimilarityRanker::score(vector, *v);
        candidates.insert(candidates.begin(), ranker_.evaluate(pinned, sim, query));
    }
    if (candidates.size() > topK)
        candidates.resize(topK);
    out.hits = SimilarityRanker::toHits(candidates);
    return out;
}

SearchResultSet SearchEngine::filterOnly(const OptimizedQuery& query, const SearchFilters& filters,
                                         size_t topK, uint64_t snapshotVersion) const {
    auto records = catalog_->select(
        [&filters](const metadata::PartRecord& r) { return filters.matches(r); });

    std::vector<ScoredCandidate> candidates;
    candidates.reserve(records.size());
    for (auto& r : records)
        candidates.push_back(ranker_.evaluate(std::move(r), 0.0f, query));

    auto keep = std::min(topK, candidates.size());
    std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(keep),
                      candidates.end(), &SimilarityRanker::before);
    candidates.resize(keep);

    SearchResultSet out;
    out.snapshotVersion = snapshotVersion;
    out.hits = SimilarityRanker::toHits(candidates);
    return out;
}

// ============================================================================
// Catalog reads
// ============================================================================

std::optional<metadata::PartDetails> SearchEngine::getPart(const PartId& id) const {
    if (auto d = catalog_->details(id))
        return d;
    if (auto rec = catalog_->findIgnoreCase(id))
        return catalog_->details(rec->id);
    return std::nullopt;
}

BrowseResult SearchEngine::browseParts(const SearchFilters& filters, size_t limit,
                                       size_t offset) const {
    auto pred = [&filters](const metadata::PartRecord& r) { return filters.matches(r); };
    auto all = catalog_->select(pred);

    BrowseResult out;
    out.totalCount = all.size();
    out.limit = limit;
    out.offset = offset;
    out.facets = catalog_->facets(pred);
    if (offset < all.size()) {
        auto end = offset + std::min(limit, all.size() - offset);
        out.parts.assign(all.begin() + static_cast<std::ptrdiff_t>(offset),
                         all.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return out;
}

metadata::CatalogStats SearchEngine::getCatalogStats() const {
    return catalog_->stats();
}

} // namespace synvec::search
