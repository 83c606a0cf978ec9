// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/metadata/part_catalog.h>
#include <synvec/search/query_processor.h>
#include <synvec/search/search_results.h>

#include <cstdint>
#include <string>
#include <vector>

namespace synvec::search {

/**
 * @brief Configuration for composite ranking
 */
struct RankingConfig {
    // Composite score weights
    float similarity_weight = 0.70f;
    float filter_weight = 0.20f;
    float prior_weight = 0.10f;

    // Usage count at which the popularity prior saturates to 1.0
    uint64_t usage_saturation = 1000;

    // Candidates fetched from the index per requested result, before filtering
    size_t overfetch = 4;
};

/**
 * @brief A candidate with every signal the composite score is built from
 */
struct ScoredCandidate {
    metadata::PartRecordPtr record;
    float similarity = 0.0f;
    float filterMatch = 0.0f;
    float prior = 0.0f;
    float score = 0.0f;
    std::vector<std::string> matchedFields;
};

/**
 * @brief Which record fields the query terms hit, and the share of query tokens found in
 * structured fields
 */
struct FieldMatch {
    std::vector<std::string> fields;
    float score = 0.0f;
};

/**
 * @brief Composite ranking over explicit signals
 *
 * Every scoring function is pure; the ranker holds only its configuration.
 */
class SimilarityRanker {
public:
    explicit SimilarityRanker(const RankingConfig& config = {});

    const RankingConfig& getConfig() const { return config_; }

    /// Cosine similarity clamped to [0,1]; 0 for zero or mismatched vectors.
    static float score(const std::vector<float>& queryVector,
                       const std::vector<float>& candidateVector);

    /// Similarity from an index distance (1 - cosine), clamped to [0,1].
    static float similarityFromDistance(float distance);

    float combine(float similarity, float filterMatchScore, float usagePrior) const;

    /// min(1, log1p(usage) / log1p(saturation))
    float usagePrior(uint64_t usageCount) const;

    static FieldMatch matchFields(const OptimizedQuery& query, const metadata::PartRecord& record);

    /// Fills every signal and the composite score for one candidate
    ScoredCandidate evaluate(metadata::PartRecordPtr record, float similarity,
                             const OptimizedQuery& query) const;

    /// Total order: score desc, success rate desc, id asc
    static bool before(const ScoredCandidate& a, const ScoredCandidate& b);

    void rank(std::vector<ScoredCandidate>& candidates) const;

    static std::vector<SearchHit> toHits(const std::vector<ScoredCandidate>& ranked);

private:
    RankingConfig config_;
};

} // namespace synvec::search
