// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/search/search_filters.h>
#include <synvec/search/similarity_ranker.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace synvec::search {

namespace {

std::string toLower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return !needle.empty() && haystack.find(needle) != std::string::npos;
}

} // namespace

SimilarityRanker::SimilarityRanker(const RankingConfig& config) : config_(config) {}

float SimilarityRanker::score(const std::vector<float>& queryVector,
                              const std::vector<float>& candidateVector) {
    if (queryVector.size() != candidateVector.size() || queryVector.empty())
        return 0.0f;
    double dot = 0.0, qn = 0.0, cn = 0.0;
    for (size_t i = 0; i < queryVector.size(); ++i) {
        dot += static_cast<double>(queryVector[i]) * candidateVector[i];
        qn += static_cast<double>(queryVector[i]) * queryVector[i];
        cn += static_cast<double>(candidateVector[i]) * candidateVector[i];
    }
    if (qn <= 0.0 || cn <= 0.0)
        return 0.0f;
    auto cosine = dot / (std::sqrt(qn) * std::sqrt(cn));
    return static_cast<float>(std::clamp(cosine, 0.0, 1.0));
}

float SimilarityRanker::similarityFromDistance(float distance) {
    return std::clamp(1.0f - distance, 0.0f, 1.0f);
}

float SimilarityRanker::combine(float similarity, float filterMatchScore, float usagePrior) const {
    return config_.similarity_weight * similarity + config_.filter_weight * filterMatchScore +
           config_.prior_weight * usagePrior;
}

float SimilarityRanker::usagePrior(uint64_t usageCount) const {
    if (config_.usage_saturation == 0)
        return usageCount > 0 ? 1.0f : 0.0f;
    auto p = std::log1p(static_cast<double>(usageCount)) /
             std::log1p(static_cast<double>(config_.usage_saturation));
    return static_cast<float>(std::min(1.0, p));
}

FieldMatch SimilarityRanker::matchFields(const OptimizedQuery& query,
                                         const metadata::PartRecord& record) {
    FieldMatch out;
    if (query.tokens.empty()) {
        // Filter-only queries match on their filters alone
        out.score = 1.0f;
        return out;
    }

    const auto id = toLower(record.id);
    const auto label = toLower(record.label);
    const auto description = toLower(record.description);
    const auto l1 = toLower(record.type.level1);
    const auto l2 = toLower(record.type.level2);
    const auto l3 = toLower(record.type.level3);
    const auto source = normalizeSourceCollection(record.sourceCollection);

    bool hitId = false, hitLabel = false, hitDesc = false, hitType = false, hitSource = false;
    size_t structured = 0;
    for (const auto& t : query.tokens) {
        bool onId = (t == id);
        bool onLabel = contains(label, t);
        bool onType = contains(l1, t) || contains(l2, t) || contains(l3, t);
        bool onSource = !source.empty() && normalizeSourceCollection(t) == source;
        hitId |= onId;
        hitLabel |= onLabel;
        hitType |= onType;
        hitSource |= onSource;
        hitDesc |= contains(description, t);
        if (onId || onLabel || onType || onSource)
            ++structured;
    }
    for (const auto& e : query.expandedTerms) {
        hitLabel |= contains(label, e);
        hitDesc |= contains(description, e);
        hitType |= contains(l1, e) || contains(l2, e) || contains(l3, e);
    }

    if (hitId)
        out.fields.emplace_back("id");
    if (hitLabel)
        out.fields.emplace_back("label");
    if (hitDesc)
        out.fields.emplace_back("description");
    if (hitType)
        out.fields.emplace_back("type");
    if (hitSource)
        out.fields.emplace_back("source");
    out.score = static_cast<float>(structured) / static_cast<float>(query.tokens.size());
    return out;
}

ScoredCandidate SimilarityRanker::evaluate(metadata::PartRecordPtr record, float similarity,
                                           const OptimizedQuery& query) const {
    ScoredCandidate c;
    auto match = matchFields(query, *record);
    c.similarity = similarity;
    c.filterMatch = match.score;
    c.prior = usagePrior(record->usageCount);
    c.score = combine(c.similarity, c.filterMatch, c.prior);
    c.matchedFields = std::move(match.fields);
    c.record = std::move(record);
    return c;
}

bool SimilarityRanker::before(const ScoredCandidate& a, const ScoredCandidate& b) {
    if (a.score != b.score)
        return a.score > b.score;
    if (a.record->successRate != b.record->successRate)
        return a.record->successRate > b.record->successRate;
    return a.record->id < b.record->id;
}

void SimilarityRanker::rank(std::vector<ScoredCandidate>& candidates) const {
    std::sort(candidates.begin(), candidates.end(), &SimilarityRanker::before);
}

std::vector<SearchHit> SimilarityRanker::toHits(const std::vector<ScoredCandidate>& ranked) {
    std::vector<SearchHit> hits;
    hits.reserve(ranked.size());
    for (const auto& c : ranked) {
        hits.push_back(SearchHit{c.record->id, c.score, c.matchedFields});
    }
    return hits;
}

} // namespace synvec::search
