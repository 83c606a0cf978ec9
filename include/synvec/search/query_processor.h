// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace synvec::search {

/**
 * @brief Closed set of query intents
 */
enum class QueryIntent {
    Informational, ///< Free-text question answered by vector similarity
    FilterHeavy,   ///< Few content terms, structured filters dominate
    ExactIdLookup  ///< A single part identifier such as "bba_j23100"
};

constexpr std::string_view intentToString(QueryIntent intent) {
    switch (intent) {
        case QueryIntent::Informational:
            return "informational";
        case QueryIntent::FilterHeavy:
            return "filter_heavy";
        case QueryIntent::ExactIdLookup:
            return "exact_id";
    }
    return "unknown";
}

/**
 * @brief Output of QueryProcessor::optimize
 */
struct OptimizedQuery {
    std::string normalized;                 ///< Lower-cased content tokens joined by spaces
    std::vector<std::string> tokens;        ///< Content tokens in query order
    std::vector<std::string> expandedTerms; ///< Synonym expansions, sorted and unique
    QueryIntent intent = QueryIntent::Informational;
    std::string lexiconVersion;

    /// Text handed to the embedding provider: normalized text followed by expansions
    std::string embeddingText() const;

    bool empty() const { return tokens.empty(); }
};

/**
 * @brief Versioned static synonym table
 *
 * Tables are immutable after construction; a given version always maps a token to the same
 * expansions.
 */
class SynonymLexicon {
public:
    using Table = std::map<std::string, std::vector<std::string>>;

    SynonymLexicon(std::string version, Table table);

    /// Built-in synthetic biology lexicon ("bio-v1")
    static const SynonymLexicon& builtin();

    const std::string& version() const { return version_; }
    const std::vector<std::string>* lookup(const std::string& token) const;
    size_t size() const { return table_.size(); }

private:
    std::string version_;
    Table table_;
};

struct QueryProcessorConfig {
    size_t max_expansions = 8;
};

/**
 * @brief Pure query normalisation, intent tagging and term expansion
 *
 * No state beyond the lexicon reference and configuration; safe to call from any thread.
 */
class QueryProcessor {
public:
    explicit QueryProcessor(QueryProcessorConfig config = {},
                            const SynonymLexicon& lexicon = SynonymLexicon::builtin());

    /**
     * @param hasFilters whether structured filters accompany the query text
     */
    OptimizedQuery optimize(const std::string& rawQuery, bool hasFilters = false) const;

    /// Lower-case and split; '_', '-' and '.' are kept inside tokens so ids survive intact.
    static std::vector<std::string> tokenize(const std::string& text);

    static bool isStopword(std::string_view token);

    /// Heuristic for registry-style identifiers: letters and at least three digits, or an
    /// underscore between letters and digits ("bba_j23100", "k1234567").
    static bool looksLikePartId(std::string_view token);

    const SynonymLexicon& lexicon() const { return lexicon_; }

private:
    QueryProcessorConfig config_;
    const SynonymLexicon& lexicon_;
};

} // namespace synvec::search
