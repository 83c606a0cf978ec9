// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/search/query_processor.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <set>

namespace synvec::search {

namespace {

constexpr std::array<std::string_view, 18> kStopwords = {
    "a",  "an", "and", "are", "by", "for",  "from", "in",   "is",
    "me", "of", "on",  "or",  "that", "the", "to",  "which", "with"};

bool isTokenChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-' || c == '.';
}

std::string trimTokenPunct(std::string token) {
    auto isEdge = [](char c) { return c == '-' || c == '.' || c == '_'; };
    while (!token.empty() && isEdge(token.back()))
        token.pop_back();
    size_t start = 0;
    while (start < token.size() && isEdge(token[start]))
        ++start;
    return token.substr(start);
}

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty())
            out += sep;
        out += p;
    }
    return out;
}

} // namespace

std::string OptimizedQuery::embeddingText() const {
    if (expandedTerms.empty())
        return normalized;
    auto extra = join(expandedTerms, " ");
    return normalized.empty() ? extra : normalized + " " + extra;
}

// ============================================================================
// SynonymLexicon
// ============================================================================

SynonymLexicon::SynonymLexicon(std::string version, Table table)
    : version_(std::move(version)), table_(std::move(table)) {}

const SynonymLexicon& SynonymLexicon::builtin() {
    static const SynonymLexicon kBioV1{
        "bio-v1",
        {
            {"activator", {"regulatory", "transcription factor"}},
            {"backbone", {"plasmid", "vector"}},
            {"cds", {"coding sequence"}},
            {"cfp", {"cyan fluorescent protein", "reporter"}},
            {"enzyme", {"protein"}},
            {"gfp", {"green fluorescent protein", "reporter"}},
            {"inducible", {"regulated", "promoter"}},
            {"operator", {"regulatory", "binding site"}},
            {"plasmid", {"backbone", "vector"}},
            {"primer", {"oligonucleotide"}},
            {"promoter", {"regulatory", "transcription initiation"}},
            {"rbs", {"ribosome binding site"}},
            {"reporter", {"fluorescent protein"}},
            {"repressor", {"regulatory", "transcription factor"}},
            {"rfp", {"red fluorescent protein", "reporter"}},
            {"ribosome", {"rbs"}},
            {"terminator", {"transcription termination"}},
            {"yfp", {"yellow fluorescent protein", "reporter"}},
        }};
    return kBioV1;
}

const std::vector<std::string>* SynonymLexicon::lookup(const std::string& token) const {
    auto it = table_.find(token);
    return it == table_.end() ? nullptr : &it->second;
}

// ============================================================================
// QueryProcessor
// ============================================================================

QueryProcessor::QueryProcessor(QueryProcessorConfig config, const SynonymLexicon& lexicon)
    : config_(config), lexicon_(lexicon) {}

std::vector<std::string> QueryProcessor::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        auto t = trimTokenPunct(std::move(current));
        if (!t.empty())
            tokens.push_back(std::move(t));
        current.clear();
    };
    for (unsigned char c : text) {
        if (isTokenChar(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

bool QueryProcessor::isStopword(std::string_view token) {
    return std::binary_search(kStopwords.begin(), kStopwords.end(), token);
}

bool QueryProcessor::looksLikePartId(std::string_view token) {
    if (token.size() < 4)
        return false;
    size_t letters = 0;
    size_t digits = 0;
    bool underscore = false;
    for (char c : token) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc))
            ++letters;
        else if (std::isdigit(uc))
            ++digits;
        else if (c == '_')
            underscore = true;
        else
            return false;
    }
    if (letters == 0 || digits == 0)
        return false;
    return digits >= 3 || underscore;
}

OptimizedQuery QueryProcessor::optimize(const std::string& rawQuery, bool hasFilters) const {
    OptimizedQuery out;
    out.lexiconVersion = lexicon_.version();

    auto all = tokenize(rawQuery);
    for (auto& t : all) {
        if (!isStopword(t))
            out.tokens.push_back(t);
    }
    // A query made only of stopwords keeps them rather than becoming empty
    if (out.tokens.empty())
        out.tokens = std::move(all);
    out.normalized = join(out.tokens, " ");

    std::set<std::string> present(out.tokens.begin(), out.tokens.end());
    std::set<std::string> expansions;
    for (const auto& t : out.tokens) {
        if (const auto* syn = lexicon_.lookup(t)) {
            for (const auto& s : *syn) {
                if (!present.count(s))
                    expansions.insert(s);
            }
        }
    }
    out.expandedTerms.assign(expansions.begin(), expansions.end());
    if (out.expandedTerms.size() > config_.max_expansions)
        out.expandedTerms.resize(config_.max_expansions);

    if (out.tokens.size() == 1 && looksLikePartId(out.tokens.front())) {
        out.intent = QueryIntent::ExactIdLookup;
    } else if (out.tokens.empty() || (hasFilters && out.tokens.size() <= 2)) {
        out.intent = QueryIntent::FilterHeavy;
    } else {
        out.intent = QueryIntent::Informational;
    }
    return out;
}

} // namespace synvec::search
