// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <synvec/search/cache_key.h>
#include <synvec/search/query_processor.h>

#include <algorithm>

using namespace synvec::search;

namespace {

bool hasTerm(const std::vector<std::string>& v, const std::string& term) {
    return std::find(v.begin(), v.end(), term) != v.end();
}

} // namespace

TEST(QueryProcessorTest, TokenizeKeepsIdentifiersIntact) {
    auto tokens = QueryProcessor::tokenize("Find BBa_J23100, pSB1C3 and T7-lac.");
    std::vector<std::string> expected = {"find", "bba_j23100", "psb1c3", "and", "t7-lac"};
    EXPECT_EQ(tokens, expected);
}

TEST(QueryProcessorTest, StopwordsAreDropped) {
    QueryProcessor qp;
    auto q = qp.optimize("a promoter for the expression of GFP");
    std::vector<std::string> expected = {"promoter", "expression", "gfp"};
    EXPECT_EQ(q.tokens, expected);
    EXPECT_EQ(q.normalized, "promoter expression gfp");
}

TEST(QueryProcessorTest, OnlyStopwordsAreKept) {
    QueryProcessor qp;
    auto q = qp.optimize("the of");
    EXPECT_EQ(q.normalized, "the of");
    EXPECT_FALSE(q.empty());
}

TEST(QueryProcessorTest, ExpansionsAreSortedAndExcludeQueryTerms) {
    QueryProcessor qp;
    auto q = qp.optimize("GFP reporter");
    EXPECT_TRUE(hasTerm(q.expandedTerms, "green fluorescent protein"));
    EXPECT_TRUE(hasTerm(q.expandedTerms, "fluorescent protein"));
    EXPECT_FALSE(hasTerm(q.expandedTerms, "reporter"));
    EXPECT_TRUE(std::is_sorted(q.expandedTerms.begin(), q.expandedTerms.end()));
    EXPECT_EQ(q.lexiconVersion, "bio-v1");
    EXPECT_EQ(q.embeddingText().rfind("gfp reporter", 0), 0u);
}

TEST(QueryProcessorTest, ExpansionCountIsCapped) {
    QueryProcessor qp(QueryProcessorConfig{1});
    auto q = qp.optimize("gfp rfp yfp promoter");
    EXPECT_EQ(q.expandedTerms.size(), 1u);
}

TEST(QueryProcessorTest, SameInputSameOutput) {
    QueryProcessor qp;
    auto a = qp.optimize("  Inducible   PROMOTER  ");
    auto b = qp.optimize("inducible promoter");
    EXPECT_EQ(a.normalized, b.normalized);
    EXPECT_EQ(a.expandedTerms, b.expandedTerms);
    EXPECT_EQ(a.intent, b.intent);
    EXPECT_EQ(CacheKey::fromQuery(a, {}, 10), CacheKey::fromQuery(b, {}, 10));
}

TEST(QueryProcessorTest, IntentClassification) {
    QueryProcessor qp;
    EXPECT_EQ(qp.optimize("bba_j23100").intent, QueryIntent::ExactIdLookup);
    EXPECT_EQ(qp.optimize("BBa_J23100").intent, QueryIntent::ExactIdLookup);
    EXPECT_EQ(qp.optimize("promoter", true).intent, QueryIntent::FilterHeavy);
    EXPECT_EQ(qp.optimize("", true).intent, QueryIntent::FilterHeavy);
    EXPECT_EQ(qp.optimize("strong constitutive promoter for e. coli").intent,
              QueryIntent::Informational);
    EXPECT_EQ(intentToString(QueryIntent::FilterHeavy), "filter_heavy");
}

TEST(QueryProcessorTest, PartIdHeuristic) {
    EXPECT_TRUE(QueryProcessor::looksLikePartId("bba_j23100"));
    EXPECT_TRUE(QueryProcessor::looksLikePartId("k1234567"));
    EXPECT_TRUE(QueryProcessor::looksLikePartId("lab_7"));
    EXPECT_FALSE(QueryProcessor::looksLikePartId("gfp"));
    EXPECT_FALSE(QueryProcessor::looksLikePartId("t7"));
    EXPECT_FALSE(QueryProcessor::looksLikePartId("promoter"));
    EXPECT_FALSE(QueryProcessor::looksLikePartId("12345"));
}

TEST(QueryProcessorTest, CustomLexiconVersionFlowsIntoKey) {
    SynonymLexicon custom("test-lex", {{"gfp", {"glow"}}});
    QueryProcessor qp({}, custom);
    auto q = qp.optimize("gfp");
    EXPECT_EQ(q.lexiconVersion, "test-lex");
    ASSERT_EQ(q.expandedTerms.size(), 1u);
    EXPECT_EQ(q.expandedTerms[0], "glow");

    QueryProcessor builtin;
    EXPECT_NE(CacheKey::fromQuery(q, {}, 5), CacheKey::fromQuery(builtin.optimize("gfp"), {}, 5));
}
