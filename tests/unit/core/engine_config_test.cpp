// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <synvec/config/engine_config.h>

#include "../../common/synvec_test_helpers.h"

#include <cstdlib>
#include <fstream>

using namespace synvec;
using namespace synvec::config;

namespace {

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {"SYNVEC_INDEX_EF_SEARCH", "SYNVEC_CACHE_BUDGET_MB",
                                 "SYNVEC_LOG_LEVEL", "SYNVEC_SERVICE_THREADS"})
            ::unsetenv(name);
    }
    void TearDown() override { SetUp(); }

    std::filesystem::path writeConfig(const std::string& body) {
        auto path = dir_.path() / "config.toml";
        std::ofstream out(path);
        out << body;
        return path;
    }

    test::TempDir dir_;
};

} // namespace

TEST_F(EngineConfigTest, MissingFileYieldsDefaults) {
    auto cfg = loadEngineConfig(dir_.path() / "absent.toml");
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& c = cfg.value();
    EXPECT_EQ(c.index.dimension, 384u);
    EXPECT_EQ(c.index.model_version, "all-MiniLM-L6-v2");
    EXPECT_EQ(c.index.hnsw_ef_search, 64u);
    EXPECT_EQ(c.cache.max_memory_bytes, 64u * 1024 * 1024);
    EXPECT_EQ(c.cache.ttl, std::chrono::seconds(300));
    EXPECT_DOUBLE_EQ(c.router.load_weight, 0.4);
    EXPECT_EQ(c.router.capacity, 8u);
    EXPECT_FLOAT_EQ(c.ranking.similarity_weight, 0.70f);
    EXPECT_EQ(c.service.coordinator.default_top_k, 10u);
    EXPECT_EQ(c.logging.level, "info");
}

TEST_F(EngineConfigTest, ParsesSections) {
    auto path = writeConfig(R"(
# synvec engine
[index]
dimension = 128
model_version = "bio-embed-v2"
hnsw_ef_search = 96   # wider search
stale_after_s = 600
normalize = true

[cache]
budget_mb = 8
ttl_s = 30
cost_bound_ms = 20

[router]
capacity = 4
max_queue = 2
recovery_streak = 5
heartbeat_interval_ms = 250

[ranking]
similarity_weight = 0.6
prior_weight = 0.2

[service]
threads = 2
default_timeout_ms = 500

[logging]
level = "debug"
)");
    auto cfg = loadEngineConfig(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& c = cfg.value();
    EXPECT_EQ(c.index.dimension, 128u);
    EXPECT_EQ(c.index.model_version, "bio-embed-v2");
    EXPECT_EQ(c.index.hnsw_ef_search, 96u);
    EXPECT_EQ(c.index.stale_after, std::chrono::seconds(600));
    EXPECT_EQ(c.cache.max_memory_bytes, 8u * 1024 * 1024);
    EXPECT_EQ(c.cache.ttl, std::chrono::seconds(30));
    EXPECT_EQ(c.cache.cost_bound, std::chrono::milliseconds(20));
    EXPECT_EQ(c.router.capacity, 4u);
    EXPECT_EQ(c.router.max_queue, 2u);
    EXPECT_EQ(c.router.health.recovery_streak, 5u);
    EXPECT_EQ(c.service.heartbeat_interval, std::chrono::milliseconds(250));
    EXPECT_FLOAT_EQ(c.ranking.similarity_weight, 0.6f);
    EXPECT_FLOAT_EQ(c.ranking.prior_weight, 0.2f);
    EXPECT_EQ(c.service.threads, 2u);
    EXPECT_EQ(c.service.coordinator.default_timeout, std::chrono::milliseconds(500));
    EXPECT_EQ(c.logging.level, "debug");
}

TEST_F(EngineConfigTest, MalformedNumberIsInvalidArgument) {
    auto path = writeConfig("[index]\nhnsw_ef_search = lots\n");
    auto cfg = loadEngineConfig(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(cfg.error().message.find("hnsw_ef_search"), std::string::npos);
}

TEST_F(EngineConfigTest, NegativeCountIsRejected) {
    auto path = writeConfig("[router]\ncapacity = -2\n");
    auto cfg = loadEngineConfig(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidArgument);
}

TEST_F(EngineConfigTest, OutOfRangeValueIsRejected) {
    auto path = writeConfig("[router]\newma_alpha = 1.5\n");
    auto cfg = loadEngineConfig(path);
    ASSERT_FALSE(cfg);
    EXPECT_NE(cfg.error().message.find("ewma_alpha"), std::string::npos);
}

TEST_F(EngineConfigTest, TimeoutsAreBounded) {
    auto ok = loadEngineConfig(writeConfig("[service]\nmax_timeout_ms = 60000\n"));
    ASSERT_TRUE(ok) << ok.error().message;
    EXPECT_EQ(ok.value().service.coordinator.max_timeout, std::chrono::minutes(1));

    auto huge = loadEngineConfig(writeConfig("[service]\nmax_timeout_ms = 10000000000000\n"));
    ASSERT_FALSE(huge);
    EXPECT_NE(huge.error().message.find("max_timeout_ms"), std::string::npos);

    auto inverted = loadEngineConfig(
        writeConfig("[service]\ndefault_timeout_ms = 5000\nmax_timeout_ms = 1000\n"));
    ASSERT_FALSE(inverted);
    EXPECT_EQ(inverted.error().code, ErrorCode::InvalidArgument);
}

TEST_F(EngineConfigTest, UnknownLexiconIsRejected) {
    auto path = writeConfig("[query]\nlexicon_version = \"chem-v9\"\n");
    auto cfg = loadEngineConfig(path);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidArgument);
}

TEST_F(EngineConfigTest, DottedKeysAtTopLevelAreFolded) {
    auto path = writeConfig("cache.shards = 4\nindex.exact_threshold = 10\n");
    auto cfg = loadEngineConfig(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().cache.shards, 4u);
    EXPECT_EQ(cfg.value().index.exact_threshold, 10u);
}

TEST_F(EngineConfigTest, EnvironmentOverridesFile) {
    auto path = writeConfig("[index]\nhnsw_ef_search = 32\n[cache]\nbudget_mb = 4\n");
    ::setenv("SYNVEC_INDEX_EF_SEARCH", "200", 1);
    ::setenv("SYNVEC_CACHE_BUDGET_MB", "16", 1);
    ::setenv("SYNVEC_LOG_LEVEL", "warn", 1);
    auto cfg = loadEngineConfig(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().index.hnsw_ef_search, 200u);
    EXPECT_EQ(cfg.value().cache.max_memory_bytes, 16u * 1024 * 1024);
    EXPECT_EQ(cfg.value().logging.level, "warn");
}

TEST_F(EngineConfigTest, MalformedEnvironmentOverrideIsReported) {
    ::setenv("SYNVEC_SERVICE_THREADS", "four", 1);
    auto cfg = buildEngineConfig({});
    ASSERT_FALSE(cfg);
    EXPECT_NE(cfg.error().message.find("threads"), std::string::npos);
}
