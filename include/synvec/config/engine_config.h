// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/core/types.h>
#include <synvec/config/config_helpers.h>
#include <synvec/daemon/components/QueryCoordinator.h>
#include <synvec/daemon/components/ResourceRouter.h>
#include <synvec/search/adaptive_cache.h>
#include <synvec/search/query_processor.h>
#include <synvec/search/similarity_ranker.h>
#include <synvec/vector/vector_index_manager.h>

#include <chrono>
#include <filesystem>
#include <string>

namespace synvec::config {

struct QuerySettings {
    std::string lexicon_version = "bio-v1";
    search::QueryProcessorConfig processor;
};

struct ServiceSettings {
    size_t threads = 4;
    size_t workers = 1; // in-process backends registered with the router
    std::chrono::milliseconds heartbeat_interval{1000};
    daemon::CoordinatorConfig coordinator;
};

struct LoggingSettings {
    std::string level = "info";
    std::string file; // empty = stderr only
};

/**
 * @brief Complete engine configuration with documented defaults
 */
struct EngineConfig {
    vector::IndexConfig index;
    search::AdaptiveCacheConfig cache;
    daemon::RouterConfig router;
    search::RankingConfig ranking;
    QuerySettings query;
    ServiceSettings service;
    LoggingSettings logging;
};

/**
 * @brief Build an EngineConfig from already-parsed sections, then apply SYNVEC_* overrides
 *
 * Unknown keys are ignored. Malformed or out-of-range numbers are InvalidArgument naming the
 * offending section.key.
 */
Result<EngineConfig> buildEngineConfig(const ConfigMap& sections);

/// Parse the file at path (missing file = defaults) and build the configuration
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path);

} // namespace synvec::config
