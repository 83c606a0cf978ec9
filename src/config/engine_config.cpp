// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/config/engine_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <optional>

namespace synvec::config {

namespace {

struct EnvOverride {
    const char* env;
    const char* section;
    const char* key;
};

constexpr std::array<EnvOverride, 15> kEnvOverrides{{
    {"SYNVEC_INDEX_DIMENSION", "index", "dimension"},
    {"SYNVEC_INDEX_MODEL_VERSION", "index", "model_version"},
    {"SYNVEC_INDEX_EF_SEARCH", "index", "hnsw_ef_search"},
    {"SYNVEC_INDEX_EXACT_THRESHOLD", "index", "exact_threshold"},
    {"SYNVEC_INDEX_STALE_AFTER_S", "index", "stale_after_s"},
    {"SYNVEC_CACHE_BUDGET_MB", "cache", "budget_mb"},
    {"SYNVEC_CACHE_TTL_S", "cache", "ttl_s"},
    {"SYNVEC_ROUTER_CAPACITY", "router", "capacity"},
    {"SYNVEC_ROUTER_MAX_QUEUE", "router", "max_queue"},
    {"SYNVEC_SERVICE_THREADS", "service", "threads"},
    {"SYNVEC_SERVICE_WORKERS", "service", "workers"},
    {"SYNVEC_SERVICE_TIMEOUT_MS", "service", "default_timeout_ms"},
    {"SYNVEC_SERVICE_MAX_TIMEOUT_MS", "service", "max_timeout_ms"},
    {"SYNVEC_LOG_LEVEL", "logging", "level"},
    {"SYNVEC_LOG_FILE", "logging", "file"},
}};

std::optional<uint64_t> parseUnsigned(std::string s) {
    trim(s);
    if (s.empty() || s.front() == '-' || s.front() == '+')
        return std::nullopt;
    try {
        size_t pos = 0;
        auto v = std::stoull(s, &pos);
        if (pos != s.size())
            return std::nullopt;
        return static_cast<uint64_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> parseDouble(std::string s) {
    trim(s);
    if (s.empty())
        return std::nullopt;
    try {
        size_t pos = 0;
        auto v = std::stod(s, &pos);
        if (pos != s.size() || !std::isfinite(v))
            return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> parseBool(std::string s) {
    trim(s);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "1" || s == "yes" || s == "on")
        return true;
    if (s == "false" || s == "0" || s == "no" || s == "off")
        return false;
    return std::nullopt;
}

// Reads typed values out of the section map, remembering the first failure
class SectionReader {
public:
    explicit SectionReader(const ConfigMap& sections) : sections_(sections) {}

    const std::string* raw(const char* section, const char* key) const {
        auto s = sections_.find(section);
        if (s == sections_.end())
            return nullptr;
        auto k = s->second.find(key);
        return k == s->second.end() ? nullptr : &k->second;
    }

    template <typename T> void unsignedValue(const char* section, const char* key, T& out) {
        const auto* v = raw(section, key);
        if (!v)
            return;
        auto parsed = parseUnsigned(*v);
        if (!parsed || *parsed > std::numeric_limits<T>::max()) {
            fail(section, key, *v, "a non-negative integer");
            return;
        }
        out = static_cast<T>(*parsed);
    }

    template <typename T> void realValue(const char* section, const char* key, T& out) {
        const auto* v = raw(section, key);
        if (!v)
            return;
        auto parsed = parseDouble(*v);
        if (!parsed) {
            fail(section, key, *v, "a number");
            return;
        }
        out = static_cast<T>(*parsed);
    }

    void boolValue(const char* section, const char* key, bool& out) {
        const auto* v = raw(section, key);
        if (!v)
            return;
        auto parsed = parseBool(*v);
        if (!parsed) {
            fail(section, key, *v, "a boolean");
            return;
        }
        out = *parsed;
    }

    void stringValue(const char* section, const char* key, std::string& out) {
        if (const auto* v = raw(section, key))
            out = *v;
    }

    template <typename Duration>
    void durationValue(const char* section, const char* key, Duration& out) {
        uint64_t count = static_cast<uint64_t>(out.count());
        unsignedValue(section, key, count);
        out = Duration(static_cast<typename Duration::rep>(count));
    }

    void require(bool ok, const char* section, const char* key, const char* what) {
        if (!ok && !error_)
            error_ = Error{ErrorCode::InvalidArgument,
                           std::string("[") + section + "] " + key + " must be " + what};
    }

    const std::optional<Error>& error() const { return error_; }

private:
    void fail(const char* section, const char* key, const std::string& value,
              const char* expected) {
        if (!error_) {
            error_ = Error{ErrorCode::InvalidArgument, std::string("[") + section + "] " + key +
                                                           " = '" + value + "' is not " + expected};
        }
    }

    const ConfigMap& sections_;
    std::optional<Error> error_;
};

bool knownLogLevel(const std::string& level) {
    static constexpr std::array<std::string_view, 8> kLevels{
        "trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
    return std::find(kLevels.begin(), kLevels.end(), level) != kLevels.end();
}

} // namespace

Result<EngineConfig> buildEngineConfig(const ConfigMap& fileSections) {
    ConfigMap sections = fileSections;
    for (const auto& o : kEnvOverrides) {
        if (auto v = env_value(o.env)) {
            spdlog::debug("Config: {} overrides [{}] {}", o.env, o.section, o.key);
            sections[o.section][o.key] = *v;
        }
    }

    EngineConfig cfg;
    SectionReader r(sections);

    // [index]
    auto& idx = cfg.index;
    r.unsignedValue("index", "dimension", idx.dimension);
    r.stringValue("index", "model_version", idx.model_version);
    r.unsignedValue("index", "hnsw_m", idx.hnsw_m);
    r.unsignedValue("index", "hnsw_ef_construction", idx.hnsw_ef_construction);
    r.unsignedValue("index", "hnsw_ef_search", idx.hnsw_ef_search);
    r.unsignedValue("index", "exact_threshold", idx.exact_threshold);
    r.unsignedValue("index", "delta_threshold", idx.delta_threshold);
    r.realValue("index", "compaction_ratio", idx.compaction_ratio);
    r.durationValue("index", "stale_after_s", idx.stale_after);
    r.boolValue("index", "normalize", idx.normalize_vectors);
    r.require(idx.dimension > 0, "index", "dimension", "positive");
    r.require(!idx.model_version.empty(), "index", "model_version", "non-empty");
    r.require(idx.hnsw_m >= 2, "index", "hnsw_m", "at least 2");
    r.require(idx.hnsw_ef_search > 0, "index", "hnsw_ef_search", "positive");
    r.require(idx.compaction_ratio > 0.0 && idx.compaction_ratio <= 1.0, "index",
              "compaction_ratio", "in (0, 1]");

    // [cache]
    auto& cache = cfg.cache;
    size_t budgetMb = cache.max_memory_bytes / (1024 * 1024);
    r.unsignedValue("cache", "budget_mb", budgetMb);
    cache.max_memory_bytes = budgetMb * 1024 * 1024;
    r.unsignedValue("cache", "shards", cache.shards);
    std::chrono::seconds ttl = std::chrono::duration_cast<std::chrono::seconds>(cache.ttl);
    r.durationValue("cache", "ttl_s", ttl);
    cache.ttl = ttl;
    r.unsignedValue("cache", "admit_threshold", cache.admit_threshold);
    r.unsignedValue("cache", "window", cache.window);
    r.durationValue("cache", "cost_bound_ms", cache.cost_bound);
    r.unsignedValue("cache", "eviction_sample", cache.eviction_sample);
    r.durationValue("cache", "sweep_interval_ms", cache.sweep_interval);
    r.require(cache.max_memory_bytes > 0, "cache", "budget_mb", "positive");
    r.require(cache.shards > 0, "cache", "shards", "positive");
    r.require(cache.window > 0, "cache", "window", "positive");
    r.require(cache.eviction_sample > 0, "cache", "eviction_sample", "positive");
    r.require(cache.sweep_interval.count() > 0, "cache", "sweep_interval_ms", "positive");

    // [router]
    auto& router = cfg.router;
    r.realValue("router", "load_weight", router.load_weight);
    r.realValue("router", "latency_weight", router.latency_weight);
    r.realValue("router", "health_weight", router.health_weight);
    r.realValue("router", "latency_reference_ms", router.latency_reference_ms);
    r.realValue("router", "degraded_health", router.degraded_health);
    r.realValue("router", "slow_threshold_ms", router.slow_threshold_ms);
    r.realValue("router", "ewma_alpha", router.ewma_alpha);
    r.unsignedValue("router", "capacity", router.capacity);
    r.unsignedValue("router", "max_queue", router.max_queue);
    r.unsignedValue("router", "degrade_after", router.health.degrade_after);
    r.unsignedValue("router", "unhealthy_after", router.health.unhealthy_after);
    r.unsignedValue("router", "recovery_streak", router.health.recovery_streak);
    r.realValue("router", "error_rate_threshold", router.health.error_rate_threshold);
    r.unsignedValue("router", "error_rate_min_samples", router.health.error_rate_min_samples);
    r.durationValue("router", "heartbeat_interval_ms", cfg.service.heartbeat_interval);
    r.require(router.load_weight >= 0 && router.latency_weight >= 0 && router.health_weight >= 0,
              "router", "weights", "non-negative");
    r.require(router.latency_reference_ms > 0, "router", "latency_reference_ms", "positive");
    r.require(router.ewma_alpha > 0 && router.ewma_alpha <= 1, "router", "ewma_alpha",
              "in (0, 1]");
    r.require(router.capacity > 0, "router", "capacity", "positive");
    r.require(router.health.recovery_streak > 0, "router", "recovery_streak", "positive");
    r.require(router.health.error_rate_threshold > 0 && router.health.error_rate_threshold <= 1,
              "router", "error_rate_threshold", "in (0, 1]");
    r.require(cfg.service.heartbeat_interval.count() > 0, "router", "heartbeat_interval_ms",
              "positive");

    // [ranking]
    auto& ranking = cfg.ranking;
    r.realValue("ranking", "similarity_weight", ranking.similarity_weight);
    r.realValue("ranking", "filter_weight", ranking.filter_weight);
    r.realValue("ranking", "prior_weight", ranking.prior_weight);
    r.unsignedValue("ranking", "usage_saturation", ranking.usage_saturation);
    r.unsignedValue("ranking", "overfetch", ranking.overfetch);
    r.require(ranking.similarity_weight >= 0 && ranking.filter_weight >= 0 &&
                  ranking.prior_weight >= 0,
              "ranking", "weights", "non-negative");
    r.require(ranking.usage_saturation > 0, "ranking", "usage_saturation", "positive");
    r.require(ranking.overfetch > 0, "ranking", "overfetch", "positive");

    // [query]
    r.stringValue("query", "lexicon_version", cfg.query.lexicon_version);
    r.unsignedValue("query", "max_expansions", cfg.query.processor.max_expansions);
    r.require(cfg.query.lexicon_version == search::SynonymLexicon::builtin().version(), "query",
              "lexicon_version", "a known lexicon");

    // [service]
    auto& service = cfg.service;
    r.unsignedValue("service", "threads", service.threads);
    r.unsignedValue("service", "workers", service.workers);
    r.durationValue("service", "default_timeout_ms", service.coordinator.default_timeout);
    r.durationValue("service", "max_timeout_ms", service.coordinator.max_timeout);
    r.unsignedValue("service", "default_top_k", service.coordinator.default_top_k);
    r.unsignedValue("service", "max_top_k", service.coordinator.max_top_k);
    r.require(service.threads > 0, "service", "threads", "positive");
    r.require(service.workers > 0, "service", "workers", "positive");
    r.require(service.coordinator.default_timeout.count() > 0, "service", "default_timeout_ms",
              "positive");
    r.require(service.coordinator.max_timeout.count() > 0 &&
                  service.coordinator.max_timeout <= std::chrono::hours(24),
              "service", "max_timeout_ms", "positive and at most one day");
    r.require(service.coordinator.default_timeout <= service.coordinator.max_timeout, "service",
              "default_timeout_ms", "at most max_timeout_ms");
    r.require(service.coordinator.default_top_k > 0 &&
                  service.coordinator.default_top_k <= service.coordinator.max_top_k,
              "service", "default_top_k", "between 1 and max_top_k");

    // [logging]
    r.stringValue("logging", "level", cfg.logging.level);
    r.stringValue("logging", "file", cfg.logging.file);
    r.require(knownLogLevel(cfg.logging.level), "logging", "level", "a spdlog level name");

    if (r.error())
        return *r.error();
    return cfg;
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path) {
    std::error_code ec;
    if (!path.empty() && !std::filesystem::exists(path, ec))
        spdlog::debug("Config: {} not found, using defaults", path.string());
    return buildEngineConfig(path.empty() ? ConfigMap{} : parse_config_file(path));
}

} // namespace synvec::config
