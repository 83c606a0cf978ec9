// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>

#include <synvec/config/engine_config.h>
#include <synvec/daemon/components/HeartbeatMonitor.h>
#include <synvec/daemon/components/QueryCoordinator.h>
#include <synvec/daemon/components/RequestDispatcher.h>
#include <synvec/daemon/components/WorkerPool.h>
#include <synvec/metadata/part_catalog.h>
#include <synvec/ml/embedding_provider.h>
#include <synvec/search/adaptive_cache.h>
#include <synvec/search/search_engine.h>
#include <synvec/vector/vector_index_manager.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace synvec;

namespace {

constexpr size_t kIngestBatch = 256;

bool setupLogging(const std::string& level, const std::string& file) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file, 10 * 1024 * 1024, 3));
        }
        auto logger = std::make_shared<spdlog::logger>("synvec", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::from_str(level));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return false;
    }
    return true;
}

// Everything a command needs, wired from one EngineConfig
struct Runtime {
    config::EngineConfig config;
    std::shared_ptr<daemon::WorkerPool> pool;
    std::shared_ptr<search::SearchEngine> engine;
    std::shared_ptr<search::AdaptiveCache> cache;
    std::shared_ptr<daemon::ResourceRouter> router;
    std::shared_ptr<daemon::QueryCoordinator> coordinator;
    std::shared_ptr<daemon::HeartbeatMonitor> monitor;

    ~Runtime() {
        if (monitor)
            monitor->stop();
        if (cache)
            cache->stopMaintenance();
        if (pool)
            pool->stop();
    }
};

Result<std::unique_ptr<Runtime>> buildRuntime(const config::EngineConfig& cfg) {
    auto rt = std::make_unique<Runtime>();
    rt->config = cfg;

    std::shared_ptr<ml::IEmbeddingProvider> provider =
        ml::createEmbeddingProvider("hashing", cfg.index.dimension, cfg.index.model_version);
    if (!provider)
        return Error{ErrorCode::NotInitialized, "No embedding provider"};

    auto index = std::make_shared<vector::VectorIndexManager>(cfg.index);
    auto catalog = std::make_shared<metadata::PartCatalog>();
    rt->engine = std::make_shared<search::SearchEngine>(provider, index, catalog, cfg.ranking);
    rt->cache = std::make_shared<search::AdaptiveCache>(cfg.cache);
    rt->router = std::make_shared<daemon::ResourceRouter>(cfg.router);
    rt->pool = std::make_shared<daemon::WorkerPool>(cfg.service.threads);
    rt->coordinator = std::make_shared<daemon::QueryCoordinator>(
        rt->engine, rt->cache, rt->router, rt->pool,
        search::QueryProcessor{cfg.query.processor}, cfg.service.coordinator);

    for (size_t i = 0; i < cfg.service.workers; ++i) {
        daemon::WorkerNode node{"local-" + std::to_string(i), "inproc://" + std::to_string(i),
                                cfg.router.capacity, cfg.router.max_queue};
        auto added = rt->coordinator->addBackend(
            node, std::make_shared<daemon::LocalSearchBackend>(rt->engine));
        if (!added)
            return added.error();
    }

    std::weak_ptr<daemon::QueryCoordinator> weak = rt->coordinator;
    rt->monitor = std::make_shared<daemon::HeartbeatMonitor>(
        rt->router,
        [weak](const daemon::WorkerStats& w) -> Result<daemon::HeartbeatMetrics> {
            auto coordinator = weak.lock();
            if (!coordinator)
                return Error{ErrorCode::NotInitialized, "Coordinator gone"};
            return coordinator->probe(w.id);
        },
        cfg.service.heartbeat_interval);
    // First round promotes the freshly registered workers before any query arrives
    rt->monitor->tick();
    if (auto r = rt->monitor->start(rt->pool->executor()); !r)
        return r.error();
    if (auto r = rt->cache->startMaintenance(rt->pool->executor()); !r)
        return r.error();
    return rt;
}

Result<search::IngestReport> ingestFile(daemon::QueryCoordinator& coordinator,
                                        const std::string& path) {
    std::ifstream in(path);
    if (!in)
        return Error{ErrorCode::IOError, "Cannot open " + path};

    search::IngestReport total;
    std::vector<metadata::PartRecord> batch;
    auto flush = [&]() {
        if (batch.empty())
            return;
        auto report = coordinator.ingest(std::move(batch));
        batch.clear();
        total.inserted += report.inserted;
        total.reembedded += report.reembedded;
        total.updated += report.updated;
        total.snapshotVersion = report.snapshotVersion;
        for (auto& f : report.failures)
            total.failures.push_back(std::move(f));
    };

    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;
        auto parsed = daemon::json::parse(line, nullptr, false);
        if (parsed.is_discarded()) {
            spdlog::warn("{}:{}: not valid JSON, skipped", path, lineNo);
            total.failures.push_back(
                {"", Error{ErrorCode::InvalidData, path + ":" + std::to_string(lineNo)}});
            continue;
        }
        auto rec = daemon::partRecordFromJson(parsed);
        if (!rec) {
            spdlog::warn("{}:{}: {}", path, lineNo, rec.error().message);
            total.failures.push_back({daemon::partIdFromJson(parsed), rec.error()});
            continue;
        }
        batch.push_back(std::move(rec).value());
        if (batch.size() >= kIngestBatch)
            flush();
    }
    flush();
    return total;
}

void printJson(const daemon::json& j) {
    std::cout << j.dump(2) << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"synvec - semantic retrieval over synthetic-biology part catalogues"};
    app.require_subcommand(1);

    std::string configPath;
    std::string logLevel;
    std::string logFile;
    std::string snapshotPath;
    std::vector<std::string> partFiles;
    bool jsonOutput = false;

    app.add_option("-c,--config", configPath, "Config file (default: $SYNVEC_CONFIG or XDG path)");
    app.add_option("-l,--log-level", logLevel, "Log level (trace, debug, info, warn, error)");
    app.add_option("--log-file", logFile, "Log file path (optional)");
    app.add_option("-s,--snapshot", snapshotPath,
                   "Index snapshot; loaded if present, written after ingest");
    app.add_option("-p,--parts", partFiles, "JSONL part files loaded before the command")
        ->check(CLI::ExistingFile);
    app.add_flag("--json", jsonOutput, "Print JSON instead of text");

    auto* ingestCmd = app.add_subcommand("ingest", "Embed and index JSONL part records");
    std::vector<std::string> ingestFiles;
    ingestCmd->add_option("files", ingestFiles, "JSONL files")->required()->check(
        CLI::ExistingFile);

    auto* searchCmd = app.add_subcommand("search", "Semantic search");
    std::string queryText;
    search::SearchFilters filters;
    size_t topK = 0;
    int64_t timeoutMs = 0;
    searchCmd->add_option("query", queryText, "Query text (empty lists by filters only)");
    searchCmd->add_option("-t,--type", filters.types, "Type filter (repeatable)");
    searchCmd->add_option("--source", filters.sources, "Source collection filter (repeatable)");
    searchCmd->add_option("--text", filters.text, "Keyword in id, label or description");
    searchCmd->add_option("-k,--top-k", topK, "Number of results");
    searchCmd->add_option("--timeout-ms", timeoutMs, "Query deadline in milliseconds")
        ->check(CLI::NonNegativeNumber);

    auto* partsCmd = app.add_subcommand("parts", "Browse parts by filters");
    size_t limit = 20;
    size_t offset = 0;
    std::string fastaPath;
    size_t fastaWidth = 0;
    partsCmd->add_option("-t,--type", filters.types, "Type filter (repeatable)");
    partsCmd->add_option("--source", filters.sources, "Source collection filter (repeatable)");
    partsCmd->add_option("--text", filters.text, "Keyword in id, label or description");
    partsCmd->add_option("--limit", limit, "Page size")->check(CLI::PositiveNumber);
    partsCmd->add_option("--offset", offset, "Rows to skip");
    partsCmd->add_option("--fasta", fastaPath, "Write the page as FASTA to this file");
    partsCmd->add_option("--fasta-width", fastaWidth, "Wrap FASTA sequences (0 = one line)");

    auto* partCmd = app.add_subcommand("part", "Show one part");
    std::string partId;
    partCmd->add_option("id", partId, "Part id")->required();

    auto* statsCmd = app.add_subcommand("stats", "Index, worker and catalog statistics");

    app.add_subcommand("serve", "Answer JSON requests from stdin, one per line");

    CLI11_PARSE(app, argc, argv);

    auto cfgPath = config::get_config_path(configPath);
    auto cfg = config::loadEngineConfig(cfgPath);
    if (!cfg) {
        std::cerr << "Invalid configuration " << cfgPath << ": " << cfg.error().message
                  << std::endl;
        return 1;
    }
    auto engineConfig = cfg.value();
    if (!logLevel.empty())
        engineConfig.logging.level = logLevel;
    if (!logFile.empty())
        engineConfig.logging.file = logFile;
    if (!setupLogging(engineConfig.logging.level, engineConfig.logging.file))
        return 1;

    auto runtime = buildRuntime(engineConfig);
    if (!runtime) {
        spdlog::error("Startup failed: {}", runtime.error().message);
        return 1;
    }
    auto& rt = *runtime.value();
    auto& coordinator = *rt.coordinator;

    std::error_code ec;
    if (!snapshotPath.empty() && std::filesystem::exists(snapshotPath, ec)) {
        if (auto r = coordinator.loadSnapshot(snapshotPath); !r) {
            spdlog::error("Cannot load snapshot {}: {}", snapshotPath, r.error().message);
            return 1;
        }
    }

    auto loadParts = [&coordinator](const std::vector<std::string>& files) -> bool {
        for (const auto& f : files) {
            auto report = ingestFile(coordinator, f);
            if (!report) {
                spdlog::error("{}", report.error().message);
                return false;
            }
        }
        return true;
    };
    if (!loadParts(partFiles))
        return 1;

    try {
        if (*ingestCmd) {
            search::IngestReport total;
            for (const auto& f : ingestFiles) {
                auto report = ingestFile(coordinator, f);
                if (!report) {
                    spdlog::error("{}", report.error().message);
                    return 1;
                }
                total.inserted += report.value().inserted;
                total.reembedded += report.value().reembedded;
                total.updated += report.value().updated;
                total.snapshotVersion = report.value().snapshotVersion;
                for (const auto& fl : report.value().failures)
                    total.failures.push_back(fl);
            }
            if (!snapshotPath.empty()) {
                if (auto r = coordinator.saveSnapshot(snapshotPath); !r) {
                    spdlog::error("Cannot save snapshot {}: {}", snapshotPath, r.error().message);
                    return 1;
                }
            }
            if (jsonOutput) {
                printJson(daemon::toJson(total));
            } else {
                std::cout << "Ingested " << total.accepted() << " parts (" << total.inserted
                          << " new, " << total.reembedded << " re-embedded, " << total.updated
                          << " updated), " << total.failures.size() << " rejected" << std::endl;
            }
            return total.failures.empty() ? 0 : 2;
        }

        if (*searchCmd) {
            daemon::SearchRequest req;
            req.query = queryText;
            req.filters = filters;
            req.topK = topK;
            req.timeout = std::chrono::milliseconds(timeoutMs);
            auto r = coordinator.search(req);
            if (!r) {
                spdlog::error("Search failed: {} ({})", r.error().message, r.error().code);
                return 1;
            }
            if (jsonOutput) {
                printJson(daemon::toJson(r.value()));
                return 0;
            }
            for (const auto& w : r.value().warnings)
                std::cerr << "warning: " << w.message << std::endl;
            size_t rank = 0;
            for (const auto& hit : r.value().hits) {
                auto rec = rt.engine->catalog()->find(hit.id);
                std::cout << ++rank << ". " << hit.id << "  " << fmt::format("{:.4f}", hit.score);
                if (rec)
                    std::cout << "  " << rec->label << " [" << rec->type.mostSpecific() << "]";
                std::cout << std::endl;
            }
            if (rank == 0)
                std::cout << "No results" << std::endl;
            return 0;
        }

        if (*partsCmd) {
            auto page = rt.engine->browseParts(filters, limit, offset);
            if (!fastaPath.empty()) {
                std::ofstream fasta(fastaPath, std::ios::trunc);
                if (!fasta) {
                    spdlog::error("Cannot open {} for writing", fastaPath);
                    return 1;
                }
                auto written = metadata::writeFasta(fasta, page.parts, fastaWidth);
                fasta.flush();
                if (!fasta) {
                    spdlog::error("Failed writing {}", fastaPath);
                    return 1;
                }
                spdlog::info("Wrote {} parts to {}", written, fastaPath);
            }
            if (jsonOutput) {
                printJson(daemon::toJson(page));
                return 0;
            }
            for (const auto& p : page.parts) {
                std::cout << p->id << "  " << p->label << " [" << p->type.mostSpecific() << "]  "
                          << p->sourceCollection << std::endl;
            }
            std::cout << "Showing " << page.parts.size() << " of " << page.totalCount << " parts"
                      << std::endl;
            return 0;
        }

        if (*partCmd) {
            auto details = rt.engine->getPart(partId);
            if (!details) {
                std::cerr << "Part not found: " << partId << std::endl;
                return 1;
            }
            if (jsonOutput) {
                printJson(daemon::toJson(*details));
                return 0;
            }
            const auto& rec = details->record;
            std::cout << rec.id << "  " << rec.label << "\n"
                      << "  type:     " << rec.type.level1 << " / " << rec.type.level2 << " / "
                      << rec.type.level3 << "\n"
                      << "  source:   " << rec.sourceCollection << "\n"
                      << "  length:   " << details->sequenceLength << " bp\n";
            if (details->gcContent)
                std::cout << "  GC:       " << fmt::format("{:.1f}%", *details->gcContent) << "\n";
            std::cout << "  " << rec.description << std::endl;
            return 0;
        }

        if (*statsCmd) {
            daemon::json out{{"index", daemon::toJson(coordinator.getIndexStats())},
                             {"catalog", daemon::toJson(rt.engine->getCatalogStats())}};
            daemon::json workers = daemon::json::array();
            for (const auto& w : coordinator.getWorkerStats())
                workers.push_back(daemon::toJson(w));
            out["workers"] = std::move(workers);
            printJson(out);
            return 0;
        }

        // serve
        daemon::RequestDispatcher dispatcher(rt.coordinator);
        spdlog::info("Serving JSON requests on stdin ({} operations)",
                     daemon::RequestDispatcher::operations().size());
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos)
                continue;
            auto request = daemon::json::parse(line, nullptr, false);
            daemon::json response =
                request.is_discarded()
                    ? daemon::json{{"ok", false},
                                   {"error", daemon::toJson(Error{ErrorCode::InvalidArgument,
                                                                  "Request is not valid JSON"})}}
                    : dispatcher.handle(request);
            std::cout << response.dump() << std::endl;
        }
        if (!snapshotPath.empty()) {
            if (auto r = coordinator.saveSnapshot(snapshotPath); !r)
                spdlog::warn("Cannot save snapshot {}: {}", snapshotPath, r.error().message);
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
