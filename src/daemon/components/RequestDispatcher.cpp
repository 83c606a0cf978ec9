// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/daemon/components/RequestDispatcher.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace synvec::daemon {

// ============================================================================
// JSON codecs
// ============================================================================

namespace {

std::vector<std::string> stringList(const json& j) {
    if (j.is_null())
        return {};
    if (j.is_string())
        return {j.get<std::string>()};
    // Throws json::type_error for anything but an array of strings
    return j.get<std::vector<std::string>>();
}

std::string stringField(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return {};
    return it->get<std::string>();
}

json facetList(const std::vector<metadata::FacetCount>& facets) {
    json arr = json::array();
    for (const auto& f : facets)
        arr.push_back({{"name", f.name}, {"count", f.count}});
    return arr;
}

} // namespace

PartId partIdFromJson(const json& j) {
    if (!j.is_object())
        return {};
    auto it = j.find("id");
    if (it == j.end())
        return {};
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_number())
        return it->dump();
    return {};
}

Result<metadata::PartRecord> partRecordFromJson(const json& j) {
    if (!j.is_object())
        return Error{ErrorCode::InvalidArgument, "Part record must be a JSON object"};
    try {
        metadata::PartRecord r;
        if (auto it = j.find("id"); it != j.end() && !it->is_null() && !it->is_string() &&
                                    !it->is_number())
            return Error{ErrorCode::InvalidArgument, "Part id must be a string or a number"};
        r.id = partIdFromJson(j);
        r.label = stringField(j, "label");
        r.description = stringField(j, "description");
        if (r.description.empty())
            r.description = stringField(j, "text");
        r.sequence = stringField(j, "sequence");

        if (auto it = j.find("typeHierarchy"); it != j.end() && !it->is_null()) {
            if (it->is_array()) {
                auto levels = stringList(*it);
                if (levels.size() > 0)
                    r.type.level1 = levels[0];
                if (levels.size() > 1)
                    r.type.level2 = levels[1];
                if (levels.size() > 2)
                    r.type.level3 = levels[2];
            } else {
                r.type.level1 = stringField(*it, "level1");
                r.type.level2 = stringField(*it, "level2");
                r.type.level3 = stringField(*it, "level3");
            }
        } else {
            r.type.level1 = stringField(j, "type_level_1");
            r.type.level2 = stringField(j, "type_level_2");
            r.type.level3 = stringField(j, "type_level_3");
        }

        r.sourceCollection = stringField(j, "source");
        if (r.sourceCollection.empty())
            r.sourceCollection = stringField(j, "source_collection");
        r.usageCount = j.value("usageCount", uint64_t{0});
        r.successRate = std::clamp(j.value("successRate", 0.0), 0.0, 1.0);

        if (auto it = j.find("metadata"); it != j.end() && it->is_object()) {
            for (const auto& [k, v] : it->items())
                r.metadata[k] = v.is_string() ? v.get<std::string>() : v.dump();
        }
        return r;
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidArgument, std::string("Malformed part record: ") + e.what()};
    }
}

json toJson(const metadata::PartRecord& record) {
    json j{{"id", record.id},
           {"label", record.label},
           {"description", record.description},
           {"sequence", record.sequence},
           {"typeHierarchy",
            {{"level1", record.type.level1},
             {"level2", record.type.level2},
             {"level3", record.type.level3}}},
           {"source", record.sourceCollection},
           {"usageCount", record.usageCount},
           {"successRate", record.successRate}};
    j["metadata"] = json::object();
    for (const auto& [k, v] : record.metadata)
        j["metadata"][k] = v;
    return j;
}

json toJson(const metadata::PartDetails& details) {
    json j = toJson(details.record);
    j["sequenceLength"] = details.sequenceLength;
    j["gcContent"] = details.gcContent ? json(*details.gcContent) : json(nullptr);
    j["revision"] = details.revision;
    return j;
}

json toJson(const metadata::CatalogFacets& facets) {
    return {{"types", facetList(facets.types)},
            {"subtypes", facetList(facets.subtypes)},
            {"sources", facetList(facets.sources)}};
}

json toJson(const metadata::CatalogStats& stats) {
    json combos = json::array();
    for (const auto& c : stats.typeCombinations)
        combos.push_back({{"level1", c.level1}, {"level2", c.level2}, {"count", c.count}});
    return {{"totalParts", stats.totalParts},
            {"facets", toJson(stats.facets)},
            {"typeCombinations", std::move(combos)}};
}

json toJson(const search::SearchHit& hit) {
    return {{"id", hit.id}, {"score", hit.score}, {"matchedFields", hit.matchedFields}};
}

json toJson(const search::SearchResponse& response) {
    json hits = json::array();
    for (const auto& h : response.hits)
        hits.push_back(toJson(h));
    json warnings = json::array();
    for (const auto& w : response.warnings)
        warnings.push_back(toJson(w));
    return {{"hits", std::move(hits)},
            {"warnings", std::move(warnings)},
            {"intent", std::string(search::intentToString(response.intent))},
            {"fromCache", response.fromCache},
            {"snapshotVersion", response.snapshotVersion},
            {"elapsedMs", response.elapsed.count()}};
}

json toJson(const search::BrowseResult& result) {
    json parts = json::array();
    for (const auto& p : result.parts)
        parts.push_back(toJson(*p));
    return {{"parts", std::move(parts)},
            {"totalCount", result.totalCount},
            {"limit", result.limit},
            {"offset", result.offset},
            {"facets", toJson(result.facets)}};
}

json toJson(const search::IngestReport& report) {
    json failures = json::array();
    for (const auto& f : report.failures)
        failures.push_back({{"id", f.id}, {"error", toJson(f.error)}});
    return {{"inserted", report.inserted},
            {"reembedded", report.reembedded},
            {"updated", report.updated},
            {"failures", std::move(failures)},
            {"snapshotVersion", report.snapshotVersion}};
}

json toJson(const EngineStats& stats) {
    return {{"count", stats.count},
            {"avgQueryLatencyMs", stats.avgQueryLatencyMs},
            {"indexQueryLatencyMs", stats.indexQueryLatencyMs},
            {"cacheHitRate", stats.cacheHitRate},
            {"snapshotVersion", stats.snapshotVersion},
            {"approximate", stats.approximate},
            {"stale", stats.stale},
            {"cacheEntries", stats.cacheEntries},
            {"cacheMemoryBytes", stats.cacheMemoryBytes},
            {"searches", stats.searches},
            {"timeouts", stats.timeouts},
            {"rejected", stats.rejected}};
}

json toJson(const WorkerStats& stats) {
    return {{"id", stats.id},
            {"address", stats.address},
            {"state", std::string(toString(stats.state))},
            {"load", stats.load},
            {"latencyEwmaMs", stats.latencyEwmaMs},
            {"errorRate", stats.errorRate},
            {"inFlight", stats.inFlight},
            {"queued", stats.queued},
            {"served", stats.served},
            {"rejected", stats.rejected},
            {"transitions", stats.transitions},
            {"lastReason", stats.lastReason}};
}

json toJson(const Error& error) {
    return {{"code", static_cast<int>(error.code)},
            {"name", errorToString(error.code)},
            {"message", error.message}};
}

search::SearchFilters filtersFromJson(const json& j) {
    search::SearchFilters f;
    if (j.is_null())
        return f;
    if (auto it = j.find("types"); it != j.end())
        f.types = stringList(*it);
    else if (auto it1 = j.find("type"); it1 != j.end())
        f.types = stringList(*it1);
    if (auto it = j.find("sources"); it != j.end())
        f.sources = stringList(*it);
    else if (auto it1 = j.find("source"); it1 != j.end())
        f.sources = stringList(*it1);
    f.text = stringField(j, "text");
    return f;
}

// ============================================================================
// Typed operations
// ============================================================================

namespace {

struct EmptyParams {
    static EmptyParams fromJson(const json&) { return {}; }
};

struct SearchParams {
    SearchRequest request;

    static SearchParams fromJson(const json& j) {
        SearchParams p;
        p.request.query = j.value("query", std::string{});
        if (auto it = j.find("filters"); it != j.end())
            p.request.filters = filtersFromJson(*it);
        p.request.topK = j.value("topK", size_t{0});
        p.request.timeout = std::chrono::milliseconds(j.value("timeoutMs", int64_t{0}));
        return p;
    }
};

struct PartParams {
    std::string id;

    static PartParams fromJson(const json& j) { return {j.at("id").get<std::string>()}; }
};

struct BrowseParams {
    search::SearchFilters filters;
    size_t limit = 20;
    size_t offset = 0;

    static BrowseParams fromJson(const json& j) {
        BrowseParams p;
        if (auto it = j.find("filters"); it != j.end())
            p.filters = filtersFromJson(*it);
        p.limit = j.value("limit", p.limit);
        p.offset = j.value("offset", p.offset);
        return p;
    }
};

struct IngestParams {
    json records;

    static IngestParams fromJson(const json& j) { return {j.at("records")}; }
};

Result<json> opSearch(QueryCoordinator& c, const SearchParams& p) {
    auto r = c.search(p.request);
    if (!r)
        return r.error();
    return toJson(r.value());
}

Result<json> opGetPart(QueryCoordinator& c, const PartParams& p) {
    // Absent ids are an empty answer, not an error
    auto details = c.engine()->getPart(p.id);
    if (!details)
        return json{{"found", false}, {"part", nullptr}};
    return json{{"found", true}, {"part", toJson(*details)}};
}

Result<json> opPartsSearch(QueryCoordinator& c, const BrowseParams& p) {
    return toJson(c.engine()->browseParts(p.filters, p.limit, p.offset));
}

Result<json> opIndexStats(QueryCoordinator& c, const EmptyParams&) {
    return toJson(c.getIndexStats());
}

Result<json> opWorkerStats(QueryCoordinator& c, const EmptyParams&) {
    json workers = json::array();
    for (const auto& w : c.getWorkerStats())
        workers.push_back(toJson(w));
    return json{{"workers", std::move(workers)}};
}

Result<json> opCatalogStats(QueryCoordinator& c, const EmptyParams&) {
    return toJson(c.engine()->getCatalogStats());
}

Result<json> opIngest(QueryCoordinator& c, const IngestParams& p) {
    if (!p.records.is_array())
        return Error{ErrorCode::InvalidArgument, "records must be an array"};
    std::vector<metadata::PartRecord> batch;
    std::vector<search::IngestFailure> decodeFailures;
    batch.reserve(p.records.size());
    for (const auto& item : p.records) {
        auto rec = partRecordFromJson(item);
        if (!rec) {
            decodeFailures.push_back({partIdFromJson(item), rec.error()});
            continue;
        }
        batch.push_back(std::move(rec).value());
    }
    auto report = c.ingest(std::move(batch));
    report.failures.insert(report.failures.begin(), decodeFailures.begin(), decodeFailures.end());
    return toJson(report);
}

Result<json> opListOperations(QueryCoordinator&, const EmptyParams&) {
    json ops = json::array();
    for (const auto& op : RequestDispatcher::operations())
        ops.push_back({{"name", std::string(op.name)}, {"description", std::string(op.description)}});
    return json{{"operations", std::move(ops)}};
}

template <typename Params, Result<json> (*Fn)(QueryCoordinator&, const Params&)>
Result<json> typed(QueryCoordinator& c, const json& params) {
    const json& args = params.is_null() ? json::object() : params;
    if (!args.is_object())
        return Error{ErrorCode::InvalidArgument, "params must be a JSON object"};
    try {
        auto p = Params::fromJson(args);
        return Fn(c, p);
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidArgument, std::string("Invalid params: ") + e.what()};
    }
}

constexpr RequestDispatcher::Operation kOperations[] = {
    {"search", "Semantic search over parts; empty query text lists by filters only",
     &typed<SearchParams, &opSearch>},
    {"get_part", "Part record with sequence length and GC content",
     &typed<PartParams, &opGetPart>},
    {"parts_search", "Filtered listing with limit/offset and facet counts",
     &typed<BrowseParams, &opPartsSearch>},
    {"index_stats", "Index size, query latency and cache hit rate",
     &typed<EmptyParams, &opIndexStats>},
    {"worker_stats", "Per-worker health state, load and latency EWMA",
     &typed<EmptyParams, &opWorkerStats>},
    {"catalog_stats", "Part counts by type, subtype and source",
     &typed<EmptyParams, &opCatalogStats>},
    {"ingest", "Embed and index a batch of part records", &typed<IngestParams, &opIngest>},
    {"list_operations", "Names and descriptions of the supported operations",
     &typed<EmptyParams, &opListOperations>},
};

} // namespace

// ============================================================================
// RequestDispatcher
// ============================================================================

RequestDispatcher::RequestDispatcher(std::shared_ptr<QueryCoordinator> coordinator)
    : coordinator_(std::move(coordinator)) {}

std::span<const RequestDispatcher::Operation> RequestDispatcher::operations() {
    return kOperations;
}

Result<json> RequestDispatcher::dispatch(std::string_view op, const json& params) const {
    auto it = std::find_if(std::begin(kOperations), std::end(kOperations),
                           [op](const Operation& o) { return o.name == op; });
    if (it == std::end(kOperations))
        return Error{ErrorCode::NotFound, "Unknown operation: " + std::string(op)};
    try {
        return it->handler(*coordinator_, params);
    } catch (const std::exception& e) {
        spdlog::error("[Dispatcher] {} failed: {}", op, e.what());
        return Error{ErrorCode::InternalError, e.what()};
    }
}

json RequestDispatcher::handle(const json& request) const {
    auto fail = [](const Error& e) { return json{{"ok", false}, {"error", toJson(e)}}; };
    if (!request.is_object())
        return fail(Error{ErrorCode::InvalidArgument, "Request must be a JSON object"});
    auto opIt = request.find("op");
    if (opIt == request.end() || !opIt->is_string())
        return fail(Error{ErrorCode::InvalidArgument, "Request is missing 'op'"});

    auto paramsIt = request.find("params");
    auto result = dispatch(opIt->get<std::string>(),
                           paramsIt == request.end() ? json::object() : *paramsIt);
    if (!result) {
        spdlog::debug("[Dispatcher] {} -> {}", opIt->get<std::string>(), result.error().message);
        return fail(result.error());
    }
    return json{{"ok", true}, {"result", std::move(result).value()}};
}

} // namespace synvec::daemon
