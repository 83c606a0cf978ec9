// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/core/types.h>
#include <synvec/daemon/components/QueryCoordinator.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace synvec::daemon {

using json = nlohmann::json;

// JSON codecs shared by the dispatcher and the CLI

/**
 * @brief Decode one ingestion record
 *
 * Accepts `typeHierarchy` as an object {level1, level2, level3} or an array, or the flat
 * `type_level_1..3` columns. `text` and `description` are synonyms.
 */
Result<metadata::PartRecord> partRecordFromJson(const json& j);
/// Record id as a string; numeric ids keep their JSON spelling, anything else is empty
PartId partIdFromJson(const json& j);
json toJson(const metadata::PartRecord& record);
json toJson(const metadata::PartDetails& details);
json toJson(const metadata::CatalogFacets& facets);
json toJson(const metadata::CatalogStats& stats);
json toJson(const search::SearchHit& hit);
json toJson(const search::SearchResponse& response);
json toJson(const search::BrowseResult& result);
json toJson(const search::IngestReport& report);
json toJson(const EngineStats& stats);
json toJson(const WorkerStats& stats);
json toJson(const Error& error);

/// `{"types": [...], "sources": [...], "text": "..."}`; a bare string is accepted for either list
search::SearchFilters filtersFromJson(const json& j);

/**
 * @brief Maps operation names to typed handlers over the coordinator
 *
 * The operation table is a static array built at compile time; dispatch looks the name up in it
 * and never constructs handlers at runtime.
 *
 * Request envelope:  {"op": "<name>", "params": {...}}
 * Response envelope: {"ok": true, "result": {...}} or
 *                    {"ok": false, "error": {"code": <int>, "name": "...", "message": "..."}}
 */
class RequestDispatcher {
public:
    using Handler = Result<json> (*)(QueryCoordinator& coordinator, const json& params);

    struct Operation {
        std::string_view name;
        std::string_view description;
        Handler handler;
    };

    explicit RequestDispatcher(std::shared_ptr<QueryCoordinator> coordinator);

    /// Run one operation; malformed params are InvalidArgument
    Result<json> dispatch(std::string_view op, const json& params) const;

    /// Envelope in, envelope out; never throws
    json handle(const json& request) const;

    static std::span<const Operation> operations();

private:
    std::shared_ptr<QueryCoordinator> coordinator_;
};

} // namespace synvec::daemon
