// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/metadata/part_record.h>

#include <string>
#include <vector>

namespace synvec::search {

/**
 * @brief Map a user-facing collection name to its canonical form
 *
 * "iGEM registry", "iGEM" -> "igem"; "laboratory", "lab" -> "lab"; unknown names are
 * lower-cased and trimmed.
 */
std::string normalizeSourceCollection(const std::string& name);

/**
 * @brief Case-insensitive type filter match against any hierarchy level.
 *
 * "promoter" additionally matches DNA Elements / Regulatory records and records whose label
 * mentions a promoter.
 */
bool typeMatches(const std::string& filterType, const metadata::PartRecord& record);

/**
 * @brief Structured filters for search and browse
 *
 * Values within a list are OR-ed; the lists and the keyword are AND-ed together. Empty lists
 * and an empty keyword do not filter.
 */
struct SearchFilters {
    std::vector<std::string> types;
    std::vector<std::string> sources;
    std::string text; ///< Case-insensitive substring of id, label or description

    bool empty() const;

    bool matches(const metadata::PartRecord& record) const;
    bool matchesType(const metadata::PartRecord& record) const;
    bool matchesSource(const metadata::PartRecord& record) const;
    bool matchesText(const metadata::PartRecord& record) const;

    /// Canonical, order-independent rendering used in cache keys
    std::string signature() const;
};

} // namespace synvec::search
