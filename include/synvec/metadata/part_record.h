// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/core/types.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace synvec::metadata {

/**
 * @brief Three-level part type hierarchy (e.g. "DNA Elements" / "Regulatory" / "Promoter")
 */
struct TypeHierarchy {
    std::string level1;
    std::string level2;
    std::string level3;

    /// Most specific non-empty level, or empty if none is set
    const std::string& mostSpecific() const {
        if (!level3.empty())
            return level3;
        if (!level2.empty())
            return level2;
        return level1;
    }

    bool operator==(const TypeHierarchy&) const = default;
};

/**
 * @brief A catalogued biological part.
 *
 * Records are owned by the ingestion feed and are read-only to the engine; a changed record is
 * replaced wholesale through PartCatalog::upsert, never mutated in place.
 */
struct PartRecord {
    PartId id;
    std::string label;
    std::string description;
    std::string sequence;
    TypeHierarchy type;
    std::string sourceCollection; ///< Normalised collection name ("igem", "addgene", ...)

    // Popularity / engineering signals used by the ranker
    uint64_t usageCount = 0;
    double successRate = 0.0; ///< Historical fraction of successful uses, in [0,1]

    std::map<std::string, std::string> metadata;

    /// Text handed to the embedding provider: label, type, description.
    std::string searchText() const;

    /// True if the fields that feed the embedding differ between the two records.
    bool embeddingInputsDiffer(const PartRecord& other) const {
        return searchText() != other.searchText();
    }
};

/**
 * @brief Derived per-part details served by getPart()
 */
struct PartDetails {
    PartRecord record;
    size_t sequenceLength = 0;
    std::optional<double> gcContent; ///< Percentage of G/C bases; empty without a sequence
    uint64_t revision = 0;
};

/// GC percentage of a nucleotide sequence (case-insensitive); nullopt for an empty sequence.
std::optional<double> gcContentPercent(const std::string& sequence);

} // namespace synvec::metadata
