// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/core/types.h>
#include <synvec/metadata/part_record.h>

#include <atomic>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace synvec::metadata {

using PartRecordPtr = std::shared_ptr<const PartRecord>;

/**
 * @brief Result of replacing a record in the catalog
 */
enum class UpsertOutcome {
    Inserted,    ///< New id
    Replaced,    ///< Existing id, embedding inputs unchanged
    TextChanged, ///< Existing id, embedding inputs changed (re-embed required)
};

struct FacetCount {
    std::string name;
    size_t count = 0;
};

struct TypeCombinationCount {
    std::string level1;
    std::string level2;
    size_t count = 0;
};

/**
 * @brief Facet counts over a set of records, each list ordered by count desc then name asc
 */
struct CatalogFacets {
    std::vector<FacetCount> types;    ///< type level 1
    std::vector<FacetCount> subtypes; ///< type level 2
    std::vector<FacetCount> sources;
};

struct CatalogStats {
    size_t totalParts = 0;
    CatalogFacets facets;
    std::vector<TypeCombinationCount> typeCombinations;
};

/**
 * @brief In-memory record store keyed by part id.
 *
 * Thread-safe. Records are immutable once stored; upsert swaps the stored pointer, so readers
 * holding a PartRecordPtr keep a consistent view.
 */
class PartCatalog {
public:
    using Predicate = std::function<bool(const PartRecord&)>;

    PartCatalog() = default;

    PartCatalog(const PartCatalog&) = delete;
    PartCatalog& operator=(const PartCatalog&) = delete;

    UpsertOutcome upsert(PartRecord record);
    bool remove(const PartId& id);

    PartRecordPtr find(const PartId& id) const;

    /// Case-insensitive id lookup ("bba_j23100" finds "BBa_J23100")
    PartRecordPtr findIgnoreCase(const std::string& id) const;
    std::optional<PartDetails> details(const PartId& id) const;

    /// All records matching the predicate, ordered by id.
    std::vector<PartRecordPtr> select(const Predicate& pred) const;

    CatalogFacets facets(const Predicate& pred) const;
    CatalogStats stats() const;

    size_t size() const;

    /// Monotonic counter bumped on every successful mutation
    uint64_t revision() const { return revision_.load(std::memory_order_acquire); }

private:
    struct Slot {
        PartRecordPtr record;
        uint64_t revision = 0;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<PartId, Slot> records_;
    std::unordered_map<std::string, PartId> foldedIds_;
    std::atomic<uint64_t> revision_{0};
};

/**
 * @brief Write parts as FASTA: `>id label` then the sequence
 *
 * Parts without a sequence get the header line only. Line breaks inside a label are flattened.
 * @param lineWidth wrap sequences at this many bases; 0 keeps each on one line
 * @return number of records written
 */
size_t writeFasta(std::ostream& out, const std::vector<PartRecordPtr>& parts, size_t lineWidth = 0);

} // namespace synvec::metadata
