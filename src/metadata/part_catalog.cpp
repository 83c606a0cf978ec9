// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/metadata/part_catalog.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>
#include <ostream>

namespace synvec::metadata {

std::string PartRecord::searchText() const {
    std::string text = label;
    const auto& typeName = type.mostSpecific();
    if (!typeName.empty()) {
        if (!text.empty())
            text += ' ';
        text += typeName;
    }
    if (!description.empty()) {
        if (!text.empty())
            text += ' ';
        text += description;
    }
    return text;
}

std::optional<double> gcContentPercent(const std::string& sequence) {
    if (sequence.empty()) {
        return std::nullopt;
    }
    size_t gc = 0;
    for (unsigned char c : sequence) {
        auto u = std::toupper(c);
        if (u == 'G' || u == 'C')
            ++gc;
    }
    return static_cast<double>(gc) * 100.0 / static_cast<double>(sequence.size());
}

size_t writeFasta(std::ostream& out, const std::vector<PartRecordPtr>& parts, size_t lineWidth) {
    size_t written = 0;
    for (const auto& part : parts) {
        if (!part)
            continue;
        std::string label = part->label.empty() ? "Unnamed" : part->label;
        std::replace_if(label.begin(), label.end(), [](char c) { return c == '\n' || c == '\r'; },
                        ' ');
        out << '>' << part->id << ' ' << label << '\n';
        const auto& seq = part->sequence;
        const size_t width = lineWidth == 0 ? std::max<size_t>(seq.size(), 1) : lineWidth;
        for (size_t pos = 0; pos < seq.size(); pos += width)
            out << seq.substr(pos, width) << '\n';
        ++written;
    }
    return written;
}

namespace {

std::string foldId(const std::string& id) {
    std::string out(id);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::vector<FacetCount> toSortedFacets(const std::map<std::string, size_t>& counts) {
    std::vector<FacetCount> out;
    out.reserve(counts.size());
    for (const auto& [name, count] : counts) {
        out.push_back({name, count});
    }
    // std::map already orders by name; stable sort keeps name asc within equal counts
    std::stable_sort(out.begin(), out.end(),
                     [](const FacetCount& a, const FacetCount& b) { return a.count > b.count; });
    return out;
}

} // namespace

UpsertOutcome PartCatalog::upsert(PartRecord record) {
    auto ptr = std::make_shared<const PartRecord>(std::move(record));
    std::unique_lock lock(mutex_);
    auto rev = revision_.fetch_add(1, std::memory_order_acq_rel) + 1;
    auto it = records_.find(ptr->id);
    if (it == records_.end()) {
        foldedIds_[foldId(ptr->id)] = ptr->id;
        records_.emplace(ptr->id, Slot{std::move(ptr), rev});
        return UpsertOutcome::Inserted;
    }
    bool textChanged = it->second.record->embeddingInputsDiffer(*ptr);
    it->second = Slot{std::move(ptr), rev};
    return textChanged ? UpsertOutcome::TextChanged : UpsertOutcome::Replaced;
}

bool PartCatalog::remove(const PartId& id) {
    std::unique_lock lock(mutex_);
    if (records_.erase(id) == 0) {
        return false;
    }
    auto folded = foldedIds_.find(foldId(id));
    if (folded != foldedIds_.end() && folded->second == id)
        foldedIds_.erase(folded);
    revision_.fetch_add(1, std::memory_order_acq_rel);
    return true;
}

PartRecordPtr PartCatalog::find(const PartId& id) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : it->second.record;
}

PartRecordPtr PartCatalog::findIgnoreCase(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto exact = records_.find(id);
    if (exact != records_.end())
        return exact->second.record;
    auto folded = foldedIds_.find(foldId(id));
    if (folded == foldedIds_.end())
        return nullptr;
    auto it = records_.find(folded->second);
    return it == records_.end() ? nullptr : it->second.record;
}

std::optional<PartDetails> PartCatalog::details(const PartId& id) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    PartDetails d;
    d.record = *it->second.record;
    d.sequenceLength = d.record.sequence.size();
    d.gcContent = gcContentPercent(d.record.sequence);
    d.revision = it->second.revision;
    return d;
}

std::vector<PartRecordPtr> PartCatalog::select(const Predicate& pred) const {
    std::vector<PartRecordPtr> out;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, slot] : records_) {
            if (!pred || pred(*slot.record)) {
                out.push_back(slot.record);
            }
        }
    }
    std::sort(out.begin(), out.end(),
              [](const PartRecordPtr& a, const PartRecordPtr& b) { return a->id < b->id; });
    return out;
}

CatalogFacets PartCatalog::facets(const Predicate& pred) const {
    std::map<std::string, size_t> types, subtypes, sources;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, slot] : records_) {
            const auto& r = *slot.record;
            if (pred && !pred(r))
                continue;
            if (!r.type.level1.empty())
                ++types[r.type.level1];
            if (!r.type.level2.empty())
                ++subtypes[r.type.level2];
            if (!r.sourceCollection.empty())
                ++sources[r.sourceCollection];
        }
    }
    CatalogFacets f;
    f.types = toSortedFacets(types);
    f.subtypes = toSortedFacets(subtypes);
    f.sources = toSortedFacets(sources);
    return f;
}

CatalogStats PartCatalog::stats() const {
    CatalogStats s;
    s.facets = facets(nullptr);

    std::map<std::pair<std::string, std::string>, size_t> combos;
    {
        std::shared_lock lock(mutex_);
        s.totalParts = records_.size();
        for (const auto& [id, slot] : records_) {
            const auto& t = slot.record->type;
            if (!t.level1.empty() && !t.level2.empty())
                ++combos[{t.level1, t.level2}];
        }
    }
    for (const auto& [key, count] : combos) {
        s.typeCombinations.push_back({key.first, key.second, count});
    }
    std::stable_sort(s.typeCombinations.begin(), s.typeCombinations.end(),
                     [](const auto& a, const auto& b) { return a.count > b.count; });
    spdlog::debug("PartCatalog stats: {} parts, {} type combinations", s.totalParts,
                  s.typeCombinations.size());
    return s;
}

size_t PartCatalog::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

} // namespace synvec::metadata
