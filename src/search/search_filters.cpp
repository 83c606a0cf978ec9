// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/config/config_helpers.h>
#include <synvec/search/search_filters.h>

#include <algorithm>
#include <cctype>
#include <string_view>
#include <unordered_map>

namespace synvec::search {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string lowerTrimmed(std::string s) {
    config::trim(s);
    return toLower(s);
}

const std::unordered_map<std::string, std::string>& sourceAliases() {
    static const std::unordered_map<std::string, std::string> kAliases = {
        {"igem registry", "igem"}, {"igem", "igem"},         {"laboratory", "lab"},
        {"lab", "lab"},            {"addgene", "addgene"},   {"snapgene", "snapgene"},
        {"yunzhou", "yunzhou"},
    };
    return kAliases;
}

std::vector<std::string> canonicalList(const std::vector<std::string>& values, bool isSource) {
    std::vector<std::string> out;
    out.reserve(values.size());
    for (const auto& v : values) {
        auto c = isSource ? normalizeSourceCollection(v) : lowerTrimmed(v);
        if (!c.empty())
            out.push_back(std::move(c));
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

} // namespace

std::string normalizeSourceCollection(const std::string& name) {
    auto key = lowerTrimmed(name);
    const auto& aliases = sourceAliases();
    auto it = aliases.find(key);
    return it == aliases.end() ? key : it->second;
}

bool typeMatches(const std::string& filterType, const metadata::PartRecord& record) {
    auto f = lowerTrimmed(filterType);
    if (f.empty())
        return true;
    const auto& t = record.type;
    if (toLower(t.level1) == f || toLower(t.level2) == f || toLower(t.level3) == f)
        return true;
    if (f == "promoter") {
        if (toLower(t.level1) == "dna elements" && toLower(t.level2) == "regulatory")
            return true;
        if (toLower(record.label).find("promoter") != std::string::npos)
            return true;
    }
    return false;
}

bool SearchFilters::matchesType(const metadata::PartRecord& record) const {
    if (types.empty())
        return true;
    return std::any_of(types.begin(), types.end(),
                       [&](const std::string& t) { return typeMatches(t, record); });
}

bool SearchFilters::matchesSource(const metadata::PartRecord& record) const {
    if (sources.empty())
        return true;
    auto have = normalizeSourceCollection(record.sourceCollection);
    return std::any_of(sources.begin(), sources.end(), [&](const std::string& s) {
        return normalizeSourceCollection(s) == have;
    });
}

bool SearchFilters::empty() const {
    return types.empty() && sources.empty() && lowerTrimmed(text).empty();
}

bool SearchFilters::matchesText(const metadata::PartRecord& record) const {
    auto needle = lowerTrimmed(text);
    if (needle.empty())
        return true;
    for (const std::string* field : {&record.id, &record.label, &record.description}) {
        if (toLower(*field).find(needle) != std::string::npos)
            return true;
    }
    return false;
}

bool SearchFilters::matches(const metadata::PartRecord& record) const {
    return matchesType(record) && matchesSource(record) && matchesText(record);
}

std::string SearchFilters::signature() const {
    std::string sig = "t=";
    for (const auto& t : canonicalList(types, false)) {
        sig += t;
        sig += ',';
    }
    sig += ";s=";
    for (const auto& s : canonicalList(sources, true)) {
        sig += s;
        sig += ',';
    }
    if (auto needle = lowerTrimmed(text); !needle.empty()) {
        sig += ";k=";
        sig += needle;
    }
    return sig;
}

} // namespace synvec::search
