// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace synvec::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

// Reads an environment variable; unset and empty are both nullopt.
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

// Section -> key -> raw (unquoted) value. Keys written as "section.key" at top level are
// folded into their section.
using ConfigMap = std::map<std::string, std::map<std::string, std::string>>;

// Parse a whole TOML-style config file. Missing file yields an empty map.
ConfigMap parse_config_file(const std::filesystem::path& config_path);

// Parse a value from TOML config file
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config directory
/// Unix: $XDG_CONFIG_HOME/synvec or ~/.config/synvec
std::filesystem::path get_config_dir();

/// Returns the user data directory (index snapshots)
/// Unix: $XDG_DATA_HOME/synvec or ~/.local/share/synvec
std::filesystem::path get_data_dir();

// Get standard config path (SYNVEC_CONFIG wins over the XDG location)
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace synvec::config
