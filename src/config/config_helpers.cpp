// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <fstream>
#include <synvec/config/config_helpers.h>

namespace synvec::config {

ConfigMap parse_config_file(const std::filesystem::path& config_path) {
    ConfigMap out;
    std::ifstream file(config_path);
    if (!file) {
        return out;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside of quotes
        bool inQuote = false;
        for (size_t i = 0; i < v.size(); ++i) {
            if (v[i] == '"' || v[i] == '\'') {
                inQuote = !inQuote;
            } else if (v[i] == '#' && !inQuote) {
                v = v.substr(0, i);
                trim(v);
                break;
            }
        }

        // Support both "index.hnsw_m" and "[index] hnsw_m"
        std::string section = currentSection;
        if (section.empty()) {
            if (auto dot = k.find('.'); dot != std::string::npos) {
                section = k.substr(0, dot);
                k = k.substr(dot + 1);
            }
        }
        out[section][k] = unquote(v);
    }

    return out;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    auto all = parse_config_file(config_path);
    auto sit = all.find(section);
    if (sit == all.end()) {
        return "";
    }
    auto kit = sit->second.find(key);
    return kit == sit->second.end() ? "" : kit->second;
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "synvec";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "synvec";
    }
    return std::filesystem::current_path() / ".synvec";
}

std::filesystem::path get_data_dir() {
    if (auto env = env_value("SYNVEC_DATA_DIR")) {
        return std::filesystem::path(*env);
    }
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && *xdg_data) {
        return std::filesystem::path(xdg_data) / "synvec";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "share" / "synvec";
    }
    return std::filesystem::current_path() / "synvec_data";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (auto env = env_value("SYNVEC_CONFIG")) {
        return expand_tilde(*env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace synvec::config
