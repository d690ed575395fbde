#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace evalforge::config {

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

inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        if (const char* home = std::getenv("HOME")) {
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Anything except empty, "0", "false", "off" and "no" (case-insensitive).
bool env_truthy(const char* value);

// Accepts "a, b" or ["a", "b"]; entries are unquoted and empty ones dropped.
std::vector<std::string> parse_string_list(const std::string& raw);

// Flattens [section] key = value into "section.key". Inline comments are stripped
// outside of quoted values. A missing file yields an empty map.
std::map<std::string, std::string> parse_simple_toml_flat(const std::filesystem::path& path);

/// Returns $XDG_CONFIG_HOME/evalforge or ~/.config/evalforge
std::filesystem::path get_config_dir();

/// Resolution: override_path, EVALFORGE_CONFIG, then get_config_dir()/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace evalforge::config
