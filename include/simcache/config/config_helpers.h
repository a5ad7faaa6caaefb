#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace simcache::config {

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
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Non-empty environment value or std::nullopt
inline std::optional<std::string> env_value(const char* name) {
    if (const char* v = std::getenv(name); v && *v) {
        return std::string(v);
    }
    return std::nullopt;
}

// Value parsing; std::nullopt when the whole string is not a valid value
std::optional<bool> parse_bool(std::string_view s);
std::optional<long long> parse_int(std::string_view s);
std::optional<double> parse_double(std::string_view s);

// Value of `key` in `[section]` (or `section.key = v` at top level), empty when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config directory: $XDG_CONFIG_HOME/simcache or ~/.config/simcache
std::filesystem::path get_config_dir();

/// Config file: override, else $SIMCACHE_CONFIG, else get_config_dir()/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace simcache::config
