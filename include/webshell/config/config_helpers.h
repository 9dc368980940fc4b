#pragma once

#include <webshell/core/types.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace webshell::config {

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
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() > 1 ? std::filesystem::path(home) / path.substr(2)
                                   : std::filesystem::path(home);
        }
    }
    return path;
}

// Section -> key -> raw (unquoted) value
using ConfigTable = std::map<std::string, std::map<std::string, std::string>>;

// Read a flat TOML file ([section] headers, key = value lines, # comments).
// A missing file yields an empty table.
Result<ConfigTable> parse_config_file(const std::filesystem::path& config_path);

// Single value lookup; empty when absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// Accepts ["a", "b"] or a bare comma-separated list
std::vector<std::string> parse_string_list(const std::string& raw);

Result<bool> parse_bool(std::string_view text);
Result<long long> parse_integer(std::string_view text, long long min, long long max);

// $WEBSHELL_CONFIG, else $XDG_CONFIG_HOME/webshell/config.toml, else ~/.config/webshell/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace webshell::config
