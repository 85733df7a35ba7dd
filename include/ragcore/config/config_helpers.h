#pragma once

#include <ragcore/core/types.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ragcore::config {

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

// Quote handling. Double-quoted values get TOML basic-string escapes resolved.
std::string unquote(std::string val);

// Resolve \n, \t, \r, \\ and \" escapes
std::string unescape(std::string_view in);

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

using ConfigSection = std::map<std::string, std::string>;
using ConfigMap = std::map<std::string, ConfigSection>;

// Parse a TOML-style file ([section] headers, key = value, # comments) into
// section -> key -> raw value. Values keep their quotes; use unquote() or
// parse_string_list() on them.
Result<ConfigMap> parse_config_file(const std::filesystem::path& config_path);

// Same grammar, from an in-memory document
ConfigMap parse_config_text(std::string_view text);

// Parse ["a", "b"] or a,b into a list of unquoted strings
std::vector<std::string> parse_string_list(const std::string& raw);

// Typed value parsing; InvalidArgument on malformed input
Result<int64_t> parse_int(std::string_view raw);
Result<double> parse_double(std::string_view raw);
Result<bool> parse_bool(std::string_view raw);

// Durations accept a bare integer in the given unit or a suffix: ms, s, m, h, d
Result<std::chrono::milliseconds> parse_duration(std::string_view raw,
                                                 std::chrono::milliseconds unit);

// Get standard config path
/// Unix: $XDG_CONFIG_HOME/ragcore/config.toml or ~/.config/ragcore/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user data directory (persistent cache database)
/// Unix: $XDG_DATA_HOME/ragcore or ~/.local/share/ragcore
std::filesystem::path get_data_dir();

} // namespace ragcore::config
