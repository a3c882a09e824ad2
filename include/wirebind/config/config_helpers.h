#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace wirebind::config {

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

// true/false, yes/no, on/off, 1/0 (case-insensitive); nullopt otherwise
std::optional<bool> parse_bool(std::string_view raw);

// Parse a value from TOML config file. Returns nullopt when the key is absent
// (an explicit empty string is a present value).
std::optional<std::string> parse_config_value(const std::filesystem::path& config_path,
                                              const std::string& section, const std::string& key);

/// Returns the config file path
/// Precedence: override_path > $WIREBIND_CONFIG > $XDG_CONFIG_HOME/wirebind/config.toml
///             > ~/.config/wirebind/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace wirebind::config
