#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ruget::config {

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
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Drop a trailing '#' comment that is not inside a quoted string
std::string strip_comment(std::string_view line);

// Flat view of a TOML-subset file: "section.key" -> raw value. Strings are unquoted;
// arrays (possibly spanning several lines) are kept as their raw "[...]" text.
std::map<std::string, std::string> parse_simple_toml_flat(std::istream& in);

// Elements of a raw "[...]" string array, unquoted. A bare scalar yields one element.
std::vector<std::string> parse_string_array(const std::string& raw);

// Parse "true"/"false" (also yes/no/1/0). Returns false on unrecognized input.
bool parse_bool(std::string_view raw, bool& out);

// Standard config path: override, else $XDG_CONFIG_HOME/ruget/config.toml,
// else ~/.config/ruget/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

// ~/.rugetrc (empty when HOME is unset)
std::filesystem::path get_rc_path();

} // namespace ruget::config
