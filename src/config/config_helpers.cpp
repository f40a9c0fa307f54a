#include <istream>
#include <sstream>
#include <ruget/config/config_helpers.h>

namespace ruget::config {

std::string strip_comment(std::string_view line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return std::string(line.substr(0, i));
        }
    }
    return std::string(line);
}

namespace {

// True once every '[' outside quotes has a matching ']'
bool array_closed(std::string_view raw) {
    int depth = 0;
    char quote = 0;
    for (char c : raw) {
        if (quote) {
            if (c == quote)
                quote = 0;
            continue;
        }
        if (c == '"' || c == '\'')
            quote = c;
        else if (c == '[')
            ++depth;
        else if (c == ']')
            --depth;
    }
    return depth <= 0;
}

} // namespace

std::map<std::string, std::string> parse_simple_toml_flat(std::istream& in) {
    std::map<std::string, std::string> config;
    std::string line;
    std::string currentSection;
    std::string pendingKey;
    std::string pendingValue;

    while (std::getline(in, line)) {
        line = strip_comment(line);
        trim(line);

        if (!pendingKey.empty()) {
            pendingValue += " " + line;
            if (array_closed(pendingValue)) {
                config[pendingKey] = pendingValue;
                pendingKey.clear();
                pendingValue.clear();
            }
            continue;
        }

        if (line.empty())
            continue;

        if (line.front() == '[' && line.back() == ']') {
            currentSection = line.substr(1, line.size() - 2);
            trim(currentSection);
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);

        const std::string fullKey = currentSection.empty() ? key : currentSection + "." + key;
        if (!value.empty() && value.front() == '[') {
            if (!array_closed(value)) {
                pendingKey = fullKey;
                pendingValue = value;
                continue;
            }
            config[fullKey] = value;
        } else {
            config[fullKey] = unquote(value);
        }
    }

    // Unterminated array: keep what was read
    if (!pendingKey.empty())
        config[pendingKey] = pendingValue;
    return config;
}

std::vector<std::string> parse_string_array(const std::string& raw) {
    std::vector<std::string> out;
    std::string body = raw;
    trim(body);
    if (body.empty())
        return out;
    if (body.front() != '[') {
        out.push_back(unquote(body));
        return out;
    }
    body = body.substr(1);
    if (!body.empty() && body.back() == ']')
        body.pop_back();

    std::string current;
    char quote = 0;
    bool sawQuote = false;
    auto flush = [&]() {
        std::string item = current;
        trim(item);
        if (!item.empty() || sawQuote)
            out.push_back(sawQuote ? item : unquote(item));
        current.clear();
        sawQuote = false;
    };
    for (char c : body) {
        if (quote) {
            if (c == quote)
                quote = 0;
            else
                current.push_back(c);
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
            sawQuote = true;
        } else if (c == ',') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return out;
}

bool parse_bool(std::string_view raw, bool& out) {
    std::string v(raw);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "1" || v == "on") {
        out = true;
        return true;
    }
    if (v == "false" || v == "no" || v == "0" || v == "off") {
        out = false;
        return true;
    }
    return false;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "ruget" / "config.toml";
    }

    return configHome / "ruget" / "config.toml";
}

std::filesystem::path get_rc_path() {
    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".rugetrc";
    return {};
}

} // namespace ruget::config
