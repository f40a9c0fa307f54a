#include <ruget/config/config_helpers.h>
#include <ruget/config/settings.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <set>
#include <system_error>

namespace ruget::config {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTemplate = R"(# ~/.rugetrc

# Default retry count
retries = 3

# Resume partial downloads if possible
resume = true

# Suppress output
quiet = false

# Verbose output (headers, etc)
verbose = false

# Number of parallel jobs (0 = auto)
jobs = 0

# Output directory for downloads
# output_dir = "/path/to/save"

# Custom headers to send
headers = [
  "User-Agent: ruget/0.1.0",
  "Accept: */*"
]

# Log file path for failed downloads
log = "ruget_failures.log"

# Retry policy configuration
[retry]
max = 5           # Maximum number of retries
base_ms = 500     # Base delay in milliseconds
max_ms = 10000    # Maximum delay in milliseconds
factor = 2.0      # Growth factor between attempts
jitter = true     # Randomize delays by +/-25%

# Logging configuration
[logging]
format = "text"   # Output format: "text" or "json"
level = "info"    # Log level: "debug", "info", "warn", "error"

# Transport
[http]
timeout_ms = 60000
insecure = false
)";

const std::set<std::string, std::less<>> kKnownKeys = {
    "retries",        "resume",        "quiet",         "verbose",       "jobs",
    "output_dir",     "headers",       "log",           "retry.max",     "retry.base_ms",
    "retry.max_ms",   "retry.factor",  "retry.jitter",  "logging.format", "logging.level",
    "http.timeout_ms", "http.user_agent", "http.insecure"};

Error badValue(std::string_view origin, const std::string& key, const std::string& raw,
               std::string_view expected) {
    return Error{ErrorCode::ConfigError, std::string(origin) + ": invalid value '" + raw +
                                             "' for '" + key + "' (expected " +
                                             std::string(expected) + ")"};
}

template <typename T>
std::optional<Error> readUnsigned(const std::map<std::string, std::string>& kv,
                                  const std::string& key, std::optional<T>& out,
                                  std::string_view origin, T lo, T hi) {
    auto it = kv.find(key);
    if (it == kv.end())
        return std::nullopt;
    T v{};
    const auto& raw = it->second;
    auto res = std::from_chars(raw.data(), raw.data() + raw.size(), v);
    if (res.ec != std::errc() || res.ptr != raw.data() + raw.size() || v < lo || v > hi)
        return badValue(origin, key, raw, fmt::format("an integer in [{}, {}]", lo, hi));
    out = v;
    return std::nullopt;
}

std::optional<Error> readBool(const std::map<std::string, std::string>& kv,
                              const std::string& key, std::optional<bool>& out,
                              std::string_view origin) {
    auto it = kv.find(key);
    if (it == kv.end())
        return std::nullopt;
    bool v = false;
    if (!parse_bool(it->second, v))
        return badValue(origin, key, it->second, "true or false");
    out = v;
    return std::nullopt;
}

std::optional<Error> readDouble(const std::map<std::string, std::string>& kv,
                                const std::string& key, std::optional<double>& out,
                                std::string_view origin) {
    auto it = kv.find(key);
    if (it == kv.end())
        return std::nullopt;
    try {
        size_t used = 0;
        double v = std::stod(it->second, &used);
        if (used != it->second.size() || v < 1.0)
            return badValue(origin, key, it->second, "a number >= 1.0");
        out = v;
    } catch (const std::exception&) {
        return badValue(origin, key, it->second, "a number >= 1.0");
    }
    return std::nullopt;
}

void readString(const std::map<std::string, std::string>& kv, const std::string& key,
                std::optional<std::string>& out) {
    if (auto it = kv.find(key); it != kv.end())
        out = it->second;
}

} // namespace

fs::path resolveConfigPath(const std::string& overridePath) {
    if (!overridePath.empty())
        return get_config_path(overridePath);
    std::error_code ec;
    auto xdg = get_config_path();
    if (fs::exists(xdg, ec))
        return xdg;
    return get_rc_path();
}

Result<FileSettings> parseSettings(std::istream& in, std::string_view origin) {
    const auto kv = parse_simple_toml_flat(in);
    FileSettings s;

    for (const auto& [key, value] : kv) {
        if (kKnownKeys.find(key) == kKnownKeys.end())
            spdlog::debug("{}: ignoring unknown key '{}'", origin, key);
    }

    std::optional<Error> err;
    auto check = [&err](std::optional<Error> e) {
        if (e && !err)
            err = std::move(e);
    };

    check(readUnsigned<std::uint32_t>(kv, "retries", s.retries, origin, 0, 100));
    check(readBool(kv, "resume", s.resume, origin));
    check(readBool(kv, "quiet", s.quiet, origin));
    check(readBool(kv, "verbose", s.verbose, origin));
    check(readUnsigned<std::size_t>(kv, "jobs", s.jobs, origin, 0, 256));
    readString(kv, "output_dir", s.outputDir);
    readString(kv, "log", s.failureLog);
    if (auto it = kv.find("headers"); it != kv.end())
        s.headers = parse_string_array(it->second);

    check(readUnsigned<std::uint32_t>(kv, "retry.max", s.retryMax, origin, 0, 100));
    check(readUnsigned<std::uint64_t>(kv, "retry.base_ms", s.backoffBaseMs, origin, 0, 600000));
    check(readUnsigned<std::uint64_t>(kv, "retry.max_ms", s.backoffMaxMs, origin, 0, 3600000));
    check(readDouble(kv, "retry.factor", s.backoffFactor, origin));
    check(readBool(kv, "retry.jitter", s.backoffJitter, origin));

    readString(kv, "logging.format", s.logFormat);
    readString(kv, "logging.level", s.logLevel);
    if (s.logFormat && *s.logFormat != "text" && *s.logFormat != "json")
        check(badValue(origin, "logging.format", *s.logFormat, "text or json"));

    check(readUnsigned<std::uint64_t>(kv, "http.timeout_ms", s.timeoutMs, origin, 100, 3600000));
    readString(kv, "http.user_agent", s.userAgent);
    check(readBool(kv, "http.insecure", s.insecure, origin));

    if (err)
        return *err;
    return s;
}

Result<FileSettings> loadSettings(const fs::path& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        spdlog::debug("No config file at '{}', using defaults", path.string());
        return FileSettings{};
    }
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::ConfigError, "Cannot read config file " + path.string()};
    }
    spdlog::debug("Loading config from {}", path.string());
    return parseSettings(in, path.string());
}

std::string_view configTemplate() {
    return kTemplate;
}

Result<bool> writeConfigTemplate(const fs::path& path) {
    std::error_code ec;
    if (fs::exists(path, ec))
        return false;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::ConfigError, "Cannot create " + path.parent_path().string() +
                                                     ": " + ec.message()};
        }
    }
    std::ofstream out(path);
    if (!out) {
        return Error{ErrorCode::ConfigError, "Failed to write config file " + path.string()};
    }
    out << kTemplate;
    out.flush();
    if (!out) {
        return Error{ErrorCode::ConfigError, "Failed to write config file " + path.string()};
    }
    return true;
}

} // namespace ruget::config
