#pragma once

#include <ruget/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ruget::config {

/**
 * Values read from the user's config file. Unset fields fall back to command-line
 * flags or built-in defaults.
 */
struct FileSettings {
    std::optional<std::uint32_t> retries;
    std::optional<bool> resume;
    std::optional<bool> quiet;
    std::optional<bool> verbose;
    std::optional<std::size_t> jobs;
    std::optional<std::string> outputDir;
    std::vector<std::string> headers;
    std::optional<std::string> failureLog;

    // [retry]
    std::optional<std::uint32_t> retryMax;
    std::optional<std::uint64_t> backoffBaseMs;
    std::optional<std::uint64_t> backoffMaxMs;
    std::optional<double> backoffFactor;
    std::optional<bool> backoffJitter;

    // [logging]
    std::optional<std::string> logFormat;
    std::optional<std::string> logLevel;

    // [http]
    std::optional<std::uint64_t> timeoutMs;
    std::optional<std::string> userAgent;
    std::optional<bool> insecure;

    /// Effective retry count: [retry].max, else top-level retries.
    [[nodiscard]] std::optional<std::uint32_t> maxRetries() const {
        return retryMax ? retryMax : retries;
    }
};

/**
 * Config file to read: explicit override, else the XDG config.toml when it exists,
 * else ~/.rugetrc. May name a file that does not exist.
 */
std::filesystem::path resolveConfigPath(const std::string& overridePath = "");

/**
 * Parse settings from a stream. Malformed values yield ConfigError naming the key.
 */
Result<FileSettings> parseSettings(std::istream& in, std::string_view origin = "<config>");

/**
 * Load settings from path. A missing file yields default (empty) settings.
 */
Result<FileSettings> loadSettings(const std::filesystem::path& path);

/**
 * Commented template written by --init.
 */
std::string_view configTemplate();

/**
 * Write the template to path unless a file already exists there.
 * Returns true when a new file was written.
 */
Result<bool> writeConfigTemplate(const std::filesystem::path& path);

} // namespace ruget::config
