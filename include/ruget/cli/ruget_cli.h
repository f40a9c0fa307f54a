#pragma once

#include <ruget/config/settings.h>
#include <ruget/core/types.h>
#include <ruget/downloader/download_engine.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/common.h>

namespace CLI {
class App;
}

namespace ruget::cli {

#ifndef RUGET_VERSION
#define RUGET_VERSION "0.1.0"
#endif

/**
 * Command-line front end: parses flags, merges them over the config file, sets up
 * logging and runs the download engine.
 */
class RugetCLI {
public:
    RugetCLI();
    ~RugetCLI();

    /**
     * Parse and execute. Returns the process exit code.
     */
    int run(int argc, char* argv[]);

    /**
     * Parse only (no side effects). Throws CLI::ParseError on bad input.
     */
    void parse(int argc, char* argv[]);

    /**
     * URLs from positional arguments followed by those from --input.
     */
    Result<std::vector<std::string>> collectUrls() const;

    /**
     * Engine options: command-line flags over config values over defaults.
     */
    Result<downloader::DownloadOptions> buildOptions(const config::FileSettings& file) const;

    /**
     * Transport settings: flags over config values over defaults.
     */
    downloader::HttpSettings buildHttpSettings(const config::FileSettings& file) const;

    /**
     * Effective log format name ("text" or "json").
     */
    std::string logFormat(const config::FileSettings& file) const;

    /**
     * Effective log level. Precedence: RUGET_LOG_LEVEL > --log-level > --verbose/--quiet >
     * config > info.
     */
    spdlog::level::level_enum logLevel(const config::FileSettings& file) const;

    static std::optional<spdlog::level::level_enum> parseLevel(const std::string& s);

    CLI::App& app() { return *app_; }

private:
    void registerOptions();
    Result<void> execute(const config::FileSettings& file);
    void configureLogging(const config::FileSettings& file) const;

    std::unique_ptr<CLI::App> app_;

    std::vector<std::string> urls_;
    std::optional<std::string> output_;
    std::optional<std::string> outputDir_;
    std::optional<std::string> input_;
    std::vector<std::string> headers_;
    std::optional<std::size_t> jobs_;
    std::optional<std::uint32_t> maxRetries_;
    std::optional<std::uint64_t> backoffBaseMs_;
    std::optional<std::uint64_t> backoffMaxMs_;
    std::optional<double> backoffFactor_;
    bool noJitter_{false};
    bool resume_{false};
    std::optional<std::string> failureLog_;
    std::optional<std::string> logFormat_;
    std::optional<std::string> logLevel_;
    bool quiet_{false};
    bool verbose_{false};
    std::optional<std::uint64_t> timeoutMs_;
    bool insecure_{false};
    std::optional<std::string> netrcPath_;
    std::optional<std::string> loadCookies_;
    std::optional<std::string> saveCookies_;
    bool keepSessionCookies_{false};
    std::optional<std::string> configPath_;
    bool init_{false};
};

} // namespace ruget::cli
