#include <ruget/cli/progress_indicator.h>
#include <ruget/cli/ruget_cli.h>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <system_error>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace ruget::cli {

namespace fs = std::filesystem;

namespace {

constexpr std::uint32_t kDefaultMaxRetries = 3;
constexpr std::uint64_t kDefaultBackoffBaseMs = 500;
constexpr std::uint64_t kDefaultBackoffMaxMs = 10000;
constexpr double kDefaultBackoffFactor = 2.0;
constexpr const char* kDefaultFailureLog = "ruget_failures.log";

bool stderr_is_tty() {
#if defined(_WIN32)
    return _isatty(_fileno(stderr)) != 0;
#else
    return ::isatty(STDERR_FILENO) != 0;
#endif
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Command-line headers replace config headers of the same name
std::vector<downloader::Header> mergeHeaders(std::vector<downloader::Header> base,
                                             const std::vector<downloader::Header>& overrides) {
    for (const auto& h : overrides) {
        const auto name = to_lower(h.name);
        base.erase(std::remove_if(base.begin(), base.end(),
                                  [&](const downloader::Header& b) {
                                      return to_lower(b.name) == name;
                                  }),
                   base.end());
    }
    base.insert(base.end(), overrides.begin(), overrides.end());
    return base;
}

std::vector<downloader::Header> parseHeadersWarn(const std::vector<std::string>& raw) {
    std::vector<std::string> skipped;
    auto headers = downloader::parseHeaderArgs(raw, &skipped);
    for (const auto& s : skipped)
        spdlog::warn("Ignoring malformed header '{}' (expected 'Name: value')", s);
    return headers;
}

} // namespace

RugetCLI::RugetCLI() : app_(std::make_unique<CLI::App>("A wget-like downloader with resumable, "
                                                       "parallel, retrying transfers",
                                                       "ruget")) {
    registerOptions();
}

RugetCLI::~RugetCLI() = default;

void RugetCLI::registerOptions() {
    auto& app = *app_;
    app.set_version_flag("--version", std::string("ruget ") + RUGET_VERSION);

    // Inputs
    app.add_option("urls", urls_, "URL(s) to download.");
    app.add_option("-i,--input", input_,
                   "File with URLs to download (one per line, '#' starts a comment).");

    // Output
    app.add_option("-o,--output", output_, "Write to FILE (single URL only).");
    app.add_option("-P,--output-dir", outputDir_, "Save files into DIR.");

    // Request
    app.add_option("-H,--header", headers_,
                   "Custom header (repeatable), e.g. 'Authorization: Bearer <token>'.");
    app.add_option("--netrc", netrcPath_, "Credentials file (default: $NETRC or ~/.netrc).");
    app.add_option("--timeout-ms", timeoutMs_, "Per-request timeout in ms (default 60000).")
        ->check(CLI::Range(static_cast<std::uint64_t>(100), static_cast<std::uint64_t>(3600000)));
    app.add_flag("--insecure", insecure_, "Disable TLS certificate verification.");
    app.add_option("--load-cookies", loadCookies_,
                   "Send cookies from FILE (Netscape cookie-file format).");
    app.add_option("--save-cookies", saveCookies_,
                   "Write cookies to FILE when the run ends, even if downloads failed.");
    app.add_flag("--keep-session-cookies", keepSessionCookies_,
                 "Also save cookies that have no expiry.");

    // Concurrency and retries
    app.add_option("-j,--jobs", jobs_, "Parallel workers (0 = number of CPUs).")
        ->check(CLI::Range(static_cast<std::size_t>(0), static_cast<std::size_t>(256)));
    app.add_option("--max-retries", maxRetries_, "Retries per request (default 3).")
        ->check(CLI::Range(static_cast<std::uint32_t>(0), static_cast<std::uint32_t>(100)));
    app.add_option("--backoff-base-ms", backoffBaseMs_, "Initial retry delay in ms (default 500).")
        ->check(CLI::Range(static_cast<std::uint64_t>(0), static_cast<std::uint64_t>(600000)));
    app.add_option("--backoff-max-ms", backoffMaxMs_, "Maximum retry delay in ms (default 10000).")
        ->check(CLI::Range(static_cast<std::uint64_t>(0), static_cast<std::uint64_t>(3600000)));
    app.add_option("--backoff-factor", backoffFactor_, "Delay growth factor (default 2.0).")
        ->check(CLI::Range(1.0, 100.0));
    app.add_flag("--no-jitter", noJitter_, "Do not randomize retry delays.");
    app.add_flag("-c,--continue", resume_, "Resume partially downloaded files.");

    // Output / UX
    app.add_option("--log", failureLog_,
                   "Append permanently failed URLs to FILE (default ruget_failures.log).");
    app.add_option("--log-format", logFormat_, "Log format: [text|json] (default: text).")
        ->check(CLI::IsMember({"text", "json"}));
    app.add_option("--log-level", logLevel_,
                   "Log level: [trace|debug|info|warn|error|off] (default: info).");
    app.add_flag("-q,--quiet", quiet_, "Only report errors.");
    app.add_flag("-v,--verbose", verbose_, "Verbose output.");

    // Configuration
    app.add_option("--config", configPath_,
                   "Config file (default: ~/.config/ruget/config.toml or ~/.rugetrc).");
    app.add_flag("--init", init_, "Write a commented config template to ~/.rugetrc and exit.");

    app.footer(R"(Behavior:
  - Resources of 1 MiB or more on servers that accept byte ranges are fetched in
    parallel chunks when --jobs > 1.
  - Failed requests are retried with exponential backoff; failed URLs get one more
    pass after the batch, then are appended to the failure log.
  - Credentials for Basic auth are read from ~/.netrc unless an Authorization
    header is given.
  - Cookie files use the Netscape format shared with curl and wget.)");
}

void RugetCLI::parse(int argc, char* argv[]) {
    app_->parse(argc, argv);
}

std::optional<spdlog::level::level_enum> RugetCLI::parseLevel(const std::string& s) {
    const auto v = to_lower(s);
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

spdlog::level::level_enum RugetCLI::logLevel(const config::FileSettings& file) const {
    if (const char* envLvl = std::getenv("RUGET_LOG_LEVEL"); envLvl && *envLvl) {
        if (auto lvl = parseLevel(envLvl))
            return *lvl;
    }
    if (logLevel_) {
        if (auto lvl = parseLevel(*logLevel_))
            return *lvl;
    }
    if (verbose_)
        return spdlog::level::debug;
    if (quiet_)
        return spdlog::level::err;
    if (file.verbose.value_or(false))
        return spdlog::level::debug;
    if (file.quiet.value_or(false))
        return spdlog::level::err;
    if (file.logLevel) {
        if (auto lvl = parseLevel(*file.logLevel))
            return *lvl;
    }
    return spdlog::level::info;
}

std::string RugetCLI::logFormat(const config::FileSettings& file) const {
    if (logFormat_)
        return *logFormat_;
    return file.logFormat.value_or("text");
}

void RugetCLI::configureLogging(const config::FileSettings& file) const {
    auto logger = spdlog::get("ruget");
    if (!logger)
        logger = spdlog::stderr_color_mt("ruget");
    spdlog::set_default_logger(logger);
    if (logFormat(file) == "json") {
        spdlog::set_pattern("%v");
    } else {
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    }
    spdlog::set_level(logLevel(file));
}

Result<std::vector<std::string>> RugetCLI::collectUrls() const {
    std::vector<std::string> urls = urls_;
    if (input_) {
        auto listed = downloader::loadUrlList(*input_);
        if (!listed)
            return listed.error();
        urls.insert(urls.end(), listed.value().begin(), listed.value().end());
    }
    if (urls.empty()) {
        return Error{ErrorCode::InvalidArgument, "No URLs given (pass URLs or --input FILE)"};
    }
    return urls;
}

Result<downloader::DownloadOptions>
RugetCLI::buildOptions(const config::FileSettings& file) const {
    downloader::DownloadOptions opts;

    opts.workers = jobs_ ? *jobs_ : file.jobs.value_or(0);
    opts.maxRetries = maxRetries_ ? *maxRetries_ : file.maxRetries().value_or(kDefaultMaxRetries);
    opts.resume = resume_ || file.resume.value_or(false);

    const auto baseMs = backoffBaseMs_ ? *backoffBaseMs_
                                       : file.backoffBaseMs.value_or(kDefaultBackoffBaseMs);
    const auto maxMs = backoffMaxMs_ ? *backoffMaxMs_
                                     : file.backoffMaxMs.value_or(kDefaultBackoffMaxMs);
    if (maxMs < baseMs) {
        return Error{ErrorCode::InvalidArgument,
                     "Backoff maximum must not be smaller than the base delay"};
    }
    opts.backoff.baseDelay = std::chrono::milliseconds(baseMs);
    opts.backoff.maxDelay = std::chrono::milliseconds(maxMs);
    opts.backoff.factor =
        backoffFactor_ ? *backoffFactor_ : file.backoffFactor.value_or(kDefaultBackoffFactor);
    opts.backoff.jitter = !noJitter_ && file.backoffJitter.value_or(true);

    opts.headers = mergeHeaders(parseHeadersWarn(file.headers), parseHeadersWarn(headers_));

    if (output_)
        opts.outputPath = fs::path(*output_);
    if (outputDir_)
        opts.outputDir = config::expand_tilde(*outputDir_);
    else if (file.outputDir)
        opts.outputDir = config::expand_tilde(*file.outputDir);

    if (failureLog_)
        opts.failureLog = config::expand_tilde(*failureLog_);
    else
        opts.failureLog = config::expand_tilde(file.failureLog.value_or(kDefaultFailureLog));

    return opts;
}

downloader::HttpSettings RugetCLI::buildHttpSettings(const config::FileSettings& file) const {
    downloader::HttpSettings http;
    http.timeout = std::chrono::milliseconds(
        timeoutMs_ ? *timeoutMs_ : file.timeoutMs.value_or(http.timeout.count()));
    http.userAgent = file.userAgent.value_or(std::string("ruget/") + RUGET_VERSION);
    http.insecure = insecure_ || file.insecure.value_or(false);
    if (loadCookies_)
        http.loadCookies = config::expand_tilde(*loadCookies_);
    if (saveCookies_)
        http.saveCookies = config::expand_tilde(*saveCookies_);
    http.keepSessionCookies = keepSessionCookies_;
    return http;
}

Result<void> RugetCLI::execute(const config::FileSettings& file) {
    if (init_) {
        const auto path = config::get_rc_path();
        if (path.empty()) {
            return Error{ErrorCode::ConfigError, "HOME environment variable not set"};
        }
        auto written = config::writeConfigTemplate(path);
        if (!written)
            return written.error();
        if (written.value()) {
            spdlog::info("Created configuration template at {}", path.string());
        } else {
            spdlog::warn("Configuration file already exists at {}", path.string());
        }
        return {};
    }

    auto urls = collectUrls();
    if (!urls)
        return urls.error();

    auto opts = buildOptions(file);
    if (!opts)
        return opts.error();

    const auto httpSettings = buildHttpSettings(file);
    if (httpSettings.loadCookies) {
        std::error_code ec;
        if (!fs::is_regular_file(*httpSettings.loadCookies, ec)) {
            return Error{ErrorCode::FileNotFound,
                         "Cookie file not found: " + httpSettings.loadCookies->string()};
        }
    }

    auto netrc =
        downloader::loadNetrcStore(netrcPath_ ? config::expand_tilde(*netrcPath_)
                                              : downloader::defaultNetrcPath());
    if (!netrc)
        return netrc.error();

    const auto format = logFormat(file) == "json" ? downloader::LogFormat::Json
                                                  : downloader::LogFormat::Text;
    const bool drawProgress = format == downloader::LogFormat::Text &&
                              spdlog::get_level() <= spdlog::level::info && stderr_is_tty();

    auto progress = std::make_shared<ProgressIndicator>(std::cerr, drawProgress);
    std::shared_ptr<downloader::ICredentialStore> credentials = std::move(netrc).value();

    std::shared_ptr<downloader::IHttpAdapter> http =
        downloader::makeCurlHttpAdapter(httpSettings);

    downloader::DownloadOrchestrator orchestrator(
        std::move(opts).value(), http, std::move(credentials),
        std::shared_ptr<downloader::IEventLog>(downloader::makeEventLog(format)), progress);

    auto result = orchestrator.run(urls.value());
    progress->finish();

    // Cookies are saved whether or not the batch succeeded
    auto saved = http->flushCookies();
    if (!result) {
        if (!saved)
            spdlog::error("{}", saved.error().message);
        return result.error();
    }
    if (!saved)
        return saved.error();
    return {};
}

int RugetCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help and --version exit 0; every usage error maps to 1
        const int rc = app_->exit(e);
        return rc == 0 ? 0 : exitCodeFor(ErrorCode::InvalidArgument);
    }

    try {
        const auto configPath = config::resolveConfigPath(configPath_.value_or(""));
        if (configPath_ && !fs::exists(configPath)) {
            std::cerr << "[FAIL] Config file not found: " << configPath.string() << "\n";
            return exitCodeFor(ErrorCode::ConfigError);
        }
        auto settings = config::loadSettings(configPath);
        if (!settings) {
            std::cerr << "[FAIL] " << settings.error().message << "\n";
            return exitCodeFor(settings.error().code);
        }

        configureLogging(settings.value());

        auto result = execute(settings.value());
        if (!result) {
            spdlog::error("{}", result.error().message);
            return exitCodeFor(result.error().code);
        }
        return 0;
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        return exitCodeFor(ErrorCode::InternalError);
    }
}

} // namespace ruget::cli
