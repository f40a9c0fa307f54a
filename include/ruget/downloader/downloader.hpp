#pragma once

/*
 * ruget Downloader - Public Types and Collaborator Interfaces (C++20)
 *
 * This header defines the data types, policies and abstract collaborators used
 * by the download engine. Concrete engine classes live in download_engine.hpp.
 *
 * Design principles:
 * - Byte-exact output under resume, concurrency and partial failure
 * - Bounded per-request retries with exponential backoff
 * - Clear separation of concerns (HTTP adapter, credentials, progress, event log)
 */

#include <ruget/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ruget::downloader {

// ================================
// Fundamental enums and constants
// ================================

/// Bodies are streamed in blocks of at most this many bytes.
inline constexpr std::size_t kStreamBlockSize = 64 * 1024;

/// Resources smaller than this are always fetched single-stream.
inline constexpr std::uint64_t kMultiStreamThreshold = 1024 * 1024;

/// Suffix inserted between the output path and the chunk id for chunk temp files.
inline constexpr std::string_view kChunkTempInfix = ".tmp.chunk.";

/**
 * Rendering used by the transfer event log.
 */
enum class LogFormat { Text, Json };

/**
 * How a Range Fetcher opens its destination.
 */
enum class WriteMode { Truncate, Append };

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * One planned byte range of a multi-stream transfer. endByte is inclusive.
 */
struct DownloadChunk {
    std::uint64_t startByte{0};
    std::uint64_t endByte{0};
    std::size_t chunkId{0};

    [[nodiscard]] std::uint64_t size() const noexcept { return endByte - startByte + 1; }
};

/**
 * Requested byte range. An empty end means "to the end of the resource".
 */
struct ByteRange {
    std::uint64_t start{0};
    std::optional<std::uint64_t> end{};

    [[nodiscard]] std::string headerValue() const;
};

/**
 * Exponential backoff between retry attempts.
 * next delay = min(baseDelay * factor^attempt, maxDelay), optionally scaled by a
 * uniform jitter factor in [0.75, 1.25].
 */
struct BackoffPolicy {
    std::chrono::milliseconds baseDelay{100};
    double factor{2.0};
    std::chrono::milliseconds maxDelay{60000};
    bool jitter{true};

    [[nodiscard]] std::chrono::milliseconds nextDelay(std::uint32_t attempt) const;

    /// Delay before jitter is applied; always <= maxDelay.
    [[nodiscard]] double cappedDelayMs(std::uint32_t attempt) const;
};

/**
 * Result of a HEAD probe.
 */
struct ProbeResult {
    int status{0};
    std::optional<std::uint64_t> contentLength{};
    bool acceptsRanges{false};
    std::optional<std::string> suggestedFilename{}; // from Content-Disposition
};

/**
 * Status and headers of a GET response. The body is delivered through a BodySink.
 */
struct HttpResponse {
    int status{0};
    std::vector<Header> headers;
};

/**
 * Login/password pair from the credentials store.
 */
struct Credentials {
    std::string login;
    std::string password;
};

/**
 * Transport settings shared by every request of a run.
 */
struct HttpSettings {
    std::chrono::milliseconds timeout{60000};
    std::string userAgent{"ruget/0.1.0"};
    bool insecure{false};
    int maxRedirects{10};

    // Netscape-format cookie jar. Cookies from loadCookies are sent on every
    // request; the jar is written to saveCookies by IHttpAdapter::flushCookies().
    std::optional<std::filesystem::path> loadCookies{};
    std::optional<std::filesystem::path> saveCookies{};
    bool keepSessionCookies{false};
};

// ===================
// Callback signatures
// ===================

using BodySink = std::function<Result<void>(std::span<const std::byte>)>;
using StatusFilter = std::function<bool(int)>;

// ==========================
// Collaborator interfaces
// ==========================

/**
 * HTTP client abstraction (libcurl-based implementation satisfies this).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Header-only probe for status, content length, range support and suggested name.
     */
    virtual Result<ProbeResult> head(std::string_view url, const std::vector<Header>& headers) = 0;

    /**
     * Send a GET. Body bytes are passed to sink only when accept(status) is true;
     * bodies of rejected statuses are discarded. Transport failures and sink errors
     * are returned as errors; any received status is returned as a response.
     */
    virtual Result<HttpResponse> get(std::string_view url, const std::vector<Header>& headers,
                                     const StatusFilter& accept, const BodySink& sink) = 0;

    /**
     * Write the cookie jar to its save location, if one is configured.
     */
    virtual Result<void> flushCookies() { return {}; }
};

/**
 * Machine credentials lookup (netrc-style host/login/password triplets).
 */
class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;
    virtual std::optional<Credentials> lookup(std::string_view host) const = 0;
};

/**
 * Receives transferred byte counts. Implementations must be thread-safe.
 */
class IProgressSink {
public:
    virtual ~IProgressSink() = default;
    virtual void increment(std::uint64_t bytes) = 0;

    /// Take back bytes counted by an attempt that was later discarded.
    virtual void decrement(std::uint64_t bytes) = 0;

    /// Grow the expected total once a content length becomes known.
    virtual void addExpected(std::uint64_t /*bytes*/) {}

    /// Shrink the expected total when a transfer is abandoned.
    virtual void removeExpected(std::uint64_t /*bytes*/) {}
};

/**
 * Named events emitted by the engine. Output format is up to the implementation.
 */
class IEventLog {
public:
    virtual ~IEventLog() = default;

    virtual void downloadStart(std::string_view url, const std::filesystem::path& output) = 0;
    virtual void downloadResume(const std::filesystem::path& output, std::uint64_t bytes) = 0;
    virtual void alreadyComplete(const std::filesystem::path& output, std::uint64_t bytes) = 0;
    virtual void downloadComplete(const std::filesystem::path& output, std::uint64_t bytes) = 0;
    virtual void retryAttempt(std::string_view url, std::uint32_t attempt,
                              std::string_view error, std::chrono::milliseconds delay) = 0;
    virtual void chunkComplete(std::string_view url, std::size_t chunkId,
                               std::uint64_t bytes) = 0;
    virtual void failure(std::string_view url, std::string_view error) = 0;
    virtual void info(std::string_view message) = 0;
    virtual void warn(std::string_view message) = 0;
    virtual void summary(std::size_t succeeded, std::size_t total) = 0;
};

// ======================
// Planning and naming
// ======================

/**
 * Partition [0, contentLength) into workerCount contiguous chunks. The last chunk
 * absorbs the integer-division remainder. Worker counts above contentLength are
 * clamped so no chunk is empty.
 */
[[nodiscard]] std::vector<DownloadChunk> planChunks(std::uint64_t contentLength,
                                                    std::size_t workerCount);

/**
 * Deterministic temp path for a chunk: "<output>.tmp.chunk.<id>".
 */
[[nodiscard]] std::filesystem::path chunkTempPath(const std::filesystem::path& output,
                                                  std::size_t chunkId);

/**
 * Extract filename="x" / filename=x from a Content-Disposition value.
 */
[[nodiscard]] std::optional<std::string> filenameFromContentDisposition(std::string_view value);

/**
 * File name derived from the last URL path segment, or "download.bin".
 */
[[nodiscard]] std::string fallbackFilename(std::string_view url);

/**
 * Host part of an absolute URL (no scheme, userinfo or port). Empty if none.
 */
[[nodiscard]] std::string hostFromUrl(std::string_view url);

/**
 * Standard base64 with padding.
 */
[[nodiscard]] std::string base64Encode(std::string_view in);

/**
 * Parse "Name: value" header arguments. Malformed entries are reported in skipped.
 */
[[nodiscard]] std::vector<Header> parseHeaderArgs(const std::vector<std::string>& args,
                                                  std::vector<std::string>* skipped = nullptr);

/**
 * Case-insensitive header presence check.
 */
[[nodiscard]] bool hasHeader(const std::vector<Header>& headers, std::string_view name);

/**
 * Load URLs from a list file: one per line, trimmed, blank lines and '#' comments skipped.
 */
Result<std::vector<std::string>> loadUrlList(const std::filesystem::path& path);

/**
 * Drop session cookies (expiry 0) from Netscape cookie-file text. Comment and
 * blank lines are kept; "#HttpOnly_" lines are cookies, not comments.
 */
[[nodiscard]] std::string filterSessionCookies(std::string_view jar);

// ==========
// Factories
// ==========

/**
 * libcurl adapter.
 */
std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter(const HttpSettings& settings);

/**
 * RAII scope for process-wide HTTP library initialization. Create once in main().
 */
class HttpGlobalScope {
public:
    HttpGlobalScope();
    ~HttpGlobalScope();
    HttpGlobalScope(const HttpGlobalScope&) = delete;
    HttpGlobalScope& operator=(const HttpGlobalScope&) = delete;
};

/**
 * Netrc credentials parsed from text, and from a file (missing file = empty store).
 */
std::unique_ptr<ICredentialStore> makeNetrcStore(std::string_view contents);
Result<std::unique_ptr<ICredentialStore>> loadNetrcStore(const std::filesystem::path& path);

/**
 * Default netrc location: $NETRC, else ~/.netrc. Empty if HOME is unset.
 */
std::filesystem::path defaultNetrcPath();

/**
 * spdlog-backed event log in text or JSON rendering.
 */
std::unique_ptr<IEventLog> makeEventLog(LogFormat format);

} // namespace ruget::downloader
