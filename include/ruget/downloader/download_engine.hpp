#pragma once

#include <ruget/downloader/downloader.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ruget::downloader {

/**
 * Per-run options for the engine. Values arrive already validated.
 */
struct DownloadOptions {
    std::size_t workers{0}; // 0 = hardware concurrency
    std::uint32_t maxRetries{3};
    BackoffPolicy backoff{};
    bool resume{false};
    std::vector<Header> headers;
    std::optional<std::filesystem::path> outputPath; // explicit single output
    std::optional<std::filesystem::path> outputDir;
    std::filesystem::path failureLog{"ruget_failures.log"};
};

/**
 * URL whose transfer failed permanently in a pass.
 */
struct FailureRecord {
    std::string url;
    std::filesystem::path outputPath;
    std::string error;
};

/**
 * Outcome of a batch.
 */
struct BatchSummary {
    std::size_t succeeded{0};
    std::size_t total{0};
    std::vector<std::string> retriedUrls;
    std::vector<FailureRecord> failures; // permanent, after the retry pass
};

// =====================
// Strategy selection
// =====================

struct SingleStream {};

struct MultiStream {
    std::uint64_t contentLength{0};
    std::size_t workers{0};
};

using TransferStrategy = std::variant<SingleStream, MultiStream>;

/**
 * Choose how to fetch one URL. Multi-stream needs a successful probe with a known
 * length >= kMultiStreamThreshold, byte-range support, more than one worker and no
 * partial local file to resume.
 */
[[nodiscard]] TransferStrategy selectStrategy(const std::optional<ProbeResult>& probe,
                                              std::size_t workers, bool resumingPartial);

// ===============
// Request slots
// ===============

/**
 * Holds one slot of a run-wide request limit for its lifetime. Every HTTP request
 * of a run, from the batch pool and from chunk pools alike, takes a slot first, so
 * at most `workers` requests are in flight. A null semaphore means no limit.
 */
class RequestSlotGuard {
public:
    explicit RequestSlotGuard(std::counting_semaphore<>* slots) : slots_(slots) {
        if (slots_)
            slots_->acquire();
    }
    ~RequestSlotGuard() {
        if (slots_)
            slots_->release();
    }
    RequestSlotGuard(const RequestSlotGuard&) = delete;
    RequestSlotGuard& operator=(const RequestSlotGuard&) = delete;

private:
    std::counting_semaphore<>* slots_;
};

// ===============
// Range Fetcher
// ===============

/**
 * Downloads one byte range (or the whole resource) into a file, retrying transport
 * failures and unaccepted statuses with backoff. Filesystem errors are not retried.
 */
class RangeFetcher {
public:
    RangeFetcher(IHttpAdapter& http, const DownloadOptions& options,
                 const ICredentialStore* credentials, IEventLog& events,
                 std::counting_semaphore<>* requestSlots = nullptr);

    /**
     * Request headers for url: user headers, then Basic auth from the credentials
     * store unless the user already supplied Authorization, then Range.
     */
    [[nodiscard]] std::vector<Header> buildHeaders(std::string_view url,
                                                   const std::optional<ByteRange>& range) const;

    /**
     * Fetch into destination. Returns the number of body bytes written. Bytes of a
     * failed attempt are taken back from progress before the next attempt.
     */
    Result<std::uint64_t> fetch(std::string_view url, const std::optional<ByteRange>& range,
                                const std::filesystem::path& destination, WriteMode mode,
                                IProgressSink* progress) const;

private:
    Result<std::uint64_t> attempt(std::string_view url, const std::optional<ByteRange>& range,
                                  const std::vector<Header>& headers,
                                  const std::filesystem::path& destination,
                                  std::uint64_t baseline, IProgressSink* progress,
                                  bool& fatal) const;

    IHttpAdapter& http_;
    const DownloadOptions& options_;
    const ICredentialStore* credentials_;
    IEventLog& events_;
    std::counting_semaphore<>* requestSlots_;
};

// ================
// Chunk Combiner
// ================

/**
 * Concatenate chunk temp files into output in ascending chunk id order, deleting
 * each temp after it is copied. A missing chunk file aborts with InternalError and
 * leaves remaining temps in place.
 */
class ChunkCombiner {
public:
    Result<std::uint64_t> combine(const std::filesystem::path& output,
                                  std::size_t chunkCount) const;
};

// ==============
// Failure log
// ==============

/**
 * Mutex-guarded append-only failure collection shared by batch workers.
 */
class FailureList {
public:
    void append(FailureRecord record);
    [[nodiscard]] std::vector<FailureRecord> drain();
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<FailureRecord> records_;
};

/**
 * Append "url<TAB>error" lines to path.
 */
Result<void> appendFailureLog(const std::filesystem::path& path,
                              const std::vector<FailureRecord>& records);

// =======================
// Download Orchestrator
// =======================

class DownloadOrchestrator {
public:
    DownloadOrchestrator(DownloadOptions options, std::shared_ptr<IHttpAdapter> http,
                         std::shared_ptr<ICredentialStore> credentials = {},
                         std::shared_ptr<IEventLog> events = {},
                         std::shared_ptr<IProgressSink> progress = {});

    DownloadOrchestrator(const DownloadOrchestrator&) = delete;
    DownloadOrchestrator& operator=(const DownloadOrchestrator&) = delete;

    /**
     * Download a batch: initial pass, one retry pass over failures, failure log for
     * what remains. Fails with AllDownloadsFailed when nothing succeeded, and with
     * InvalidArgument (before any request) for several URLs with one output path.
     */
    Result<BatchSummary> run(const std::vector<std::string>& urls);

    /**
     * Download a single URL. When output is empty the path is derived from the probe
     * and URL. Returns the path written.
     */
    Result<std::filesystem::path> downloadUrl(const std::string& url,
                                              const std::optional<std::filesystem::path>& output);

    [[nodiscard]] std::size_t workerCount() const noexcept { return workers_; }

private:
    using WorkList = std::vector<std::pair<std::string, std::optional<std::filesystem::path>>>;

    Result<std::filesystem::path> transfer(const std::string& url,
                                           const std::optional<std::filesystem::path>& output,
                                           std::filesystem::path& resolved);

    Result<std::filesystem::path> transferOnce(const std::string& url,
                                               const std::optional<std::filesystem::path>& output,
                                               std::filesystem::path& resolved,
                                               std::uint64_t& expectedAdded);

    std::filesystem::path resolveOutputPath(const std::string& url,
                                            const std::optional<ProbeResult>& probe) const;

    Result<std::uint64_t> singleStream(const std::string& url,
                                       const std::filesystem::path& output,
                                       std::uint64_t resumeFrom);

    Result<std::uint64_t> multiStream(const std::string& url, const MultiStream& plan,
                                      const std::filesystem::path& output);

    void runPass(const WorkList& work, FailureList& failures, std::size_t& succeeded);

    DownloadOptions options_;
    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<ICredentialStore> credentials_;
    std::shared_ptr<IEventLog> events_;
    std::shared_ptr<IProgressSink> progress_;
    std::size_t workers_{1};
    std::counting_semaphore<> requestSlots_;
    RangeFetcher fetcher_;
    ChunkCombiner combiner_;
};

} // namespace ruget::downloader
