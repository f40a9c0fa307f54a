/*
 * ruget/src/downloader/download_orchestrator.cpp
 *
 * Per-URL flow:
 * - HEAD probe (status, length, Accept-Ranges, Content-Disposition)
 * - Resume check: an existing file at least as long as the remote is complete
 * - Strategy: SingleStream (optionally appending from the local size) or
 *   MultiStream (planned chunks on a bounded pool, then ordered combine)
 *
 * Batch flow:
 * - Initial pass over all URLs on a pool of `workers` threads
 * - Every HEAD and GET of the run holds one of `workers` request slots, so chunk
 *   pools nested inside batch tasks never push in-flight requests past `workers`
 * - A URL that fails takes its bytes and expected length back out of progress
 * - One retry pass over the URLs that failed, with fresh attempt counters
 * - Remaining failures appended to the failure log; all failed => hard error
 */

#include <ruget/downloader/download_engine.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <system_error>
#include <thread>
#include <utility>

namespace ruget::downloader {

namespace fs = std::filesystem;

namespace {

std::size_t resolveWorkers(std::size_t requested) {
    if (requested > 0)
        return requested;
    unsigned int hw = std::thread::hardware_concurrency();
    return hw == 0 ? 4 : hw;
}

bool isSuccessStatus(int status) {
    return status >= 200 && status < 300;
}

// Failure log entries are one line each
std::string singleLine(std::string s) {
    std::replace_if(
        s.begin(), s.end(), [](char c) { return c == '\t' || c == '\n' || c == '\r'; }, ' ');
    return s;
}

void removeChunkTemps(const fs::path& output, std::size_t count) {
    for (std::size_t id = 0; id < count; ++id) {
        std::error_code ec;
        fs::remove(chunkTempPath(output, id), ec);
    }
}

} // namespace

// ===== Strategy =====

TransferStrategy selectStrategy(const std::optional<ProbeResult>& probe, std::size_t workers,
                                bool resumingPartial) {
    if (!probe || workers <= 1 || resumingPartial)
        return SingleStream{};
    if (!isSuccessStatus(probe->status) || !probe->contentLength || !probe->acceptsRanges)
        return SingleStream{};
    if (*probe->contentLength < kMultiStreamThreshold)
        return SingleStream{};
    return MultiStream{*probe->contentLength, workers};
}

// ===== Failure collection =====

void FailureList::append(FailureRecord record) {
    std::lock_guard<std::mutex> lk(mutex_);
    records_.push_back(std::move(record));
}

std::vector<FailureRecord> FailureList::drain() {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<FailureRecord> out;
    out.swap(records_);
    return out;
}

std::size_t FailureList::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return records_.size();
}

Result<void> appendFailureLog(const fs::path& path, const std::vector<FailureRecord>& records) {
    if (records.empty())
        return {};
    std::ofstream log(path, std::ios::app);
    if (!log) {
        return Error{ErrorCode::IoError, "Opening failure log " + path.string()};
    }
    for (const auto& rec : records) {
        log << singleLine(rec.url) << '\t' << singleLine(rec.error) << '\n';
    }
    log.flush();
    if (!log) {
        return Error{ErrorCode::IoError, "Writing failure entry to log file " + path.string()};
    }
    return {};
}

// ===== Orchestrator =====

DownloadOrchestrator::DownloadOrchestrator(DownloadOptions options,
                                           std::shared_ptr<IHttpAdapter> http,
                                           std::shared_ptr<ICredentialStore> credentials,
                                           std::shared_ptr<IEventLog> events,
                                           std::shared_ptr<IProgressSink> progress)
    : options_(std::move(options)),
      http_(http ? std::move(http)
                 : std::shared_ptr<IHttpAdapter>(makeCurlHttpAdapter(HttpSettings{}))),
      credentials_(std::move(credentials)),
      events_(events ? std::move(events)
                     : std::shared_ptr<IEventLog>(makeEventLog(LogFormat::Text))),
      progress_(std::move(progress)), workers_(resolveWorkers(options_.workers)),
      requestSlots_(static_cast<std::ptrdiff_t>(workers_)),
      fetcher_(*http_, options_, credentials_.get(), *events_, &requestSlots_) {}

Result<BatchSummary> DownloadOrchestrator::run(const std::vector<std::string>& urls) {
    if (urls.empty()) {
        return Error{ErrorCode::InvalidArgument, "No URLs to download"};
    }
    if (urls.size() > 1 && options_.outputPath) {
        return Error{ErrorCode::InvalidArgument, "Cannot use --output with multiple URLs"};
    }

    BatchSummary summary;
    summary.total = urls.size();

    FailureList failures;
    std::size_t succeeded = 0;

    WorkList initial;
    initial.reserve(urls.size());
    for (const auto& url : urls)
        initial.emplace_back(url, options_.outputPath);
    runPass(initial, failures, succeeded);

    WorkList retry;
    for (auto& rec : failures.drain()) {
        events_->info("Retrying: " + rec.url);
        summary.retriedUrls.push_back(rec.url);
        std::optional<fs::path> out;
        if (!rec.outputPath.empty())
            out = rec.outputPath;
        retry.emplace_back(std::move(rec.url), std::move(out));
    }
    if (!retry.empty())
        runPass(retry, failures, succeeded);

    summary.failures = failures.drain();
    summary.succeeded = succeeded;
    events_->summary(summary.succeeded, summary.total);

    if (!summary.failures.empty()) {
        auto logged = appendFailureLog(options_.failureLog, summary.failures);
        if (!logged)
            return logged.error();
        events_->warn(fmt::format("{} downloads permanently failed. See {} for details.",
                                  summary.failures.size(), options_.failureLog.string()));
        if (summary.failures.size() == summary.total) {
            return Error{ErrorCode::AllDownloadsFailed, "All downloads failed after retries"};
        }
    }
    return summary;
}

void DownloadOrchestrator::runPass(const WorkList& work, FailureList& failures,
                                   std::size_t& succeeded) {
    std::atomic<std::size_t> ok{0};
    {
        boost::asio::thread_pool pool(std::min(workers_, work.size()));
        for (const auto& item : work) {
            boost::asio::post(pool, [this, &failures, &ok, item]() {
                const auto& [url, output] = item;
                fs::path resolved = output.value_or(fs::path{});
                auto r = transfer(url, output, resolved);
                if (r) {
                    ok.fetch_add(1, std::memory_order_relaxed);
                    return;
                }
                events_->failure(url, r.error().message);
                failures.append(FailureRecord{url, resolved, r.error().message});
            });
        }
        pool.join();
    }
    succeeded += ok.load();
}

Result<fs::path>
DownloadOrchestrator::downloadUrl(const std::string& url, const std::optional<fs::path>& output) {
    fs::path resolved;
    return transfer(url, output, resolved);
}

Result<fs::path> DownloadOrchestrator::transfer(const std::string& url,
                                                const std::optional<fs::path>& output,
                                                fs::path& resolved) {
    std::uint64_t expectedAdded = 0;
    auto r = transferOnce(url, output, resolved, expectedAdded);
    if (!r && progress_ && expectedAdded > 0)
        progress_->removeExpected(expectedAdded);
    return r;
}

Result<fs::path> DownloadOrchestrator::transferOnce(const std::string& url,
                                                    const std::optional<fs::path>& output,
                                                    fs::path& resolved,
                                                    std::uint64_t& expectedAdded) {
    try {
        std::optional<ProbeResult> probe;
        auto pr = [&] {
            RequestSlotGuard slot(&requestSlots_);
            return http_->head(url, fetcher_.buildHeaders(url, std::nullopt));
        }();
        if (pr && isSuccessStatus(pr.value().status)) {
            probe = pr.value();
        } else if (pr) {
            spdlog::debug("HEAD {} returned HTTP {}", url, pr.value().status);
        } else {
            spdlog::debug("HEAD {} failed: {}", url, pr.error().message);
        }

        const auto path = output ? *output : resolveOutputPath(url, probe);
        resolved = path;

        if (path.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                return Error{ErrorCode::IoError, "Cannot create directory " +
                                                     path.parent_path().string() + ": " +
                                                     ec.message()};
            }
        }

        events_->downloadStart(url, path);

        const std::optional<std::uint64_t> remoteLength =
            probe ? probe->contentLength : std::nullopt;
        if (remoteLength && progress_) {
            progress_->addExpected(*remoteLength);
            expectedAdded = *remoteLength;
        }

        std::uint64_t existing = 0;
        if (options_.resume) {
            std::error_code ec;
            if (fs::exists(path, ec)) {
                existing = fs::file_size(path, ec);
                if (ec) {
                    return Error{ErrorCode::IoError,
                                 "Cannot stat " + path.string() + ": " + ec.message()};
                }
            }
            if (remoteLength && existing >= *remoteLength) {
                if (progress_)
                    progress_->increment(*remoteLength);
                events_->alreadyComplete(path, existing);
                return path;
            }
            if (!remoteLength && existing > 0) {
                events_->info(fmt::format("Remote size of {} unknown, downloading {} from scratch",
                                          url, path.string()));
                existing = 0;
            }
        }

        const bool resumingPartial = existing > 0;
        const auto strategy = selectStrategy(probe, workers_, resumingPartial);

        Result<std::uint64_t> written =
            std::holds_alternative<MultiStream>(strategy)
                ? multiStream(url, std::get<MultiStream>(strategy), path)
                : singleStream(url, path, existing);
        if (!written)
            return written.error();

        events_->downloadComplete(path, existing + written.value());
        return path;
    } catch (const std::exception& e) {
        return Error{ErrorCode::Unknown, std::string("Unexpected error for ") + url + ": " +
                                             e.what()};
    }
}

fs::path DownloadOrchestrator::resolveOutputPath(const std::string& url,
                                                 const std::optional<ProbeResult>& probe) const {
    if (options_.outputPath)
        return *options_.outputPath;
    const std::string name = probe && probe->suggestedFilename ? *probe->suggestedFilename
                                                               : fallbackFilename(url);
    return options_.outputDir ? *options_.outputDir / name : fs::path(name);
}

Result<std::uint64_t> DownloadOrchestrator::singleStream(const std::string& url,
                                                         const fs::path& output,
                                                         std::uint64_t resumeFrom) {
    if (resumeFrom > 0) {
        if (progress_)
            progress_->increment(resumeFrom);
        events_->downloadResume(output, resumeFrom);
        auto r = fetcher_.fetch(url, ByteRange{resumeFrom, std::nullopt}, output,
                                WriteMode::Append, progress_.get());
        if (!r && progress_)
            progress_->decrement(resumeFrom);
        return r;
    }
    return fetcher_.fetch(url, std::nullopt, output, WriteMode::Truncate, progress_.get());
}

Result<std::uint64_t> DownloadOrchestrator::multiStream(const std::string& url,
                                                        const MultiStream& plan,
                                                        const fs::path& output) {
    const auto chunks = planChunks(plan.contentLength, plan.workers);
    spdlog::debug("Fetching {} in {} chunks", url, chunks.size());

    std::vector<std::optional<Error>> errors(chunks.size());
    std::atomic<std::uint64_t> delivered{0};
    {
        boost::asio::thread_pool pool(std::min(plan.workers, chunks.size()));
        for (const auto& chunk : chunks) {
            boost::asio::post(pool, [this, &url, &output, &errors, &delivered, chunk]() {
                try {
                    auto r = fetcher_.fetch(url, ByteRange{chunk.startByte, chunk.endByte},
                                            chunkTempPath(output, chunk.chunkId),
                                            WriteMode::Truncate, progress_.get());
                    if (!r) {
                        errors[chunk.chunkId] = r.error();
                        return;
                    }
                    delivered.fetch_add(r.value(), std::memory_order_relaxed);
                    events_->chunkComplete(url, chunk.chunkId, r.value());
                } catch (const std::exception& e) {
                    errors[chunk.chunkId] = Error{ErrorCode::Unknown, e.what()};
                }
            });
        }
        pool.join();
    }

    for (std::size_t id = 0; id < errors.size(); ++id) {
        if (errors[id]) {
            removeChunkTemps(output, chunks.size());
            if (progress_)
                progress_->decrement(delivered.load());
            return Error{errors[id]->code,
                         fmt::format("chunk {} failed: {}", id, errors[id]->message)};
        }
    }

    auto combined = combiner_.combine(output, chunks.size());
    if (!combined && progress_)
        progress_->decrement(delivered.load());
    return combined;
}

} // namespace ruget::downloader
