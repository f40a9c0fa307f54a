/*
 * ruget/src/downloader/range_fetcher.cpp
 *
 * One logical HTTP GET with a local retry loop:
 * - Headers: user headers, Basic auth from the credentials store when no user
 *   Authorization is present, then Range
 * - Transport errors and any status other than 200/206 are retried up to
 *   maxRetries times, sleeping backoff.nextDelay(attempt - 1) in between
 * - Filesystem errors end the fetch immediately
 * - Every attempt rewinds the destination to the size it had when the fetch
 *   started, so a body cut off mid-stream is never appended twice
 * - A 200 reply to a ranged request (server ignored Range) is sliced down to the
 *   requested bytes
 * - Bytes reported to progress by a failed attempt are taken back, so progress
 *   counts each body byte once
 * - Each GET holds one run-wide request slot while it is on the wire; backoff
 *   sleeps hold none
 */

#include <ruget/downloader/download_engine.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>
#include <thread>

namespace ruget::downloader {

namespace fs = std::filesystem;

namespace {

bool isAcceptedStatus(int status) {
    return status == 200 || status == 206;
}

bool isRangeHeader(const Header& h) {
    if (h.name.size() != 5)
        return false;
    return std::equal(h.name.begin(), h.name.end(), "range", [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == b;
    });
}

} // namespace

RangeFetcher::RangeFetcher(IHttpAdapter& http, const DownloadOptions& options,
                           const ICredentialStore* credentials, IEventLog& events,
                           std::counting_semaphore<>* requestSlots)
    : http_(http), options_(options), credentials_(credentials), events_(events),
      requestSlots_(requestSlots) {}

std::vector<Header> RangeFetcher::buildHeaders(std::string_view url,
                                               const std::optional<ByteRange>& range) const {
    std::vector<Header> headers = options_.headers;

    // User-supplied Authorization takes priority over netrc credentials
    if (credentials_ && !hasHeader(headers, "Authorization")) {
        const auto host = hostFromUrl(url);
        if (!host.empty()) {
            if (auto creds = credentials_->lookup(host)) {
                headers.push_back(
                    {"Authorization", "Basic " + base64Encode(creds->login + ":" + creds->password)});
            }
        }
    }

    if (range) {
        headers.erase(std::remove_if(headers.begin(), headers.end(), isRangeHeader),
                      headers.end());
        headers.push_back({"Range", range->headerValue()});
    }
    return headers;
}

Result<std::uint64_t> RangeFetcher::fetch(std::string_view url,
                                          const std::optional<ByteRange>& range,
                                          const fs::path& destination, WriteMode mode,
                                          IProgressSink* progress) const {
    const auto headers = buildHeaders(url, range);

    std::uint64_t baseline = 0;
    if (mode == WriteMode::Append) {
        std::error_code ec;
        if (fs::exists(destination, ec)) {
            baseline = fs::file_size(destination, ec);
            if (ec) {
                return Error{ErrorCode::IoError,
                             "Cannot stat " + destination.string() + ": " + ec.message()};
            }
        }
    }

    for (std::uint32_t attemptNo = 0;; ++attemptNo) {
        bool fatal = false;
        auto r = attempt(url, range, headers, destination, baseline, progress, fatal);
        if (r)
            return r;
        if (fatal)
            return r.error();

        if (attemptNo >= options_.maxRetries) {
            return Error{r.error().code, fmt::format("{} (giving up after {} attempts)",
                                                     r.error().message, attemptNo + 1)};
        }

        const auto delay = options_.backoff.nextDelay(attemptNo);
        events_.retryAttempt(url, attemptNo + 1, r.error().message, delay);
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);
    }
}

Result<std::uint64_t> RangeFetcher::attempt(std::string_view url,
                                            const std::optional<ByteRange>& range,
                                            const std::vector<Header>& headers,
                                            const fs::path& destination, std::uint64_t baseline,
                                            IProgressSink* progress, bool& fatal) const {
    {
        std::error_code ec;
        if (fs::exists(destination, ec)) {
            fs::resize_file(destination, baseline, ec);
            if (ec) {
                fatal = true;
                return Error{ErrorCode::IoError,
                             "Cannot reset " + destination.string() + ": " + ec.message()};
            }
        }
    }

    std::ofstream out(destination, std::ios::binary | std::ios::app);
    if (!out) {
        fatal = true;
        return Error{ErrorCode::IoError, "Failed to open destination: " + destination.string()};
    }

    const std::uint64_t skip = range ? range->start : 0;
    std::optional<std::uint64_t> limit;
    if (range && range->end)
        limit = *range->end - range->start + 1;

    int status = 0;
    std::uint64_t bodyPos = 0;
    std::uint64_t written = 0;
    std::optional<Error> ioError;

    auto accept = [&status](int s) {
        status = s;
        return isAcceptedStatus(s);
    };

    auto sink = [&](std::span<const std::byte> block) -> Result<void> {
        auto data = block;
        if (status == 200 && skip > bodyPos) {
            const auto drop = static_cast<std::size_t>(
                std::min<std::uint64_t>(skip - bodyPos, data.size()));
            bodyPos += drop;
            data = data.subspan(drop);
        }
        bodyPos += data.size();
        if (limit) {
            const auto room = *limit - std::min(*limit, written);
            if (data.size() > room)
                data = data.first(static_cast<std::size_t>(room));
        }
        if (data.empty())
            return {};

        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        if (!out) {
            ioError = Error{ErrorCode::IoError, "Write failed for " + destination.string()};
            return *ioError;
        }
        written += data.size();
        if (progress)
            progress->increment(data.size());
        return {};
    };

    auto failed = [&](Error err) -> Result<std::uint64_t> {
        if (progress && written > 0)
            progress->decrement(written);
        return err;
    };

    spdlog::debug("GET {} ({})", url, range ? range->headerValue() : std::string("full"));
    Result<HttpResponse> resp = [&] {
        RequestSlotGuard slot(requestSlots_);
        return http_.get(url, headers, accept, sink);
    }();

    out.flush();
    if (!ioError && !out)
        ioError = Error{ErrorCode::IoError, "Flush failed for " + destination.string()};
    if (ioError) {
        fatal = true;
        return failed(*ioError);
    }
    if (!resp)
        return failed(resp.error());

    const int finalStatus = resp.value().status;
    if (!isAcceptedStatus(finalStatus)) {
        return failed(
            Error{ErrorCode::HttpStatus, fmt::format("HTTP {} for {}", finalStatus, url)});
    }
    if (limit && written != *limit) {
        return failed(Error{ErrorCode::NetworkError,
                            fmt::format("Short body for {}: got {} of {} bytes", url, written,
                                        *limit)});
    }
    return written;
}

} // namespace ruget::downloader
