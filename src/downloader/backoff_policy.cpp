/*
 * ruget/src/downloader/backoff_policy.cpp
 *
 * Exponential backoff: min(base * factor^attempt, max), with optional +/-25% jitter.
 * Stateless; the jitter source is a per-thread PRNG so concurrent fetchers never
 * contend on it.
 */

#include <ruget/downloader/downloader.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>

namespace ruget::downloader {

namespace {

double jitterFactor() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.75, 1.25);
    return dist(gen);
}

} // namespace

double BackoffPolicy::cappedDelayMs(std::uint32_t attempt) const {
    const auto base = static_cast<double>(baseDelay.count());
    const auto cap = static_cast<double>(maxDelay.count());
    if (base <= 0.0)
        return 0.0; // 0 * inf would be NaN
    const double raw = base * std::pow(factor, static_cast<double>(attempt));
    // pow overflows to +inf for large attempts
    if (!std::isfinite(raw) || raw > cap)
        return cap;
    return raw;
}

std::chrono::milliseconds BackoffPolicy::nextDelay(std::uint32_t attempt) const {
    double delay = cappedDelayMs(attempt);
    if (jitter) {
        delay *= jitterFactor();
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(delay));
}

} // namespace ruget::downloader
