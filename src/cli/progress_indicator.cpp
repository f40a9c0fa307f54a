#include <ruget/cli/progress_indicator.h>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace ruget::cli {

namespace {

std::string humanBytes(std::uint64_t bytes) {
    static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = static_cast<double>(bytes);
    size_t unit = 0;
    while (v >= 1024.0 && unit + 1 < std::size(kUnits)) {
        v /= 1024.0;
        ++unit;
    }
    if (unit == 0)
        return fmt::format("{} B", bytes);
    return fmt::format("{:.1f} {}", v, kUnits[unit]);
}

} // namespace

ProgressIndicator::ProgressIndicator(std::ostream& out, bool enabled)
    : out_(out), enabled_(enabled) {}

ProgressIndicator::~ProgressIndicator() {
    finish();
}

void ProgressIndicator::increment(std::uint64_t bytes) {
    current_.fetch_add(bytes, std::memory_order_relaxed);
    render();
}

void ProgressIndicator::decrement(std::uint64_t bytes) {
    current_.fetch_sub(bytes, std::memory_order_relaxed);
    render();
}

void ProgressIndicator::addExpected(std::uint64_t bytes) {
    total_.fetch_add(bytes, std::memory_order_relaxed);
    render();
}

void ProgressIndicator::removeExpected(std::uint64_t bytes) {
    total_.fetch_sub(bytes, std::memory_order_relaxed);
    render();
}

void ProgressIndicator::finish() {
    if (!active_.exchange(false))
        return;
    if (enabled_) {
        std::lock_guard<std::mutex> lk(renderMutex_);
        // Clear the line
        out_ << "\r\033[K" << std::flush;
    }
}

std::string ProgressIndicator::formatLine(std::uint64_t current, std::uint64_t total,
                                          int width) {
    std::string line = "[";
    if (total > 0) {
        const double fraction =
            std::min(1.0, static_cast<double>(current) / static_cast<double>(total));
        const int filled = static_cast<int>(fraction * width);
        for (int i = 0; i < width; ++i) {
            if (i < filled)
                line.push_back('=');
            else if (i == filled)
                line.push_back('>');
            else
                line.push_back(' ');
        }
        line += "] " + humanBytes(current) + "/" + humanBytes(total);
    } else {
        line.append(static_cast<size_t>(width), ' ');
        line += "] " + humanBytes(current);
    }
    return line;
}

void ProgressIndicator::render() {
    if (!enabled_ || !active_)
        return;

    std::unique_lock<std::mutex> lk(renderMutex_, std::try_to_lock);
    if (!lk.owns_lock())
        return; // another thread is drawing

    auto now = std::chrono::steady_clock::now();
    auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - lastUpdate_).count();
    if (elapsed < updateIntervalMs_)
        return;
    lastUpdate_ = now;

    out_ << "\r" << formatLine(current_.load(), total_.load()) << std::flush;
}

} // namespace ruget::cli
