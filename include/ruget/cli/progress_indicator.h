#pragma once

#include <ruget/downloader/downloader.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

namespace ruget::cli {

/**
 * @brief Byte-count progress bar shared by all transfers of a run
 *
 * Implements the engine's progress sink. Safe to call from any worker thread;
 * redraws are throttled and serialized.
 */
class ProgressIndicator final : public downloader::IProgressSink {
public:
    /**
     * @param out Stream to draw on (stderr in the CLI)
     * @param enabled When false, counts are still tracked but nothing is drawn
     */
    explicit ProgressIndicator(std::ostream& out, bool enabled = true);
    ~ProgressIndicator() override;

    ProgressIndicator(const ProgressIndicator&) = delete;
    ProgressIndicator& operator=(const ProgressIndicator&) = delete;

    void increment(std::uint64_t bytes) override;
    void decrement(std::uint64_t bytes) override;
    void addExpected(std::uint64_t bytes) override;
    void removeExpected(std::uint64_t bytes) override;

    /**
     * @brief Clear the bar line; further updates are not drawn
     */
    void finish();

    std::uint64_t current() const { return current_.load(); }
    std::uint64_t total() const { return total_.load(); }

    void setUpdateInterval(int ms) { updateIntervalMs_ = ms; }

    /**
     * @brief Render a bar line, e.g. "[=====>    ] 1.5 MiB/3.0 MiB"
     */
    static std::string formatLine(std::uint64_t current, std::uint64_t total, int width = 40);

private:
    void render();

    std::ostream& out_;
    bool enabled_;
    std::atomic<bool> active_{true};
    std::atomic<std::uint64_t> current_{0};
    std::atomic<std::uint64_t> total_{0};
    int updateIntervalMs_ = 100;

    std::mutex renderMutex_;
    std::chrono::steady_clock::time_point lastUpdate_{};
};

} // namespace ruget::cli
