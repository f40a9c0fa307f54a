/*
 * ruget/src/downloader/event_log.cpp
 *
 * spdlog-backed IEventLog.
 * - Text: short human-readable lines
 * - Json: one JSON object per event ({"event": ..., "level": ..., context fields});
 *   callers that want machine-readable output set the spdlog pattern to "%v"
 */

#include <ruget/downloader/downloader.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <string>

namespace ruget::downloader {

namespace {

using json = nlohmann::json;

class TextEventLog final : public IEventLog {
public:
    void downloadStart(std::string_view url, const std::filesystem::path& output) override {
        spdlog::info("Downloading {} -> {}", url, output.string());
    }

    void downloadResume(const std::filesystem::path& output, std::uint64_t bytes) override {
        spdlog::info("Resuming {} from byte {}", output.string(), bytes);
    }

    void alreadyComplete(const std::filesystem::path& output, std::uint64_t bytes) override {
        spdlog::info("{} already complete ({} bytes), skipping", output.string(), bytes);
    }

    void downloadComplete(const std::filesystem::path& output, std::uint64_t bytes) override {
        spdlog::info("Saved {} ({} bytes)", output.string(), bytes);
    }

    void retryAttempt(std::string_view url, std::uint32_t attempt, std::string_view error,
                      std::chrono::milliseconds delay) override {
        spdlog::warn("Retry {} for {} in {} ms: {}", attempt, url, delay.count(), error);
    }

    void chunkComplete(std::string_view url, std::size_t chunkId, std::uint64_t bytes) override {
        spdlog::debug("Chunk {} of {} done ({} bytes)", chunkId, url, bytes);
    }

    void failure(std::string_view url, std::string_view error) override {
        spdlog::error("Failed {}: {}", url, error);
    }

    void info(std::string_view message) override { spdlog::info("{}", message); }

    void warn(std::string_view message) override { spdlog::warn("{}", message); }

    void summary(std::size_t succeeded, std::size_t total) override {
        if (succeeded == total) {
            spdlog::info("Downloaded {}/{} files", succeeded, total);
        } else {
            spdlog::warn("Downloaded {}/{} files", succeeded, total);
        }
    }
};

class JsonEventLog final : public IEventLog {
public:
    void downloadStart(std::string_view url, const std::filesystem::path& output) override {
        emit(spdlog::level::info, "download_start",
             {{"url", std::string(url)}, {"output", output.string()}});
    }

    void downloadResume(const std::filesystem::path& output, std::uint64_t bytes) override {
        emit(spdlog::level::info, "download_resume", {{"output", output.string()}, {"bytes", bytes}});
    }

    void alreadyComplete(const std::filesystem::path& output, std::uint64_t bytes) override {
        emit(spdlog::level::info, "already_complete",
             {{"output", output.string()}, {"bytes", bytes}});
    }

    void downloadComplete(const std::filesystem::path& output, std::uint64_t bytes) override {
        emit(spdlog::level::info, "download_complete",
             {{"output", output.string()}, {"bytes", bytes}});
    }

    void retryAttempt(std::string_view url, std::uint32_t attempt, std::string_view error,
                      std::chrono::milliseconds delay) override {
        emit(spdlog::level::warn, "retry_attempt",
             {{"url", std::string(url)},
              {"attempt", attempt},
              {"error", std::string(error)},
              {"delay_ms", delay.count()}});
    }

    void chunkComplete(std::string_view url, std::size_t chunkId, std::uint64_t bytes) override {
        emit(spdlog::level::debug, "chunk_complete",
             {{"url", std::string(url)}, {"chunk_id", chunkId}, {"bytes", bytes}});
    }

    void failure(std::string_view url, std::string_view error) override {
        emit(spdlog::level::err, "download_failed",
             {{"url", std::string(url)}, {"error", std::string(error)}});
    }

    void info(std::string_view message) override {
        emit(spdlog::level::info, "message", {{"message", std::string(message)}});
    }

    void warn(std::string_view message) override {
        emit(spdlog::level::warn, "message", {{"message", std::string(message)}});
    }

    void summary(std::size_t succeeded, std::size_t total) override {
        emit(succeeded == total ? spdlog::level::info : spdlog::level::warn, "summary",
             {{"succeeded", succeeded}, {"failed", total - succeeded}, {"total", total}});
    }

private:
    static void emit(spdlog::level::level_enum level, std::string_view event, json fields) {
        if (!spdlog::should_log(level))
            return;
        fields["event"] = std::string(event);
        fields["level"] = std::string(spdlog::level::to_string_view(level).data(),
                                      spdlog::level::to_string_view(level).size());
        spdlog::log(level, "{}", fields.dump());
    }
};

} // namespace

std::unique_ptr<IEventLog> makeEventLog(LogFormat format) {
    if (format == LogFormat::Json)
        return std::make_unique<JsonEventLog>();
    return std::make_unique<TextEventLog>();
}

} // namespace ruget::downloader
