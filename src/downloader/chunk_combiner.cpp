/*
 * ruget/src/downloader/chunk_combiner.cpp
 *
 * Reassembles a multi-stream transfer:
 * - Output is created/truncated once, then chunk temps are appended by ascending id
 * - Each temp is removed right after it has been copied
 * - A missing temp means a chunk fetch failed without being reported; the combine
 *   stops there and the remaining temps stay on disk for inspection
 */

#include <ruget/downloader/download_engine.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <system_error>

namespace ruget::downloader {

namespace fs = std::filesystem;

Result<std::uint64_t> ChunkCombiner::combine(const fs::path& output,
                                             std::size_t chunkCount) const {
    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to create output file: " + output.string()};
    }

    std::array<char, kStreamBlockSize> buffer{};
    std::uint64_t total = 0;

    for (std::size_t id = 0; id < chunkCount; ++id) {
        const auto chunkPath = chunkTempPath(output, id);
        std::error_code ec;
        if (!fs::exists(chunkPath, ec)) {
            return Error{ErrorCode::InternalError,
                         "Chunk file missing at combine time: " + chunkPath.string()};
        }

        std::ifstream in(chunkPath, std::ios::binary);
        if (!in) {
            return Error{ErrorCode::IoError, "Failed to open chunk file: " + chunkPath.string()};
        }
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto got = in.gcount();
            if (got <= 0)
                break;
            out.write(buffer.data(), got);
            if (!out) {
                return Error{ErrorCode::IoError, "Write failed for output: " + output.string()};
            }
            total += static_cast<std::uint64_t>(got);
        }
        if (in.bad()) {
            return Error{ErrorCode::IoError, "Read failed for chunk: " + chunkPath.string()};
        }
        in.close();

        if (!fs::remove(chunkPath, ec) && ec) {
            spdlog::warn("Could not remove chunk file {}: {}", chunkPath.string(), ec.message());
        }
    }

    out.flush();
    if (!out) {
        return Error{ErrorCode::IoError, "Flush failed for output: " + output.string()};
    }
    return total;
}

} // namespace ruget::downloader
