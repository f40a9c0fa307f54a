#include <ruget/downloader/downloader.hpp>

#include <algorithm>
#include <string>

namespace ruget::downloader {

std::vector<DownloadChunk> planChunks(std::uint64_t contentLength, std::size_t workerCount) {
    std::vector<DownloadChunk> chunks;
    if (contentLength == 0 || workerCount == 0)
        return chunks;

    const auto count =
        static_cast<std::size_t>(std::min<std::uint64_t>(workerCount, contentLength));
    const std::uint64_t baseSize = contentLength / count;

    chunks.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        DownloadChunk chunk;
        chunk.chunkId = i;
        chunk.startByte = static_cast<std::uint64_t>(i) * baseSize;
        // Last chunk absorbs the division remainder
        chunk.endByte = (i + 1 == count) ? contentLength - 1
                                         : static_cast<std::uint64_t>(i + 1) * baseSize - 1;
        chunks.push_back(chunk);
    }
    return chunks;
}

std::filesystem::path chunkTempPath(const std::filesystem::path& output, std::size_t chunkId) {
    auto p = output;
    p += std::string(kChunkTempInfix);
    p += std::to_string(chunkId);
    return p;
}

} // namespace ruget::downloader
