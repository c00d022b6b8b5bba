// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/core/chunk_fetcher.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>

namespace tandem::core {

ChunkFetcher::ChunkFetcher(remote::RemoteExecutor& executor, std::string remote_path)
    : executor_(executor)
    , remote_path_(std::move(remote_path)) {}

std::expected<void, ChunkError> ChunkFetcher::fetch(const Chunk& chunk) const {
    spdlog::debug("Chunk {} of {}: fetching [{}, {})", chunk.index, remote_path_, chunk.start, chunk.end);

    auto result = executor_.range_read(remote_path_, chunk.start, chunk.size, chunk.temp_path);
    if (result) {
        return {};
    }

    std::error_code ec;
    if (std::filesystem::exists(chunk.temp_path, ec)) {
        // Output was produced; byte count is not checked at this layer
        spdlog::debug("Chunk {}: {} reported '{}' but left output, accepting",
                      chunk.index, executor_.name(), result.error().detail);
        return {};
    }

    return std::unexpected(ChunkError{
        chunk.index,
        make_error_code(TransferErrc::chunk_fetch_failed),
        "Chunk " + std::to_string(chunk.index) + " failed: " + result.error().detail});
}

} // namespace tandem::core
