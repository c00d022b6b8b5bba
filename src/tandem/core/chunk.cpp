// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/core/chunk.hpp>
#include <tandem/core/config.hpp>
#include <algorithm>

namespace tandem::core {

std::string_view to_string(ChunkState state) noexcept {
    switch (state) {
        case ChunkState::pending:     return "pending";
        case ChunkState::downloading: return "downloading";
        case ChunkState::completed:   return "completed";
        case ChunkState::error:       return "error";
    }
    return "unknown";
}

std::filesystem::path chunk_temp_path(const std::filesystem::path& local_path,
                                      std::uint32_t index) {
    std::filesystem::path p = local_path;
    p += std::string(CHUNK_SUFFIX) + std::to_string(index);
    return p;
}

std::expected<std::vector<Chunk>, std::error_code>
plan_chunks(std::int64_t total_size,
            std::uint64_t max_chunk_size,
            const std::filesystem::path& local_path) {
    if (total_size <= 0) {
        return std::unexpected(make_error_code(TransferErrc::invalid_size));
    }
    if (max_chunk_size == 0) {
        return std::unexpected(make_error_code(TransferErrc::invalid_chunk_size));
    }

    const auto file_size = static_cast<std::uint64_t>(total_size);
    const std::uint64_t count = (file_size + max_chunk_size - 1) / max_chunk_size;

    std::vector<Chunk> chunks;
    chunks.reserve(static_cast<std::size_t>(count));

    std::uint64_t offset = 0;
    std::uint32_t index = 0;
    while (offset < file_size) {
        std::uint64_t this_size = std::min(max_chunk_size, file_size - offset);

        Chunk chunk;
        chunk.index = index;
        chunk.start = offset;
        chunk.end = offset + this_size;
        chunk.size = this_size;
        chunk.temp_path = chunk_temp_path(local_path, index);
        chunks.push_back(std::move(chunk));

        offset += this_size;
        ++index;
    }

    return chunks;
}

} // namespace tandem::core
