// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tandem/core/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tandem::core {

// Chunk state machine
enum class ChunkState : std::uint8_t {
    pending,     // Waiting in the queue
    downloading, // Range read in flight
    completed,   // Temporary file holds the full range
    error        // Range read failed
};

[[nodiscard]] std::string_view to_string(ChunkState state) noexcept;

// One contiguous byte range [start, end) of the remote file
struct Chunk {
    std::uint32_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};            // Exclusive
    std::uint64_t size{0};
    ChunkState state{ChunkState::pending};
    std::filesystem::path temp_path; // Local temporary holding this range
};

// Temporary file for chunk `index` of a transfer writing to `local_path`
[[nodiscard]] std::filesystem::path chunk_temp_path(const std::filesystem::path& local_path,
                                                    std::uint32_t index);

// Split `total_size` bytes into ceil(total_size / max_chunk_size) chunks.
// Every chunk is `max_chunk_size` long except the last, which takes the remainder.
[[nodiscard]] std::expected<std::vector<Chunk>, std::error_code>
plan_chunks(std::int64_t total_size,
            std::uint64_t max_chunk_size,
            const std::filesystem::path& local_path);

} // namespace tandem::core
