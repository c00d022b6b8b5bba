// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tandem/core/chunk.hpp>
#include <tandem/remote/executor.hpp>
#include <expected>
#include <string>

namespace tandem::core {

// Failure of one chunk's range read
struct ChunkError {
    std::uint32_t index{0};
    std::error_code code;
    std::string message;    // "Chunk <index> failed: <remote error text>"
};

// Performs a single chunk's range read into its temporary file
class ChunkFetcher {
public:
    ChunkFetcher(remote::RemoteExecutor& executor, std::string remote_path);

    // A remote failure counts only if the temporary file was not produced
    [[nodiscard]] std::expected<void, ChunkError> fetch(const Chunk& chunk) const;

    [[nodiscard]] const std::string& remote_path() const noexcept { return remote_path_; }

private:
    remote::RemoteExecutor& executor_;
    std::string remote_path_;
};

} // namespace tandem::core
