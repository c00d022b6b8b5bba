// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tandem/core/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace tandem::remote {

// Failure reported by a remote command
struct RemoteFailure {
    std::error_code code;
    std::string detail;     // stderr text or transport error message
};

using SizeResult = std::expected<std::uint64_t, RemoteFailure>;
using ReadResult = std::expected<void, RemoteFailure>;

// Stat and range-read access to a remote data source.
// Implementations must be safe to call from several threads at once.
class RemoteExecutor {
public:
    virtual ~RemoteExecutor() = default;

    // Size of the remote file in bytes; remote_not_found if it does not exist
    [[nodiscard]] virtual SizeResult stat_size(std::string_view remote_path) = 0;

    // Write bytes [offset, offset + length) of the remote file to `dest`.
    // On failure `dest` must not be left behind.
    [[nodiscard]] virtual ReadResult range_read(std::string_view remote_path,
                                                std::uint64_t offset,
                                                std::uint64_t length,
                                                const std::filesystem::path& dest) = 0;

    // Short transport name for logs
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// Single-quote a path for a POSIX shell: it's -> 'it'"'"'s'
[[nodiscard]] std::string quote_shell_path(std::string_view path);

// Delete `dest` unless it holds exactly `expected` bytes
[[nodiscard]] ReadResult verify_length(const std::filesystem::path& dest, std::uint64_t expected);

} // namespace tandem::remote
