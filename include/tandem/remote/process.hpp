// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace tandem::remote {

// Outcome of a finished child process
struct ProcessResult {
    int exit_code{-1};          // 128 + signal number if killed by a signal
    std::string output;         // Captured stdout (empty when redirected to a file)
    std::string error;          // Captured stderr
};

// Run argv[0] (looked up in PATH) and wait for it.
// With `stdout_file` set, stdout is written to that file (created or truncated)
// instead of being captured. Fails only if the process could not be started.
[[nodiscard]] std::expected<ProcessResult, std::error_code>
run_process(const std::vector<std::string>& argv,
            const std::optional<std::filesystem::path>& stdout_file = std::nullopt);

} // namespace tandem::remote
