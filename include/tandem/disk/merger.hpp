// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tandem/disk/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace tandem::disk {

// Why a merge stopped
struct MergeError {
    std::error_code code;
    std::size_t part{0};        // Position in `parts` being appended
    std::string message;
};

// Append `parts` to `dest` strictly in the given order, deleting each part
// right after it has been appended. `should_abort` is polled before each part;
// an abort deletes the partial `dest`. On any other failure the partial `dest`
// and the parts not yet appended are left in place.
// Returns the number of bytes written.
[[nodiscard]] std::expected<std::uint64_t, MergeError>
merge_parts(const std::filesystem::path& dest,
            const std::vector<std::filesystem::path>& parts,
            const std::function<bool()>& should_abort = {});

} // namespace tandem::disk
