// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tandem/core/progress.hpp>
#include <tandem/core/transfer_job.hpp>
#include <tandem/remote/executor.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tandem::core {

// Table of live transfer jobs keyed by id.
// Jobs stay until removed; nothing expires on its own.
class JobRegistry {
public:
    JobRegistry(std::shared_ptr<remote::RemoteExecutor> executor,
                std::uint64_t chunk_size,
                std::uint32_t worker_count);

    // Cancels every job that has not finished
    ~JobRegistry();

    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    // Plan chunks and store a pending job under a fresh id
    [[nodiscard]] std::expected<std::shared_ptr<TransferJob>, std::error_code>
    create(std::string remote_path, std::filesystem::path local_path, std::int64_t total_size);

    [[nodiscard]] std::expected<std::shared_ptr<TransferJob>, std::error_code>
    get(std::string_view id) const;

    // Snapshot of every job, ordered by id
    [[nodiscard]] std::vector<ProgressSnapshot> list_all() const;

    // Cancel the job, delete its temporaries and drop it. Unknown ids are ignored.
    // Never waits for in-flight range reads.
    void remove(std::string_view id);

    [[nodiscard]] std::size_t size() const;

    // Removed jobs whose threads have not finished yet
    [[nodiscard]] std::size_t retired_count() const;

private:
    [[nodiscard]] std::string generate_id_locked();
    void reap_locked();

    std::shared_ptr<remote::RemoteExecutor> executor_;
    const std::uint64_t chunk_size_;
    const std::uint32_t worker_count_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<TransferJob>, std::less<>> jobs_;
    std::vector<std::shared_ptr<TransferJob>> retired_;
    std::mt19937_64 rng_;
};

} // namespace tandem::core
