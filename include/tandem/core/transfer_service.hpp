// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tandem/core/config.hpp>
#include <tandem/core/job_registry.hpp>
#include <tandem/core/progress.hpp>
#include <tandem/core/subscription.hpp>
#include <tandem/remote/executor.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tandem::core {

// Reply to start_remote
struct StartedTransfer {
    std::string job_id;
    std::string file_name;
    std::uint64_t file_size{0};
    std::string file_size_formatted;
};

// A finished download ready to hand out
struct CompletedFile {
    std::filesystem::path path;
    std::string download_name;
    std::uint64_t size{0};
};

// Front door of the engine: start, observe and control transfers
class TransferService {
public:
    TransferService(EngineConfig config, std::shared_ptr<remote::RemoteExecutor> executor);

    // Service with the executor named in `config`
    [[nodiscard]] static std::expected<std::unique_ptr<TransferService>, std::error_code>
    create(EngineConfig config);

    TransferService(const TransferService&) = delete;
    TransferService& operator=(const TransferService&) = delete;

    // Start a transfer whose size is already known. Returns the job id.
    [[nodiscard]] std::expected<std::string, std::error_code>
    start_job(std::string remote_path, const std::filesystem::path& local_path, std::int64_t total_size);

    // Stat the remote file, then download it into the downloads directory
    [[nodiscard]] std::expected<StartedTransfer, std::error_code>
    start_remote(std::string_view remote_path);

    // Progress stream; ends after a completed, error or cancelled snapshot
    [[nodiscard]] std::expected<std::shared_ptr<ProgressSubscription>, std::error_code>
    subscribe(std::string_view job_id);

    [[nodiscard]] std::vector<ProgressSnapshot> list_jobs() const;

    // Cancel and forget a job. Unknown ids are ignored.
    void cancel_job(std::string_view job_id);

    [[nodiscard]] std::error_code pause_job(std::string_view job_id);
    [[nodiscard]] std::error_code resume_job(std::string_view job_id);

    // not_ready unless the job completed
    [[nodiscard]] std::expected<CompletedFile, std::error_code>
    fetch_completed_file(std::string_view job_id) const;

    // Block until the job's workers are idle and return its last snapshot
    [[nodiscard]] std::expected<ProgressSnapshot, std::error_code> wait(std::string_view job_id);

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] remote::RemoteExecutor& executor() noexcept { return *executor_; }

private:
    EngineConfig config_;
    std::shared_ptr<remote::RemoteExecutor> executor_;
    JobRegistry registry_;
};

// Executor described by `config`, or null for an unknown executor kind
[[nodiscard]] std::shared_ptr<remote::RemoteExecutor> make_executor(const EngineConfig& config);

// Replace characters that are not allowed in file names (<>:"/\|?*) with '_'
[[nodiscard]] std::string sanitize_file_name(std::string_view name);

} // namespace tandem::core
