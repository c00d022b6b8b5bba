// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/core/transfer_service.hpp>
#include <tandem/core/error.hpp>
#include <tandem/remote/adb_executor.hpp>
#include <tandem/remote/curl_executor.hpp>
#include <spdlog/spdlog.h>

namespace tandem::core {

namespace {

constexpr std::string_view FORBIDDEN_CHARS = "<>:\"/\\|?*";

std::string base_name(std::string_view remote_path) {
    auto slash = remote_path.find_last_of('/');
    return std::string(slash == std::string_view::npos ? remote_path : remote_path.substr(slash + 1));
}

} // namespace

std::shared_ptr<remote::RemoteExecutor> make_executor(const EngineConfig& config) {
    switch (config.executor) {
        case ExecutorKind::curl:
            return std::make_shared<remote::CurlExecutor>(remote::CurlExecutor::Options{
                config.base_url,
                config.connect_timeout_sec,
                config.low_speed_timeout_sec});
        case ExecutorKind::adb:
            return std::make_shared<remote::AdbExecutor>(remote::AdbExecutor::Options{
                config.adb_path,
                config.adb_serial,
                config.dd_block_size});
    }
    return nullptr;
}

std::string sanitize_file_name(std::string_view name) {
    std::string out(name);
    for (char& c : out) {
        if (FORBIDDEN_CHARS.find(c) != std::string_view::npos) {
            c = '_';
        }
    }
    return out;
}

TransferService::TransferService(EngineConfig config, std::shared_ptr<remote::RemoteExecutor> executor)
    : config_(std::move(config))
    , executor_(std::move(executor))
    , registry_(executor_, config_.chunk_size, config_.worker_count) {}

std::expected<std::unique_ptr<TransferService>, std::error_code>
TransferService::create(EngineConfig config) {
    if (auto ec = config.validate()) {
        return std::unexpected(ec);
    }
    auto executor = make_executor(config);
    if (!executor) {
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    }
    return std::make_unique<TransferService>(std::move(config), std::move(executor));
}

std::expected<std::string, std::error_code>
TransferService::start_job(std::string remote_path, const std::filesystem::path& local_path, std::int64_t total_size) {
    if (total_size <= 0) {
        return std::unexpected(make_error_code(TransferErrc::invalid_size));
    }

    if (local_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(local_path.parent_path(), ec);
        if (ec) {
            spdlog::warn("Cannot create {}: {}", local_path.parent_path().string(), ec.message());
            return std::unexpected(ec);
        }
    }

    auto job = registry_.create(std::move(remote_path), local_path, total_size);
    if (!job) {
        return std::unexpected(job.error());
    }

    if (auto ec = (*job)->start()) {
        registry_.remove((*job)->id());
        return std::unexpected(ec);
    }
    return (*job)->id();
}

std::expected<StartedTransfer, std::error_code>
TransferService::start_remote(std::string_view remote_path) {
    auto size = executor_->stat_size(remote_path);
    if (!size) {
        spdlog::warn("Cannot stat {}: {}", remote_path, size.error().detail);
        return std::unexpected(size.error().code);
    }

    std::string name = sanitize_file_name(base_name(remote_path));
    if (name.empty()) {
        name = "download";
    }
    const auto local_path = std::filesystem::path(config_.downloads_dir) / name;

    auto id = start_job(std::string(remote_path), local_path, static_cast<std::int64_t>(*size));
    if (!id) {
        return std::unexpected(id.error());
    }

    return StartedTransfer{std::move(*id), name, *size, format_bytes(*size)};
}

std::expected<std::shared_ptr<ProgressSubscription>, std::error_code>
TransferService::subscribe(std::string_view job_id) {
    auto job = registry_.get(job_id);
    if (!job) {
        return std::unexpected(job.error());
    }
    return (*job)->subscribe();
}

std::vector<ProgressSnapshot> TransferService::list_jobs() const {
    return registry_.list_all();
}

void TransferService::cancel_job(std::string_view job_id) {
    registry_.remove(job_id);
}

std::error_code TransferService::pause_job(std::string_view job_id) {
    auto job = registry_.get(job_id);
    if (!job) {
        return job.error();
    }
    return (*job)->pause();
}

std::error_code TransferService::resume_job(std::string_view job_id) {
    auto job = registry_.get(job_id);
    if (!job) {
        return job.error();
    }
    return (*job)->resume();
}

std::expected<CompletedFile, std::error_code>
TransferService::fetch_completed_file(std::string_view job_id) const {
    auto job = registry_.get(job_id);
    if (!job) {
        return std::unexpected(job.error());
    }
    if ((*job)->status() != TransferStatus::completed) {
        return std::unexpected(make_error_code(TransferErrc::not_ready));
    }

    std::error_code ec;
    auto size = std::filesystem::file_size((*job)->local_path(), ec);
    if (ec) {
        return std::unexpected(ec);
    }
    return CompletedFile{(*job)->local_path(), (*job)->file_name(), size};
}

std::expected<ProgressSnapshot, std::error_code> TransferService::wait(std::string_view job_id) {
    auto job = registry_.get(job_id);
    if (!job) {
        return std::unexpected(job.error());
    }
    return (*job)->wait();
}

} // namespace tandem::core
