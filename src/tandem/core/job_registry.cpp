// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/core/job_registry.hpp>
#include <tandem/core/chunk.hpp>
#include <tandem/core/error.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

namespace tandem::core {

namespace {

constexpr std::string_view ID_ALPHABET = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr std::size_t ID_SUFFIX_LENGTH = 9;

} // namespace

JobRegistry::JobRegistry(std::shared_ptr<remote::RemoteExecutor> executor,
                         std::uint64_t chunk_size,
                         std::uint32_t worker_count)
    : executor_(std::move(executor))
    , chunk_size_(chunk_size)
    , worker_count_(worker_count)
    , rng_(std::random_device{}()) {}

JobRegistry::~JobRegistry() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, job] : jobs_) {
        if (!is_terminal(job->status())) {
            job->cancel();
        }
    }
    for (auto& job : retired_) {
        job->cancel();
    }
    // Job destructors join their threads
}

std::expected<std::shared_ptr<TransferJob>, std::error_code>
JobRegistry::create(std::string remote_path, std::filesystem::path local_path, std::int64_t total_size) {
    auto chunks = plan_chunks(total_size, chunk_size_, local_path);
    if (!chunks) {
        return std::unexpected(chunks.error());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    reap_locked();

    std::string id = generate_id_locked();
    auto job = std::make_shared<TransferJob>(id,
                                             std::move(remote_path),
                                             std::move(local_path),
                                             static_cast<std::uint64_t>(total_size),
                                             std::move(*chunks),
                                             executor_,
                                             worker_count_);
    jobs_.emplace(id, job);

    spdlog::info("Job {}: created for {} -> {}", id, job->remote_path(), job->local_path().string());
    return job;
}

std::expected<std::shared_ptr<TransferJob>, std::error_code>
JobRegistry::get(std::string_view id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::unexpected(make_error_code(TransferErrc::job_not_found));
    }
    return it->second;
}

std::vector<ProgressSnapshot> JobRegistry::list_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProgressSnapshot> out;
    out.reserve(jobs_.size());
    for (const auto& [id, job] : jobs_) {
        out.push_back(job->snapshot());
    }
    return out;
}

void JobRegistry::remove(std::string_view id) {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_locked();

    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return;
    }

    auto job = std::move(it->second);
    jobs_.erase(it);
    job->cancel();

    if (!job->idle()) {
        // Still draining a range read; destroy once its threads are done
        retired_.push_back(std::move(job));
    }
    spdlog::info("Job {}: removed", id);
}

std::size_t JobRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

std::size_t JobRegistry::retired_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retired_.size();
}

std::string JobRegistry::generate_id_locked() {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::uniform_int_distribution<std::size_t> dist(0, ID_ALPHABET.size() - 1);
    std::string id;
    do {
        id = "dl_" + std::to_string(ms) + "_";
        for (std::size_t i = 0; i < ID_SUFFIX_LENGTH; ++i) {
            id += ID_ALPHABET[dist(rng_)];
        }
    } while (jobs_.contains(id));

    return id;
}

void JobRegistry::reap_locked() {
    std::erase_if(retired_, [](const std::shared_ptr<TransferJob>& job) {
        return job->idle();
    });
}

} // namespace tandem::core
