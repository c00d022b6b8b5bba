// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/core/transfer_job.hpp>
#include <tandem/core/chunk_fetcher.hpp>
#include <tandem/disk/merger.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace tandem::core {

TransferJob::TransferJob(std::string id,
                         std::string remote_path,
                         std::filesystem::path local_path,
                         std::uint64_t total_size,
                         std::vector<Chunk> chunks,
                         std::shared_ptr<remote::RemoteExecutor> executor,
                         std::uint32_t worker_count)
    : id_(std::move(id))
    , remote_path_(std::move(remote_path))
    , local_path_(std::move(local_path))
    , total_size_(total_size)
    , worker_count_(std::max<std::uint32_t>(1, worker_count))
    , executor_(std::move(executor))
    , chunks_(std::move(chunks))
    , tracker_(total_size) {
    for (std::size_t i = 0; i < chunks_.size(); ++i) {
        queue_.push_back(i);
    }
}

TransferJob::~TransferJob() {
    // Stop dispatching and wait for in-flight reads before members go away
    if (coordinator_.joinable()) {
        coordinator_.request_stop();
        coordinator_.join();
    }
}

std::error_code TransferJob::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != TransferStatus::pending) {
        return make_error_code(TransferErrc::invalid_state);
    }

    status_ = TransferStatus::downloading;
    tracker_.start();
    running_ = true;
    broadcast_locked();

    spdlog::info("Job {}: downloading {} ({} bytes, {} chunks, {} workers)",
                 id_, remote_path_, total_size_, chunks_.size(), worker_count_);

    coordinator_ = std::jthread([this](std::stop_token stoken) {
        run(stoken);
    });
    return {};
}

std::error_code TransferJob::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != TransferStatus::downloading) {
        return make_error_code(TransferErrc::invalid_state);
    }

    status_ = TransferStatus::paused;
    broadcast_locked();
    spdlog::info("Job {}: paused with {} chunks queued", id_, queue_.size());
    return {};
}

std::error_code TransferJob::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != TransferStatus::paused) {
        return make_error_code(TransferErrc::invalid_state);
    }

    status_ = TransferStatus::downloading;
    broadcast_locked();
    spdlog::info("Job {}: resumed with {} chunks queued", id_, queue_.size());

    // A coordinator still draining in-flight reads picks the queue up again by
    // itself; otherwise start a fresh one. The old thread touches no job state
    // after clearing running_, so joining it here cannot deadlock.
    if (!running_) {
        if (coordinator_.joinable()) {
            coordinator_.join();
        }
        running_ = true;
        coordinator_ = std::jthread([this](std::stop_token stoken) {
            run(stoken);
        });
    }
    return {};
}

void TransferJob::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (status_ == TransferStatus::completed || status_ == TransferStatus::cancelled) {
        return;
    }

    queue_.clear();
    cleanup_requested_ = true;
    remove_temp_files_locked();

    if (status_ == TransferStatus::error) {
        spdlog::info("Job {}: removed temporaries of failed transfer", id_);
        return;
    }

    status_ = TransferStatus::cancelled;
    broadcast_locked();
    spdlog::info("Job {}: cancelled", id_);
}

ProgressSnapshot TransferJob::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_locked();
}

std::shared_ptr<ProgressSubscription> TransferJob::subscribe() {
    auto sub = std::make_shared<ProgressSubscription>();

    std::lock_guard<std::mutex> lock(mutex_);
    sub->push(snapshot_locked());
    if (!is_terminal(status_)) {
        subscribers_.push_back(sub);
    }
    return sub;
}

ProgressSnapshot TransferJob::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    settled_cv_.wait(lock, [this] { return !running_; });
    return snapshot_locked();
}

std::optional<ProgressSnapshot> TransferJob::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!settled_cv_.wait_for(lock, timeout, [this] { return !running_; })) {
        return std::nullopt;
    }
    return snapshot_locked();
}

bool TransferJob::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !running_;
}

std::string TransferJob::file_name() const {
    auto slash = remote_path_.find_last_of('/');
    return slash == std::string::npos ? remote_path_ : remote_path_.substr(slash + 1);
}

TransferStatus TransferJob::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::optional<std::string> TransferJob::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::vector<Chunk> TransferJob::chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_;
}

//=============================================================================
// Worker pool
//=============================================================================

void TransferJob::run(std::stop_token stoken) {
    while (true) {
        std::size_t worker_total = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            worker_total = std::min<std::size_t>(worker_count_, queue_.size());
        }

        {
            std::vector<std::jthread> workers;
            workers.reserve(worker_total);
            for (std::size_t i = 0; i < worker_total; ++i) {
                workers.emplace_back([this, stoken] { worker_loop(stoken); });
            }
        } // Joined here

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (status_ == TransferStatus::downloading && !stoken.stop_requested()) {
                if (completed_chunks_ == chunks_.size()) {
                    status_ = TransferStatus::merging;
                    broadcast_locked();
                    break;
                }
                if (!queue_.empty()) {
                    continue;   // Resumed while the previous round was draining
                }
            }
            // Cleared under the same lock as the status check, so a resume()
            // from here on sees no coordinator and starts a new one
            running_ = false;
        }
        settled_cv_.notify_all();
        return;
    }

    merge();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    settled_cv_.notify_all();
}

void TransferJob::worker_loop(std::stop_token stoken) {
    ChunkFetcher fetcher(*executor_, remote_path_);

    while (true) {
        std::size_t idx = 0;
        Chunk chunk;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (status_ != TransferStatus::downloading || stoken.stop_requested() || queue_.empty()) {
                return;
            }
            idx = queue_.front();
            queue_.pop_front();
            chunks_[idx].state = ChunkState::downloading;
            chunk = chunks_[idx];
        }

        auto result = fetcher.fetch(chunk);

        std::lock_guard<std::mutex> lock(mutex_);

        if (cleanup_requested_) {
            // Cancel already swept the temporaries; this one finished late
            std::error_code ec;
            std::filesystem::remove(chunk.temp_path, ec);
            chunks_[idx].state = result ? ChunkState::completed : ChunkState::error;
            return;
        }

        if (result) {
            chunks_[idx].state = ChunkState::completed;
            ++completed_chunks_;
            tracker_.record(chunk.size);
            spdlog::debug("Job {}: chunk {} done ({}/{})", id_, idx, completed_chunks_, chunks_.size());
            if (!is_terminal(status_)) {
                broadcast_locked();
            }
            continue;
        }

        chunks_[idx].state = ChunkState::error;
        spdlog::warn("Job {}: {}", id_, result.error().message);
        if (!is_terminal(status_)) {
            error_ = result.error().message;
            status_ = TransferStatus::error;
            broadcast_locked();
        }
        return;
    }
}

//=============================================================================
// Merge
//=============================================================================

void TransferJob::merge() {
    std::vector<std::filesystem::path> parts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        parts.reserve(chunks_.size());
        for (const auto& c : chunks_) {   // chunks_ is in index order
            parts.push_back(c.temp_path);
        }
    }

    spdlog::info("Job {}: merging {} chunks into {}", id_, parts.size(), local_path_.string());

    auto result = disk::merge_parts(local_path_, parts, [this] {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_ == TransferStatus::cancelled;
    });

    std::lock_guard<std::mutex> lock(mutex_);

    if (status_ == TransferStatus::cancelled) {
        std::error_code ec;
        std::filesystem::remove(local_path_, ec);
        return;
    }

    if (!result) {
        // Partial output and remaining chunk files stay for inspection
        error_ = "Merge failed: " + result.error().message;
        status_ = TransferStatus::error;
        spdlog::warn("Job {}: {}", id_, *error_);
        broadcast_locked();
        return;
    }

    status_ = TransferStatus::completed;
    broadcast_locked();
    spdlog::info("Job {}: completed {} ({} bytes)", id_, local_path_.string(), *result);
}

//=============================================================================
// Snapshots
//=============================================================================

ProgressSnapshot TransferJob::snapshot_locked() const {
    ProgressSnapshot s;
    s.job_id = id_;
    s.file_name = file_name();
    s.status = status_;
    s.bytes_downloaded = tracker_.bytes_downloaded();
    s.total_bytes = total_size_;
    s.percent = tracker_.percent();
    s.speed_bps = tracker_.throughput();
    s.speed_formatted = format_speed(s.speed_bps);
    const double eta = tracker_.eta();
    s.eta_seconds = static_cast<std::uint64_t>(std::llround(eta));
    s.eta_formatted = format_eta(eta);
    s.completed_chunks = completed_chunks_;
    s.total_chunks = static_cast<std::uint32_t>(chunks_.size());
    s.error = error_;
    s.local_path = local_path_.string();
    return s;
}

void TransferJob::broadcast_locked() {
    if (subscribers_.empty()) return;

    const ProgressSnapshot snap = snapshot_locked();
    std::erase_if(subscribers_, [&snap](const std::weak_ptr<ProgressSubscription>& weak) {
        auto sub = weak.lock();
        if (!sub || sub->closed()) return true;
        sub->push(snap);
        return false;
    });
}

void TransferJob::remove_temp_files_locked() noexcept {
    for (const auto& c : chunks_) {
        std::error_code ec;
        std::filesystem::remove(c.temp_path, ec);
        if (ec) {
            spdlog::warn("Job {}: could not remove {}: {}", id_, c.temp_path.string(), ec.message());
        }
    }
}

} // namespace tandem::core
