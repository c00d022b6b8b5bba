// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tandem/core/chunk.hpp>
#include <tandem/core/error.hpp>
#include <tandem/core/progress.hpp>
#include <tandem/core/subscription.hpp>
#include <tandem/remote/executor.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace tandem::core {

// One end-to-end transfer of a remote file.
//
// start() launches a coordinator thread that runs up to `worker_count` worker
// threads. Workers pull chunk indices from a shared FIFO while the job is
// downloading, so at most `worker_count` range reads are in flight. Once the
// queue drains with every chunk completed, the coordinator merges the chunk
// files in index order. Pause and cancel only stop new dispatches; a range
// read that is already running is allowed to finish.
class TransferJob {
public:
    TransferJob(std::string id,
                std::string remote_path,
                std::filesystem::path local_path,
                std::uint64_t total_size,
                std::vector<Chunk> chunks,
                std::shared_ptr<remote::RemoteExecutor> executor,
                std::uint32_t worker_count);
    ~TransferJob();

    // Non-copyable, non-movable (threads hold `this`)
    TransferJob(const TransferJob&) = delete;
    TransferJob& operator=(const TransferJob&) = delete;
    TransferJob(TransferJob&&) = delete;
    TransferJob& operator=(TransferJob&&) = delete;

    // pending -> downloading
    [[nodiscard]] std::error_code start();

    // downloading -> paused
    [[nodiscard]] std::error_code pause();

    // paused -> downloading
    [[nodiscard]] std::error_code resume();

    // Non-terminal -> cancelled, deleting every chunk temporary. On a job that
    // ended in error only the temporaries are deleted. Idempotent.
    void cancel();

    // Current progress
    [[nodiscard]] ProgressSnapshot snapshot() const;

    // Attach a subscriber; it receives the current snapshot first
    [[nodiscard]] std::shared_ptr<ProgressSubscription> subscribe();

    // Block until no worker is running (terminal, paused or never started)
    ProgressSnapshot wait();
    [[nodiscard]] std::optional<ProgressSnapshot> wait_for(std::chrono::milliseconds timeout);

    // No coordinator or worker thread is running
    [[nodiscard]] bool idle() const;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& remote_path() const noexcept { return remote_path_; }
    [[nodiscard]] const std::filesystem::path& local_path() const noexcept { return local_path_; }
    [[nodiscard]] std::uint64_t total_size() const noexcept { return total_size_; }
    [[nodiscard]] std::uint32_t worker_count() const noexcept { return worker_count_; }
    [[nodiscard]] std::string file_name() const;

    [[nodiscard]] TransferStatus status() const;
    [[nodiscard]] std::optional<std::string> error() const;

    // Copy of the chunk table
    [[nodiscard]] std::vector<Chunk> chunks() const;

private:
    // Coordinator: run worker rounds, then merge
    void run(std::stop_token stoken);

    // Pull and fetch chunks until the queue is empty or the job stops downloading
    void worker_loop(std::stop_token stoken);

    // Concatenate chunk files into the destination
    void merge();

    [[nodiscard]] ProgressSnapshot snapshot_locked() const;
    void broadcast_locked();
    void remove_temp_files_locked() noexcept;

    const std::string id_;
    const std::string remote_path_;
    const std::filesystem::path local_path_;
    const std::uint64_t total_size_;
    const std::uint32_t worker_count_;
    std::shared_ptr<remote::RemoteExecutor> executor_;

    mutable std::mutex mutex_;                  // Guards everything below
    std::condition_variable settled_cv_;
    TransferStatus status_{TransferStatus::pending};
    std::vector<Chunk> chunks_;
    std::deque<std::size_t> queue_;             // Indices of chunks not yet dispatched
    std::uint32_t completed_chunks_{0};
    ProgressTracker tracker_;
    std::optional<std::string> error_;
    bool running_{false};
    bool cleanup_requested_{false};             // Set by cancel(); late fetches delete their output
    std::vector<std::weak_ptr<ProgressSubscription>> subscribers_;

    std::jthread coordinator_;                  // Last: joined before the rest is destroyed
};

} // namespace tandem::core
