// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tandem/core/progress.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace tandem::core {

// Receiving end of a job's progress broadcast.
// The job pushes without ever waiting on the reader; the queue is unbounded.
// The stream ends after a completed, error or cancelled snapshot.
class ProgressSubscription {
public:
    ProgressSubscription() = default;

    ProgressSubscription(const ProgressSubscription&) = delete;
    ProgressSubscription& operator=(const ProgressSubscription&) = delete;

    // Block until the next snapshot; nullopt once the stream is over
    [[nodiscard]] std::optional<ProgressSnapshot> next();

    // Like next(), giving up after `timeout`
    [[nodiscard]] std::optional<ProgressSnapshot> next_for(std::chrono::milliseconds timeout);

    // Non-blocking
    [[nodiscard]] std::optional<ProgressSnapshot> try_next();

    // Stop receiving; pending snapshots are dropped
    void close() noexcept;

    // True when nothing more will be delivered
    [[nodiscard]] bool finished() const;

    // Deliver a snapshot (called by the job)
    void push(const ProgressSnapshot& snapshot);

    [[nodiscard]] bool closed() const;

private:
    [[nodiscard]] std::optional<ProgressSnapshot> pop_locked();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressSnapshot> queue_;
    bool ended_{false};     // Terminal snapshot received
    bool closed_{false};    // Reader detached
};

} // namespace tandem::core
