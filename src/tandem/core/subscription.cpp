// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/core/subscription.hpp>

namespace tandem::core {

void ProgressSubscription::push(const ProgressSnapshot& snapshot) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || ended_) return;
        queue_.push_back(snapshot);
        if (is_terminal(snapshot.status)) {
            ended_ = true;
        }
    }
    cv_.notify_all();
}

std::optional<ProgressSnapshot> ProgressSubscription::pop_locked() {
    if (queue_.empty()) return std::nullopt;
    ProgressSnapshot s = std::move(queue_.front());
    queue_.pop_front();
    return s;
}

std::optional<ProgressSnapshot> ProgressSubscription::next() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty() || ended_ || closed_; });
    if (closed_) return std::nullopt;
    return pop_locked();
}

std::optional<ProgressSnapshot> ProgressSubscription::next_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || ended_ || closed_; });
    if (closed_) return std::nullopt;
    return pop_locked();
}

std::optional<ProgressSnapshot> ProgressSubscription::try_next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return std::nullopt;
    return pop_locked();
}

void ProgressSubscription::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        queue_.clear();
    }
    cv_.notify_all();
}

bool ProgressSubscription::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ || (ended_ && queue_.empty());
}

bool ProgressSubscription::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace tandem::core
