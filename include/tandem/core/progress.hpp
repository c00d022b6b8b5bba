// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nlohmann/json_fwd.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tandem::core {

// Overall transfer state
enum class TransferStatus : std::uint8_t {
    pending,     // Created, not started
    downloading, // Workers are fetching chunks
    merging,     // All chunks fetched, concatenating
    completed,   // Destination file written
    error,       // A chunk fetch or the merge failed
    paused,      // Dispatch halted by request
    cancelled    // Cancelled by request, temporaries removed
};

[[nodiscard]] std::string_view to_string(TransferStatus status) noexcept;

// completed, error and cancelled never change again
[[nodiscard]] constexpr bool is_terminal(TransferStatus status) noexcept {
    return status == TransferStatus::completed
        || status == TransferStatus::error
        || status == TransferStatus::cancelled;
}

// Point-in-time view of one transfer. Built once, never modified.
struct ProgressSnapshot {
    std::string job_id;
    std::string file_name;
    TransferStatus status{TransferStatus::pending};
    std::uint64_t bytes_downloaded{0};
    std::uint64_t total_bytes{0};
    double percent{0.0};
    double speed_bps{0.0};
    std::string speed_formatted;
    std::uint64_t eta_seconds{0};
    std::string eta_formatted;
    std::uint32_t completed_chunks{0};
    std::uint32_t total_chunks{0};
    std::optional<std::string> error;
    std::string local_path;
};

// Wire format: {"jobId", "fileName", "status", "bytesDownloaded", ...}
void to_json(nlohmann::json& j, const ProgressSnapshot& snapshot);

// Byte counters, throughput and ETA for one transfer. Not synchronized;
// the owning job serializes access.
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressTracker(std::uint64_t total_bytes = 0) noexcept;

    // Mark the start of the downloading phase
    void start(Clock::time_point now = Clock::now()) noexcept;

    // Add the size of a completed chunk and refresh throughput
    void record(std::uint64_t bytes, Clock::time_point now = Clock::now()) noexcept;

    [[nodiscard]] std::uint64_t total_bytes() const noexcept { return total_bytes_; }
    [[nodiscard]] std::uint64_t bytes_downloaded() const noexcept { return bytes_downloaded_; }
    [[nodiscard]] std::uint64_t remaining() const noexcept;
    [[nodiscard]] bool started() const noexcept { return started_; }
    [[nodiscard]] Clock::time_point start_time() const noexcept { return start_time_; }

    // Bytes per second since start
    [[nodiscard]] double throughput() const noexcept { return throughput_; }

    // Percent complete, rounded to two decimals
    [[nodiscard]] double percent() const noexcept;

    // Seconds left at the current throughput, 0 while throughput is unknown
    [[nodiscard]] double eta() const noexcept;

private:
    std::uint64_t total_bytes_;
    std::uint64_t bytes_downloaded_{0};
    double throughput_{0.0};
    bool started_{false};
    Clock::time_point start_time_{};
};

// "512 B/s", "12.50 KB/s", "3.25 MB/s"
[[nodiscard]] std::string format_speed(double bytes_per_sec);

// "42s", "3m 7s", "2h 15m"
[[nodiscard]] std::string format_eta(double seconds);

// "0 B", "512 B", "1.5 MB", "2 GB"
[[nodiscard]] std::string format_bytes(std::uint64_t bytes);

// Round to two decimal places
[[nodiscard]] double round2(double value) noexcept;

} // namespace tandem::core
