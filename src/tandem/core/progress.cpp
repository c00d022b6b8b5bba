// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/core/progress.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace tandem::core {

std::string_view to_string(TransferStatus status) noexcept {
    switch (status) {
        case TransferStatus::pending:     return "pending";
        case TransferStatus::downloading: return "downloading";
        case TransferStatus::merging:     return "merging";
        case TransferStatus::completed:   return "completed";
        case TransferStatus::error:       return "error";
        case TransferStatus::paused:      return "paused";
        case TransferStatus::cancelled:   return "cancelled";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const ProgressSnapshot& s) {
    j = nlohmann::json{
        {"jobId", s.job_id},
        {"fileName", s.file_name},
        {"status", std::string(to_string(s.status))},
        {"bytesDownloaded", s.bytes_downloaded},
        {"totalBytes", s.total_bytes},
        {"percent", s.percent},
        {"speed", s.speed_bps},
        {"speedFormatted", s.speed_formatted},
        {"eta", s.eta_seconds},
        {"etaFormatted", s.eta_formatted},
        {"completedChunks", s.completed_chunks},
        {"totalChunks", s.total_chunks},
        {"localPath", s.local_path},
    };
    if (s.error) {
        j["error"] = *s.error;
    } else {
        j["error"] = nullptr;
    }
}

//=============================================================================
// ProgressTracker
//=============================================================================

ProgressTracker::ProgressTracker(std::uint64_t total_bytes) noexcept
    : total_bytes_(total_bytes) {}

void ProgressTracker::start(Clock::time_point now) noexcept {
    start_time_ = now;
    started_ = true;
}

void ProgressTracker::record(std::uint64_t bytes, Clock::time_point now) noexcept {
    bytes_downloaded_ += bytes;

    if (!started_) return;

    // Keep the previous estimate when no time has passed
    const double elapsed = std::chrono::duration<double>(now - start_time_).count();
    if (elapsed > 0.0) {
        throughput_ = static_cast<double>(bytes_downloaded_) / elapsed;
    }
}

std::uint64_t ProgressTracker::remaining() const noexcept {
    return bytes_downloaded_ >= total_bytes_ ? 0 : total_bytes_ - bytes_downloaded_;
}

double ProgressTracker::percent() const noexcept {
    if (total_bytes_ == 0) return 0.0;
    return round2(static_cast<double>(bytes_downloaded_) / static_cast<double>(total_bytes_) * 100.0);
}

double ProgressTracker::eta() const noexcept {
    if (throughput_ <= 0.0) return 0.0;
    return static_cast<double>(remaining()) / throughput_;
}

//=============================================================================
// Formatting
//=============================================================================

double round2(double value) noexcept {
    return std::round(value * 100.0) / 100.0;
}

std::string format_speed(double bps) {
    constexpr double KB = 1024.0;
    constexpr double MB = 1024.0 * KB;

    std::ostringstream ss;
    if (bps >= MB) {
        ss << std::fixed << std::setprecision(2) << (bps / MB) << " MB/s";
    } else if (bps >= KB) {
        ss << std::fixed << std::setprecision(2) << (bps / KB) << " KB/s";
    } else {
        ss << static_cast<std::int64_t>(std::llround(bps)) << " B/s";
    }
    return ss.str();
}

std::string format_eta(double seconds) {
    if (seconds < 60.0) {
        return std::to_string(std::llround(seconds)) + "s";
    }
    if (seconds < 3600.0) {
        auto minutes = static_cast<std::int64_t>(std::floor(seconds / 60.0));
        auto secs = std::llround(std::fmod(seconds, 60.0));
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    auto hours = static_cast<std::int64_t>(std::floor(seconds / 3600.0));
    auto minutes = static_cast<std::int64_t>(std::floor(std::fmod(seconds, 3600.0) / 60.0));
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
}

std::string format_bytes(std::uint64_t bytes) {
    static constexpr const char* UNITS[] = {"B", "KB", "MB", "GB", "TB"};

    if (bytes == 0) return "0 B";

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(UNITS)) {
        value /= 1024.0;
        ++unit;
    }

    const double rounded = std::round(value * 10.0) / 10.0;
    std::ostringstream ss;
    if (rounded == std::floor(rounded)) {
        ss << static_cast<std::uint64_t>(rounded);
    } else {
        ss << std::fixed << std::setprecision(1) << rounded;
    }
    ss << ' ' << UNITS[unit];
    return ss.str();
}

} // namespace tandem::core
