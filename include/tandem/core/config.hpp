// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace tandem::core {

constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 50 * 1024 * 1024;      // 50 MiB
constexpr std::uint32_t DEFAULT_WORKER_COUNT = 4;                   // Parallel range reads per job
constexpr std::uint32_t MAX_WORKER_COUNT = 64;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t LOW_SPEED_TIMEOUT_SEC = 15;
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::uint32_t DD_BLOCK_SIZE = 4096;

constexpr std::size_t MERGE_BUFFER_SIZE = 256 * 1024;               // 256 KB
constexpr std::size_t WRITE_BUFFER_SIZE = 256 * 1024;               // 256 KB

constexpr std::string_view CHUNK_SUFFIX = ".chunk";

// Which remote transport the service talks to
enum class ExecutorKind : std::uint8_t {
    adb,   // Android device over adb shell
    curl   // Any libcurl URL that honours byte ranges
};

[[nodiscard]] std::string_view to_string(ExecutorKind kind) noexcept;
[[nodiscard]] std::expected<ExecutorKind, std::error_code> parse_executor_kind(std::string_view name) noexcept;

// Engine and service configuration
struct EngineConfig {
    std::uint64_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::uint32_t worker_count{DEFAULT_WORKER_COUNT};
    std::string downloads_dir{"downloads"};

    ExecutorKind executor{ExecutorKind::adb};
    std::string adb_path{"adb"};
    std::string adb_serial;                 // Empty: let adb pick the only device
    std::string base_url;                   // Prefix for remote paths (curl executor)
    std::uint32_t dd_block_size{DD_BLOCK_SIZE};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t low_speed_timeout_sec{LOW_SPEED_TIMEOUT_SEC};

    std::string log_level{"info"};

    // Check value ranges
    [[nodiscard]] std::error_code validate() const noexcept;

    // Parse a JSON document (unknown keys are ignored)
    [[nodiscard]] static std::expected<EngineConfig, std::error_code>
    parse(std::string_view json) noexcept;

    // Load from a JSON file
    [[nodiscard]] static std::expected<EngineConfig, std::error_code>
    load(std::string_view path) noexcept;
};

} // namespace tandem::core
