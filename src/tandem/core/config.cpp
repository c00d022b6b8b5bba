// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/core/config.hpp>
#include <tandem/core/error.hpp>
#include <tandem/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace tandem::core {

namespace {

template<typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

} // namespace

std::string_view to_string(ExecutorKind kind) noexcept {
    switch (kind) {
        case ExecutorKind::adb:  return "adb";
        case ExecutorKind::curl: return "curl";
    }
    return "unknown";
}

std::expected<ExecutorKind, std::error_code> parse_executor_kind(std::string_view name) noexcept {
    if (name == "adb") return ExecutorKind::adb;
    if (name == "curl") return ExecutorKind::curl;
    return std::unexpected(make_error_code(TransferErrc::invalid_config));
}

std::error_code EngineConfig::validate() const noexcept {
    if (chunk_size == 0) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (worker_count == 0 || worker_count > MAX_WORKER_COUNT) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (dd_block_size == 0) {
        return make_error_code(TransferErrc::invalid_config);
    }
    if (executor == ExecutorKind::curl && base_url.empty()) {
        return make_error_code(TransferErrc::invalid_config);
    }
    return {};
}

std::expected<EngineConfig, std::error_code>
EngineConfig::parse(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(TransferErrc::invalid_config));
        }

        EngineConfig cfg;
        read_key(j, "chunkSize", cfg.chunk_size);
        read_key(j, "workerCount", cfg.worker_count);
        read_key(j, "downloadsDir", cfg.downloads_dir);
        read_key(j, "adbPath", cfg.adb_path);
        read_key(j, "adbSerial", cfg.adb_serial);
        read_key(j, "baseUrl", cfg.base_url);
        read_key(j, "ddBlockSize", cfg.dd_block_size);
        read_key(j, "connectTimeoutSec", cfg.connect_timeout_sec);
        read_key(j, "lowSpeedTimeoutSec", cfg.low_speed_timeout_sec);
        read_key(j, "logLevel", cfg.log_level);

        if (j.contains("executor")) {
            auto kind = parse_executor_kind(j["executor"].get<std::string>());
            if (!kind) {
                return std::unexpected(kind.error());
            }
            cfg.executor = *kind;
        }

        if (auto ec = cfg.validate()) {
            return std::unexpected(ec);
        }
        return cfg;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Config rejected: {}", e.what());
        return std::unexpected(make_error_code(TransferErrc::invalid_config));
    }
}

std::expected<EngineConfig, std::error_code>
EngineConfig::load(std::string_view path) noexcept {
    std::ifstream file{std::string(path)};
    if (!file) {
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

} // namespace tandem::core
