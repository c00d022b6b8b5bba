// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tandem/core/config.hpp>
#include <tandem/core/transfer_service.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tandem::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> remote_paths;
    std::string config_file;
    std::optional<std::string> executor;
    std::optional<std::string> base_url;
    std::optional<std::string> serial;
    std::optional<std::string> output_dir;
    std::uint32_t workers{0};           // 0: keep configured value
    std::uint64_t chunk_mib{0};         // 0: keep configured value
    bool info_only{false};
    bool json{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::vector<std::string> errors;    // Unknown options, missing values
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Config file (if any) with command line overrides applied, validated
[[nodiscard]] std::expected<core::EngineConfig, std::error_code> build_config(const CliArgs& args);

// Transfer every path concurrently; 0 iff all completed
[[nodiscard]] CliResult download(core::TransferService& service,
                                 const std::vector<std::string>& remote_paths,
                                 bool json,
                                 bool quiet);

// Print remote file sizes without downloading
[[nodiscard]] CliResult info(core::TransferService& service, const std::vector<std::string>& remote_paths);

// Show help message
void print_help(std::string_view program_name);

// Show version information
void print_version();

} // namespace tandem::cli
