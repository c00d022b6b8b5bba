// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/remote/adb_executor.hpp>
#include <tandem/remote/process.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace tandem::remote {

namespace {

// exec failure in the child, or "command not found" from the device shell
constexpr int EXIT_NOT_RUNNABLE = 127;

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string join(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& a : argv) {
        if (!line.empty()) line += ' ';
        line += a;
    }
    return line;
}

} // namespace

AdbExecutor::AdbExecutor() = default;

AdbExecutor::AdbExecutor(Options options)
    : options_(std::move(options)) {
    if (options_.block_size == 0) {
        options_.block_size = core::DD_BLOCK_SIZE;
    }
}

std::vector<std::string> AdbExecutor::base_command() const {
    std::vector<std::string> argv{options_.adb_path};
    if (!options_.serial.empty()) {
        argv.emplace_back("-s");
        argv.push_back(options_.serial);
    }
    return argv;
}

std::vector<std::string> AdbExecutor::stat_command(std::string_view remote_path) const {
    auto argv = base_command();
    argv.emplace_back("shell");
    argv.push_back("stat -c %s " + quote_shell_path(remote_path));
    return argv;
}

std::vector<std::string> AdbExecutor::range_command(std::string_view remote_path,
                                                    std::uint64_t offset,
                                                    std::uint64_t length) const {
    // skip_bytes/count_bytes keep dd exact while still reading in large blocks
    auto argv = base_command();
    argv.emplace_back("exec-out");
    argv.push_back("dd if=" + quote_shell_path(remote_path)
                   + " bs=" + std::to_string(options_.block_size)
                   + " iflag=skip_bytes,count_bytes"
                   + " skip=" + std::to_string(offset)
                   + " count=" + std::to_string(length)
                   + " 2>/dev/null");
    return argv;
}

SizeResult AdbExecutor::stat_size(std::string_view remote_path) {
    auto argv = stat_command(remote_path);
    spdlog::debug("Executing: {}", join(argv));

    auto result = run_process(argv);
    if (!result) {
        return std::unexpected(RemoteFailure{
            make_error_code(core::TransferErrc::remote_error),
            "cannot run " + options_.adb_path + ": " + result.error().message()});
    }

    if (result->exit_code == EXIT_NOT_RUNNABLE) {
        return std::unexpected(RemoteFailure{
            make_error_code(core::TransferErrc::remote_error),
            "cannot run " + options_.adb_path + ": " + std::string(trim(result->error))});
    }

    auto out = trim(result->output);
    if (result->exit_code != 0 || out.empty()) {
        std::string detail(trim(result->error.empty() ? result->output : result->error));
        bool missing = detail.find("No such file") != std::string::npos
                    || (result->exit_code == 0 && out.empty());
        spdlog::warn("adb stat {} failed ({}): {}", remote_path, result->exit_code, detail);
        return std::unexpected(RemoteFailure{
            make_error_code(missing ? core::TransferErrc::remote_not_found
                                    : core::TransferErrc::remote_error),
            detail});
    }

    std::string digits(out);
    char* end = nullptr;
    unsigned long long val = std::strtoull(digits.c_str(), &end, 10);
    if (end != digits.c_str() + digits.size()) {
        return std::unexpected(RemoteFailure{
            make_error_code(core::TransferErrc::remote_error),
            "unexpected stat output: " + digits});
    }
    return static_cast<std::uint64_t>(val);
}

ReadResult AdbExecutor::range_read(std::string_view remote_path,
                                   std::uint64_t offset,
                                   std::uint64_t length,
                                   const std::filesystem::path& dest) {
    auto argv = range_command(remote_path, offset, length);
    spdlog::debug("Executing: {} > {}", join(argv), dest.string());

    auto result = run_process(argv, dest);
    if (!result) {
        std::error_code ec;
        std::filesystem::remove(dest, ec);
        return std::unexpected(RemoteFailure{
            make_error_code(core::TransferErrc::remote_error),
            "cannot run " + options_.adb_path + ": " + result.error().message()});
    }

    if (result->exit_code != 0) {
        std::error_code ec;
        std::filesystem::remove(dest, ec);
        std::string detail(trim(result->error));
        if (detail.empty()) {
            detail = "adb exited with status " + std::to_string(result->exit_code);
        }
        return std::unexpected(RemoteFailure{
            make_error_code(core::TransferErrc::remote_error), detail});
    }

    return verify_length(dest, length);
}

} // namespace tandem::remote
