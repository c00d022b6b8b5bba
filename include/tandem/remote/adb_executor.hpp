// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tandem/remote/executor.hpp>
#include <tandem/core/config.hpp>
#include <string>
#include <vector>

namespace tandem::remote {

// Reads files from an Android device through the adb binary.
// Sizes come from `stat -c %s`, ranges from `dd` streamed over exec-out.
class AdbExecutor final : public RemoteExecutor {
public:
    struct Options {
        std::string adb_path{"adb"};
        std::string serial;                         // adb -s <serial>, empty for default device
        std::uint32_t block_size{core::DD_BLOCK_SIZE};
    };

    AdbExecutor();
    explicit AdbExecutor(Options options);

    [[nodiscard]] SizeResult stat_size(std::string_view remote_path) override;

    [[nodiscard]] ReadResult range_read(std::string_view remote_path,
                                        std::uint64_t offset,
                                        std::uint64_t length,
                                        const std::filesystem::path& dest) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "adb"; }

    // Command lines, exposed for inspection
    [[nodiscard]] std::vector<std::string> stat_command(std::string_view remote_path) const;
    [[nodiscard]] std::vector<std::string> range_command(std::string_view remote_path,
                                                         std::uint64_t offset,
                                                         std::uint64_t length) const;

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::vector<std::string> base_command() const;

    Options options_;
};

} // namespace tandem::remote
