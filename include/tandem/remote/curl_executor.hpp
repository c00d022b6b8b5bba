// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tandem/remote/executor.hpp>
#include <tandem/core/config.hpp>
#include <string>

namespace tandem::remote {

// Range reads through libcurl against `base_url + remote_path`.
// Works with any scheme libcurl can range over (http, https, ftp, sftp, file).
class CurlExecutor final : public RemoteExecutor {
public:
    struct Options {
        std::string base_url;
        std::uint32_t connect_timeout_sec{core::CONNECTION_TIMEOUT_SEC};
        std::uint32_t low_speed_timeout_sec{core::LOW_SPEED_TIMEOUT_SEC};
    };

    explicit CurlExecutor(Options options);

    [[nodiscard]] SizeResult stat_size(std::string_view remote_path) override;

    [[nodiscard]] ReadResult range_read(std::string_view remote_path,
                                        std::uint64_t offset,
                                        std::uint64_t length,
                                        const std::filesystem::path& dest) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "curl"; }

    // Full URL for a remote path; path segments are percent-encoded, '/' is kept
    [[nodiscard]] std::string url_for(std::string_view remote_path) const;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    Options options_;
};

} // namespace tandem::remote
