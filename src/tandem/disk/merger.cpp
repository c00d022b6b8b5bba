// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/disk/merger.hpp>
#include <tandem/core/config.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace tandem::disk {

namespace {

std::unexpected<MergeError> fail(DiskErrc code, std::size_t part, std::string message) {
    return std::unexpected(MergeError{make_error_code(code), part, std::move(message)});
}

} // namespace

std::expected<std::uint64_t, MergeError>
merge_parts(const std::filesystem::path& dest,
            const std::vector<std::filesystem::path>& parts,
            const std::function<bool()>& should_abort) {
    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) {
        return fail(DiskErrc::open_failed, 0, "cannot open " + dest.string() + " for writing");
    }

    std::vector<char> buffer(core::MERGE_BUFFER_SIZE);
    std::uint64_t total = 0;

    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (should_abort && should_abort()) {
            out.close();
            std::error_code ec;
            std::filesystem::remove(dest, ec);
            return fail(DiskErrc::aborted, i, "merge aborted");
        }

        const auto& part = parts[i];
        std::ifstream in(part, std::ios::binary);
        if (!in) {
            std::error_code ec;
            bool missing = !std::filesystem::exists(part, ec);
            return fail(missing ? DiskErrc::file_not_found : DiskErrc::open_failed, i,
                        (missing ? "missing " : "cannot open ") + part.string());
        }

        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize n = in.gcount();
            if (n <= 0) break;

            out.write(buffer.data(), n);
            if (!out) {
                return fail(DiskErrc::write_error, i, "write to " + dest.string() + " failed");
            }
            total += static_cast<std::uint64_t>(n);
        }

        if (in.bad()) {
            return fail(DiskErrc::read_error, i, "read from " + part.string() + " failed");
        }
        in.close();

        std::error_code ec;
        if (!std::filesystem::remove(part, ec) && ec) {
            spdlog::warn("Could not remove {}: {}", part.string(), ec.message());
        }
    }

    out.flush();
    out.close();
    if (!out) {
        return fail(DiskErrc::write_error, parts.size(), "closing " + dest.string() + " failed");
    }

    return total;
}

} // namespace tandem::disk
