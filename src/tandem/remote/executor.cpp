// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/remote/executor.hpp>

namespace tandem::remote {

std::string quote_shell_path(std::string_view path) {
    std::string out;
    out.reserve(path.size() + 2);
    out += '\'';
    for (char c : path) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

ReadResult verify_length(const std::filesystem::path& dest, std::uint64_t expected) {
    std::error_code ec;
    auto actual = std::filesystem::file_size(dest, ec);
    if (ec) {
        return std::unexpected(RemoteFailure{
            make_error_code(core::TransferErrc::remote_error),
            "no output produced: " + ec.message()});
    }

    if (actual != expected) {
        std::filesystem::remove(dest, ec);
        return std::unexpected(RemoteFailure{
            make_error_code(core::TransferErrc::short_read),
            "expected " + std::to_string(expected) + " bytes, got " + std::to_string(actual)});
    }
    return {};
}

} // namespace tandem::remote
