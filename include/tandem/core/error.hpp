// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace tandem::core {

enum class TransferErrc {
    success = 0,
    invalid_size,
    invalid_chunk_size,
    chunk_fetch_failed,
    merge_failed,
    job_not_found,
    not_ready,
    invalid_state,
    remote_not_found,
    remote_error,
    short_read,
    cancelled,
    invalid_config,
};

namespace detail {

struct TransferErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "tandem::transfer";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<TransferErrc>(ev)) {
            case TransferErrc::success:             return "Success";
            case TransferErrc::invalid_size:        return "Invalid file size";
            case TransferErrc::invalid_chunk_size:  return "Invalid chunk size";
            case TransferErrc::chunk_fetch_failed:  return "Chunk fetch failed";
            case TransferErrc::merge_failed:        return "Merging chunks failed";
            case TransferErrc::job_not_found:       return "Job not found";
            case TransferErrc::not_ready:           return "Download not ready";
            case TransferErrc::invalid_state:       return "Operation not allowed in current state";
            case TransferErrc::remote_not_found:    return "Remote file not found";
            case TransferErrc::remote_error:        return "Remote command failed";
            case TransferErrc::short_read:          return "Remote returned wrong byte count";
            case TransferErrc::cancelled:           return "Transfer cancelled";
            case TransferErrc::invalid_config:      return "Invalid configuration";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::TransferErrcCategory& transfer_errc_category() noexcept {
    static detail::TransferErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TransferErrc e) noexcept {
    return {static_cast<int>(e), transfer_errc_category()};
}

} // namespace tandem::core

namespace std {

template<>
struct is_error_code_enum<tandem::core::TransferErrc> : true_type {};

} // namespace std
