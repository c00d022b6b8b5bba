// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace tandem::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    open_failed,
    read_error,
    write_error,
    remove_failed,
    aborted,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "tandem::disk";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:         return "Success";
            case DiskErrc::file_not_found:  return "File not found";
            case DiskErrc::open_failed:     return "Cannot open file";
            case DiskErrc::read_error:      return "Read error";
            case DiskErrc::write_error:     return "Write error";
            case DiskErrc::remove_failed:   return "Cannot remove file";
            case DiskErrc::aborted:         return "Operation aborted";
            default:                        return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

} // namespace tandem::disk

namespace std {

template<>
struct is_error_code_enum<tandem::disk::DiskErrc> : true_type {};

} // namespace std
