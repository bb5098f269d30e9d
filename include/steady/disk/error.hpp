// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace steady::disk {

enum class DiskErrc {
    success = 0,
    access_denied,
    disk_full,
    invalid_path,
    open_failed,
    write_error,
    flush_error,
    handle_invalid,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "steady::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:        return "Success";
            case DiskErrc::access_denied:  return "Access denied";
            case DiskErrc::disk_full:      return "Disk full";
            case DiskErrc::invalid_path:   return "Invalid path";
            case DiskErrc::open_failed:    return "Cannot open file";
            case DiskErrc::write_error:    return "Write error";
            case DiskErrc::flush_error:    return "Flush error";
            case DiskErrc::handle_invalid: return "Invalid handle";
            default:                       return "Unknown error";
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

} // namespace steady::disk

namespace std {

template<>
struct is_error_code_enum<steady::disk::DiskErrc> : true_type {};

} // namespace std
