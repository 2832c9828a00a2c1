// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cerrno>
#include <string>
#include <system_error>

namespace booru::disk {

enum class DiskErrc {
    success = 0,
    handle_invalid,
    short_write,
    already_open,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "booru::disk";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:        return "Success";
            case DiskErrc::handle_invalid: return "Invalid handle";
            case DiskErrc::short_write:    return "Short write";
            case DiskErrc::already_open:   return "File already open";
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

// OS errors stay in the system category so std::errc comparisons work
inline std::error_code last_os_error() noexcept {
    return {errno, std::system_category()};
}

inline std::error_code os_error(int err) noexcept {
    return {err, std::system_category()};
}

} // namespace booru::disk

namespace std {

template<>
struct is_error_code_enum<booru::disk::DiskErrc> : true_type {};

} // namespace std
