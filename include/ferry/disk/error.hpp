// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace ferry::disk {

// Storage failures from part staging, the manifest and the merge
enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    disk_full,
    invalid_path,
    file_exists,
    write_error,
    read_error,
    handle_invalid,
    writer_busy,
    not_committed,
    manifest_corrupt,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ferry::disk";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:            return "Success";
            case DiskErrc::file_not_found:     return "No such file";
            case DiskErrc::access_denied:      return "Permission denied";
            case DiskErrc::disk_full:          return "No space left for parts";
            case DiskErrc::invalid_path:       return "Unusable path";
            case DiskErrc::file_exists:        return "Writer already open";
            case DiskErrc::write_error:        return "Write failed";
            case DiskErrc::read_error:         return "Read failed";
            case DiskErrc::handle_invalid:     return "File handle not open";
            case DiskErrc::writer_busy:        return "Part already open for writing";
            case DiskErrc::not_committed:      return "Part not committed";
            case DiskErrc::manifest_corrupt:   return "Session manifest corrupt";
            default:                           return "Unknown storage error";
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

// Map an errno value from a failed syscall
[[nodiscard]] std::error_code errno_to_error_code(int err) noexcept;

} // namespace ferry::disk

namespace std {

template<>
struct is_error_code_enum<ferry::disk::DiskErrc> : true_type {};

} // namespace std
