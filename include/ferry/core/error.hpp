// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <system_error>
#include <string_view>

namespace ferry::core {

enum class DownloadErrc {
    success = 0,
    // Metadata
    metadata_unavailable,
    unauthorized,
    not_found,
    invalid_url,
    // Planning
    invalid_size,
    invalid_segment_size,
    // Transfer
    network_error,
    timeout,
    server_error,
    bad_status,
    range_not_supported,
    // Integrity
    size_mismatch,
    // Merge
    incomplete_segments,
    merge_failed,
    // Session
    retries_exhausted,
    cancelled,
    invalid_config,
};

// Taxonomy a code belongs to; drives retry and exit decisions
enum class ErrorClass : std::uint8_t {
    none,
    metadata,
    planning,
    transfer,
    size_mismatch,
    merge,
    storage,
    session,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "ferry::download";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::metadata_unavailable: return "Object metadata unavailable";
            case DownloadErrc::unauthorized:         return "Not authorized to access object";
            case DownloadErrc::not_found:            return "Object not found (404)";
            case DownloadErrc::invalid_url:          return "Invalid URL";
            case DownloadErrc::invalid_size:         return "Invalid object size";
            case DownloadErrc::invalid_segment_size: return "Segment size must be positive";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::timeout:              return "Operation timed out";
            case DownloadErrc::server_error:         return "Server error (5xx)";
            case DownloadErrc::bad_status:           return "Unexpected HTTP status";
            case DownloadErrc::range_not_supported:  return "Server ignored byte range";
            case DownloadErrc::size_mismatch:        return "Segment size mismatch";
            case DownloadErrc::incomplete_segments:  return "Cannot merge incomplete segments";
            case DownloadErrc::merge_failed:         return "Merge failed";
            case DownloadErrc::retries_exhausted:    return "Segment retries exhausted";
            case DownloadErrc::cancelled:            return "Download cancelled";
            case DownloadErrc::invalid_config:       return "Invalid configuration";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

// Classify any error code produced by the library (disk codes map to storage)
[[nodiscard]] ErrorClass error_class(const std::error_code& ec) noexcept;

// Transfer and size-mismatch failures are retried locally
[[nodiscard]] bool is_retryable(const std::error_code& ec) noexcept;

[[nodiscard]] std::string_view to_string(ErrorClass c) noexcept;

} // namespace ferry::core

namespace std {

template<>
struct is_error_code_enum<ferry::core::DownloadErrc> : true_type {};

} // namespace std
