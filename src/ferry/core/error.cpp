// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/error.hpp>
#include <ferry/disk/error.hpp>

namespace ferry::core {

ErrorClass error_class(const std::error_code& ec) noexcept {
    if (!ec) return ErrorClass::none;

    if (ec.category() == disk::disk_errc_category()) {
        return ErrorClass::storage;
    }
    if (ec.category() != download_errc_category()) {
        // Raw system errors only come from the storage layer
        return ErrorClass::storage;
    }

    switch (static_cast<DownloadErrc>(ec.value())) {
        case DownloadErrc::metadata_unavailable:
        case DownloadErrc::unauthorized:
        case DownloadErrc::not_found:
        case DownloadErrc::invalid_url:
            return ErrorClass::metadata;
        case DownloadErrc::invalid_size:
        case DownloadErrc::invalid_segment_size:
            return ErrorClass::planning;
        case DownloadErrc::network_error:
        case DownloadErrc::timeout:
        case DownloadErrc::server_error:
        case DownloadErrc::bad_status:
        case DownloadErrc::range_not_supported:
            return ErrorClass::transfer;
        case DownloadErrc::size_mismatch:
            return ErrorClass::size_mismatch;
        case DownloadErrc::incomplete_segments:
        case DownloadErrc::merge_failed:
            return ErrorClass::merge;
        case DownloadErrc::retries_exhausted:
        case DownloadErrc::cancelled:
        case DownloadErrc::invalid_config:
            return ErrorClass::session;
        case DownloadErrc::success:
            return ErrorClass::none;
    }
    return ErrorClass::session;
}

bool is_retryable(const std::error_code& ec) noexcept {
    auto c = error_class(ec);
    return c == ErrorClass::transfer || c == ErrorClass::size_mismatch;
}

std::string_view to_string(ErrorClass c) noexcept {
    switch (c) {
        case ErrorClass::none:          return "none";
        case ErrorClass::metadata:      return "MetadataError";
        case ErrorClass::planning:      return "PlanningError";
        case ErrorClass::transfer:      return "TransferError";
        case ErrorClass::size_mismatch: return "SizeMismatchError";
        case ErrorClass::merge:         return "MergeError";
        case ErrorClass::storage:       return "StorageError";
        case ErrorClass::session:       return "SessionError";
    }
    return "unknown";
}

} // namespace ferry::core
