// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <stop_token>
#include <string>

namespace ferry::core {

// HTTP response headers
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;  // lower-cased names
    std::optional<std::uint64_t> content_length;
    bool accepts_ranges{false};
    std::string content_type;
    std::string filename;  // From Content-Disposition
};

// A GET, optionally restricted to [first, last] inclusive
struct RangeRequest {
    std::string url;
    std::optional<std::pair<std::uint64_t, std::uint64_t>> range;
    std::chrono::seconds timeout{0};  // 0 = no overall limit
};

// Receives one response. Returning an error from either callback aborts the
// transfer and that error is what get() reports.
struct ResponseHandler {
    std::function<std::error_code(const HttpResponse&)> on_headers;
    std::function<std::error_code(std::span<const std::byte>)> on_data;
};

// Byte transport consumed by the core. Implementations must be safe to call
// from several worker threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    // Headers only
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept = 0;

    // Stream a response body through the handler; stop aborts mid-transfer
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const RangeRequest& request,
        const ResponseHandler& handler,
        std::stop_token stop) noexcept = 0;
};

// Map an HTTP status to an error (success for 2xx)
[[nodiscard]] std::error_code status_to_error(std::int32_t status) noexcept;

// Total object size from "bytes a-b/total"
[[nodiscard]] std::optional<std::uint64_t> parse_content_range_total(std::string_view value) noexcept;

// Filename from a Content-Disposition value (filename*= preferred)
[[nodiscard]] std::string parse_content_disposition(std::string_view value);

} // namespace ferry::core
