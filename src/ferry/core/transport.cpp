// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/transport.hpp>
#include <ferry/core/url.hpp>
#include <charconv>

namespace ferry::core {

std::error_code status_to_error(std::int32_t status) noexcept {
    if (status >= 200 && status < 300) return {};
    if (status == 401 || status == 403) return make_error_code(DownloadErrc::unauthorized);
    if (status == 404 || status == 410) return make_error_code(DownloadErrc::not_found);
    if (status == 408) return make_error_code(DownloadErrc::timeout);
    if (status >= 500) return make_error_code(DownloadErrc::server_error);
    return make_error_code(DownloadErrc::bad_status);
}

std::optional<std::uint64_t> parse_content_range_total(std::string_view value) noexcept {
    auto slash = value.rfind('/');
    if (slash == std::string_view::npos || slash + 1 >= value.size()) {
        return std::nullopt;
    }
    auto total = value.substr(slash + 1);
    std::uint64_t n = 0;
    auto [ptr, ec] = std::from_chars(total.data(), total.data() + total.size(), n);
    if (ec != std::errc{} || ptr != total.data() + total.size()) {
        return std::nullopt;  // "*" or garbage
    }
    return n;
}

std::string parse_content_disposition(std::string_view value) {
    // RFC 5987 form: filename*=UTF-8''name%20here
    if (auto pos = value.find("filename*="); pos != std::string_view::npos) {
        auto v = value.substr(pos + 10);
        v = v.substr(0, v.find(';'));
        if (auto quote = v.find("''"); quote != std::string_view::npos) {
            v.remove_prefix(quote + 2);
        }
        return percent_decode(v);
    }

    auto pos = value.find("filename=");
    if (pos == std::string_view::npos) return {};

    auto v = value.substr(pos + 9);
    if (!v.empty() && (v.front() == '"' || v.front() == '\'')) {
        char q = v.front();
        v.remove_prefix(1);
        v = v.substr(0, v.find(q));
    } else {
        v = v.substr(0, v.find(';'));
        while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.remove_suffix(1);
    }
    return std::string(v);
}

} // namespace ferry::core
