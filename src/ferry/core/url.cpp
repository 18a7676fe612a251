// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace ferry::core {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    try {
        std::string lower_scheme;
        lower_scheme.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            lower_scheme += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }
        url.scheme_ = std::move(lower_scheme);

        auto rest_start = scheme_end + 3; // Skip "://"

        auto path_start = url_str.find('/', rest_start);
        if (path_start == std::string_view::npos) path_start = url_str.length();

        auto query_start = url_str.find('?', rest_start);
        if (query_start == std::string_view::npos) query_start = url_str.length();

        auto fragment_start = url_str.find('#', rest_start);
        if (fragment_start == std::string_view::npos) fragment_start = url_str.length();

        auto host_end = std::min({path_start, query_start, fragment_start});

        // Skip user:pass@
        std::size_t authority_start = rest_start;
        auto at_pos = url_str.find('@', rest_start);
        if (at_pos != std::string_view::npos && at_pos < host_end) {
            authority_start = at_pos + 1;
        }

        auto bracket_start = url_str.find('[', authority_start);
        if (bracket_start != std::string_view::npos && bracket_start < host_end) {
            // IPv6 literal: [::1]:port
            auto bracket_end = url_str.find(']', bracket_start);
            if (bracket_end == std::string_view::npos || bracket_end >= host_end) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.host_ = std::string(url_str.substr(bracket_start, bracket_end - bracket_start + 1));
            if (bracket_end + 1 < host_end && url_str[bracket_end + 1] == ':') {
                url.port_ = std::string(url_str.substr(bracket_end + 2, host_end - bracket_end - 2));
            }
        } else {
            auto colon_pos = url_str.find(':', authority_start);
            if (colon_pos != std::string_view::npos && colon_pos < host_end) {
                url.host_ = std::string(url_str.substr(authority_start, colon_pos - authority_start));
                url.port_ = std::string(url_str.substr(colon_pos + 1, host_end - colon_pos - 1));
            } else {
                url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
            }
        }

        if (path_start < query_start && path_start < fragment_start) {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        } else {
            url.path_ = "/";
        }

        if (query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        if (fragment_start < url_str.length()) {
            url.fragment_ = std::string(url_str.substr(fragment_start + 1));
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        if (!url.port_.empty() &&
            !std::all_of(url.port_.begin(), url.port_.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        url.str_ = std::string(url_str);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    return url;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::uint16_t Url::default_port() const noexcept {
    if (scheme_ == "http") return 80;
    if (scheme_ == "https") return 443;
    if (scheme_ == "ftp") return 21;
    return 0;
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return percent_decode(path_);
    }
    return percent_decode(std::string_view(path_).substr(last_slash + 1));
}

std::string percent_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += in[i];
    }
    return out;
}

} // namespace ferry::core
