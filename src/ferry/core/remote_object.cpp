// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/remote_object.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/url.hpp>
#include <spdlog/spdlog.h>
#include <optional>

namespace ferry::core {

namespace {

// Metadata failures keep auth and not-found distinct; everything else is
// reported as unavailable
std::error_code to_metadata_error(const std::error_code& ec) noexcept {
    if (ec == DownloadErrc::unauthorized || ec == DownloadErrc::not_found ||
        ec == DownloadErrc::invalid_url || ec == DownloadErrc::cancelled) {
        return ec;
    }
    return make_error_code(DownloadErrc::metadata_unavailable);
}

} // namespace

std::string sanitize_filename(std::string_view name, std::string_view fallback) {
    if (auto slash = name.find_last_of("/\\"); slash != std::string_view::npos) {
        name.remove_prefix(slash + 1);
    }

    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) continue;
        out += c;
    }
    if (out.empty() || out == "." || out == "..") {
        if (fallback.empty()) return "download";
        return sanitize_filename(fallback, {});
    }
    return out;
}

//=============================================================================
// HttpCatalog
//=============================================================================

HttpCatalog::HttpCatalog(Transport& transport, std::string url_template)
    : transport_(transport)
    , url_template_(std::move(url_template)) {}

std::expected<HttpResponse, std::error_code>
HttpCatalog::probe(const std::string& url) noexcept {
    try {
        std::optional<HttpResponse> seen;

        ResponseHandler handler;
        handler.on_headers = [&seen](const HttpResponse& r) -> std::error_code {
            seen = r;
            // Headers are all the probe needs; a 200 here would stream the
            // whole object
            if (r.status_code != 206) {
                return make_error_code(DownloadErrc::range_not_supported);
            }
            return {};
        };
        handler.on_data = [](std::span<const std::byte>) -> std::error_code { return {}; };

        RangeRequest request;
        request.url = url;
        request.range = std::pair<std::uint64_t, std::uint64_t>{0, 0};
        request.timeout = std::chrono::seconds{CONNECTION_TIMEOUT_SEC * 2};

        auto result = transport_.get(request, handler, std::stop_token{});
        if (result) return *result;
        if (seen) return *seen;
        return std::unexpected(result.error());
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::metadata_unavailable));
    }
}

std::expected<RemoteObject, std::error_code>
HttpCatalog::resolve(std::string_view id) noexcept {
    try {
        RemoteObject obj;
        obj.id = std::string(id);
        obj.url = expand_url_template(url_template_, id);

        auto url = Url::parse(obj.url);
        if (!url) {
            spdlog::error("resolve {}: invalid URL '{}'", id, obj.url);
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        std::optional<std::uint64_t> size;
        std::string disposition_name;

        auto head = transport_.head(obj.url);
        if (head) {
            size = head->content_length;
            obj.supports_ranges = head->accepts_ranges;
            disposition_name = head->filename;
        } else if (head.error() == DownloadErrc::unauthorized ||
                   head.error() == DownloadErrc::not_found) {
            spdlog::error("resolve {}: {}", id, head.error().message());
            return std::unexpected(head.error());
        } else {
            spdlog::debug("resolve {}: HEAD failed ({}), probing", id, head.error().message());
        }

        // HEAD without a usable length, or no HEAD support at all
        const bool need_size = !size || !head;
        if (need_size) {
            auto probed = probe(obj.url);
            if (!probed) {
                spdlog::error("resolve {}: {}", id, probed.error().message());
                return std::unexpected(to_metadata_error(probed.error()));
            }

            const auto& r = *probed;
            auto range = r.headers.find("content-range");
            if (r.status_code == 206 && range != r.headers.end()) {
                size = parse_content_range_total(range->second);
                obj.supports_ranges = true;
            } else if (r.status_code == 416 && range != r.headers.end()) {
                // "bytes */0": nothing to satisfy for an empty object
                size = parse_content_range_total(range->second);
                obj.supports_ranges = true;
            } else if (r.status_code == 200) {
                size = r.content_length;
                obj.supports_ranges = false;
            } else if (auto ec = status_to_error(r.status_code)) {
                spdlog::error("resolve {}: probe returned {}", id, r.status_code);
                return std::unexpected(to_metadata_error(ec));
            }
            if (disposition_name.empty()) {
                disposition_name = r.filename;
            }
        }

        // A sized HEAD without Accept-Ranges is confirmed with a probe; only
        // a 206 for the same total enables ranges
        if (!need_size && !obj.supports_ranges) {
            auto probed = probe(obj.url);
            if (probed && probed->status_code == 206) {
                if (auto it = probed->headers.find("content-range"); it != probed->headers.end()) {
                    if (auto total = parse_content_range_total(it->second); total && *total == *size) {
                        obj.supports_ranges = true;
                    }
                }
            } else if (!probed) {
                spdlog::debug("resolve {}: range probe failed ({}), using one stream",
                              id, probed.error().message());
            }
        }

        if (!size) {
            spdlog::error("resolve {}: server did not report a size", id);
            return std::unexpected(make_error_code(DownloadErrc::metadata_unavailable));
        }
        obj.total_size = *size;

        auto candidate = disposition_name.empty() ? url->filename() : disposition_name;
        obj.name = sanitize_filename(candidate, id);

        spdlog::info("resolved {} -> '{}' ({} bytes, ranges {})",
                     id, obj.name, obj.total_size, obj.supports_ranges ? "yes" : "no");
        return obj;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::metadata_unavailable));
    }
}

} // namespace ferry::core
