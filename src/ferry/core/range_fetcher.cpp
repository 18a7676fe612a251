// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/range_fetcher.hpp>
#include <ferry/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <optional>

namespace ferry::core {

namespace {

// "bytes first-last/total" -> (first, last)
std::optional<std::pair<std::uint64_t, std::uint64_t>>
parse_content_range(std::string_view value) noexcept {
    if (!value.starts_with("bytes ")) return std::nullopt;
    value.remove_prefix(6);

    auto dash = value.find('-');
    auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    std::uint64_t first = 0;
    std::uint64_t last = 0;
    auto a = value.substr(0, dash);
    auto b = value.substr(dash + 1, slash - dash - 1);
    auto r1 = std::from_chars(a.data(), a.data() + a.size(), first);
    auto r2 = std::from_chars(b.data(), b.data() + b.size(), last);
    if (r1.ec != std::errc{} || r2.ec != std::errc{} ||
        r1.ptr != a.data() + a.size() || r2.ptr != b.data() + b.size()) {
        return std::nullopt;
    }
    return std::pair{first, last};
}

// Failed statuses on a segment are transfer failures whatever their code
std::error_code segment_status_error(std::int32_t status) noexcept {
    auto ec = status_to_error(status);
    if (error_class(ec) == ErrorClass::transfer) return ec;
    return make_error_code(DownloadErrc::bad_status);
}

} // namespace

std::error_code check_segment_response(const HttpResponse& response,
                                       const Segment& segment,
                                       bool ranged) noexcept {
    auto status = response.status_code;
    if (status < 200 || status >= 300) {
        return segment_status_error(status);
    }

    if (!ranged) {
        return status == 200 ? std::error_code{} : make_error_code(DownloadErrc::bad_status);
    }

    if (status == 200) {
        // Server ignored Range and is sending the whole object
        return make_error_code(DownloadErrc::range_not_supported);
    }
    if (status != 206) {
        return make_error_code(DownloadErrc::bad_status);
    }

    if (auto it = response.headers.find("content-range"); it != response.headers.end()) {
        auto range = parse_content_range(it->second);
        if (!range || range->first != segment.start() || range->second != segment.end()) {
            return make_error_code(DownloadErrc::range_not_supported);
        }
    }
    return {};
}

//=============================================================================
// RangeFetcher
//=============================================================================

RangeFetcher::RangeFetcher(Transport& transport,
                           disk::PartStore& store,
                           ByteCounter& counter,
                           std::string url,
                           FetchOptions options)
    : transport_(transport)
    , store_(store)
    , counter_(counter)
    , url_(std::move(url))
    , options_(options) {}

std::error_code RangeFetcher::fetch(Segment& segment, std::stop_token stop) noexcept {
    if (!segment.begin_attempt()) {
        if (segment.is_done()) return {};
        return make_error_code(disk::DiskErrc::writer_busy);
    }

    std::uint64_t credited = 0;
    auto ec = run_attempt(segment, stop, credited);
    if (!ec) {
        ec = segment.complete(store_.size_of(segment.index()).value_or(0));
        if (!ec) {
            spdlog::debug("segment {} done ({} bytes, attempt {})",
                          segment.index(), segment.expected_size(), segment.attempts());
            return {};
        }
        // Never leave a wrong-sized part where a resume scan could find it
        if (auto rm = store_.remove(segment.index())) {
            spdlog::warn("segment {}: cannot remove bad part: {}", segment.index(), rm.message());
        }
    } else {
        segment.fail(ec);
    }

    counter_.subtract(credited);
    spdlog::debug("segment {} attempt {} failed: {}", segment.index(), segment.attempts(), ec.message());
    return ec;
}

std::error_code RangeFetcher::run_attempt(Segment& segment,
                                          std::stop_token stop,
                                          std::uint64_t& credited) noexcept {
    try {
        if (stop.stop_requested()) {
            return make_error_code(DownloadErrc::cancelled);
        }

        auto writer = store_.open_for_write(segment.index());
        if (!writer) {
            return writer.error();
        }
        auto& part = **writer;
        const auto expected = segment.expected_size();

        disk::SegmentBuffer buffer(options_.chunk_size);
        auto flush = [&]() -> std::error_code {
            if (buffer.empty()) return {};
            if (auto ec = part.write(std::span<const std::byte>(buffer.data(), buffer.size()))) {
                return ec;
            }
            counter_.add(buffer.size());
            credited += buffer.size();
            buffer.reset();
            return {};
        };

        ResponseHandler handler;
        handler.on_headers = [&](const HttpResponse& r) {
            return check_segment_response(r, segment, options_.ranged);
        };
        handler.on_data = [&](std::span<const std::byte> data) -> std::error_code {
            // Server sending past the end of the range
            if (part.written() + buffer.size() + data.size() > expected) {
                return make_error_code(DownloadErrc::size_mismatch);
            }
            while (!data.empty()) {
                auto n = buffer.append(data.data(), data.size());
                data = data.subspan(n);
                if (buffer.full()) {
                    if (auto ec = flush()) return ec;
                }
            }
            return {};
        };

        RangeRequest request;
        request.url = url_;
        if (options_.ranged) {
            request.range = std::pair{segment.start(), segment.end()};
        }
        request.timeout = options_.request_timeout;

        auto response = transport_.get(request, handler, stop);
        if (!response) {
            return response.error();
        }
        if (auto ec = check_segment_response(*response, segment, options_.ranged)) {
            return ec;
        }
        if (auto ec = flush()) {
            return ec;
        }

        if (part.written() != expected) {
            spdlog::warn("segment {}: received {} of {} bytes",
                         segment.index(), part.written(), expected);
            return make_error_code(DownloadErrc::size_mismatch);
        }

        auto committed = store_.finalize(std::move(*writer));
        if (!committed) {
            return committed.error();
        }
        return {};
    } catch (const std::bad_alloc&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

} // namespace ferry::core
