// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/byte_counter.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/segment.hpp>
#include <ferry/core/transport.hpp>
#include <ferry/disk/part_store.hpp>
#include <chrono>
#include <cstddef>
#include <stop_token>
#include <string>

namespace ferry::core {

struct FetchOptions {
    std::size_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::chrono::seconds request_timeout{REQUEST_TIMEOUT_SEC};
    // false for the single-segment fallback: plain GET, 200 expected
    bool ranged{true};
};

// Executes one attempt at one segment: range GET, chunked writes into the
// part store, shared counter updates, exact-size verification and commit.
// Safe to invoke again for the same segment; each attempt replaces whatever
// the previous one left uncommitted.
class RangeFetcher {
public:
    RangeFetcher(Transport& transport,
                 disk::PartStore& store,
                 ByteCounter& counter,
                 std::string url,
                 FetchOptions options);

    // Runs pending|failed -> in_flight -> done|failed. Returns the attempt's
    // error (empty on success).
    [[nodiscard]] std::error_code fetch(Segment& segment, std::stop_token stop) noexcept;

    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] const FetchOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::error_code run_attempt(Segment& segment,
                                              std::stop_token stop,
                                              std::uint64_t& credited) noexcept;

    Transport& transport_;
    disk::PartStore& store_;
    ByteCounter& counter_;
    std::string url_;
    FetchOptions options_;
};

// Accept a response for a segment: 206 with a matching Content-Range for
// ranged requests, 200 for the unranged fallback
[[nodiscard]] std::error_code check_segment_response(const HttpResponse& response,
                                                     const Segment& segment,
                                                     bool ranged) noexcept;

} // namespace ferry::core
