// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/range_fetcher.hpp>
#include <ferry/core/segment.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <vector>

namespace ferry::core {

struct SchedulerOptions {
    std::uint32_t workers{DEFAULT_WORKERS};
    std::uint32_t max_retries{RETRY_COUNT};  // attempts after the first
    std::chrono::milliseconds retry_backoff{RETRY_BACKOFF_BASE};
    std::chrono::milliseconds retry_backoff_max{RETRY_BACKOFF_MAX};
};

// Delay before retry number `retry` (1-based): base * 2^(retry-1), capped
[[nodiscard]] std::chrono::milliseconds backoff_delay(std::uint32_t retry,
                                                      std::chrono::milliseconds base,
                                                      std::chrono::milliseconds cap) noexcept;

// Bounded worker pool. Every segment that is not already done is fetched
// exactly once to completion, at most `workers` at a time, each with its own
// retry budget. The first segment to fail for good stops further dispatch;
// fetches already in flight run to completion.
class Scheduler {
public:
    Scheduler(RangeFetcher& fetcher, SchedulerOptions options) noexcept;

    // Non-copyable, non-movable
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Blocks until every segment is done, a segment exhausts its retries, a
    // non-retryable error occurs, or `stop` is requested (aborting in-flight
    // fetches). Returns retries_exhausted, the non-retryable error, or
    // cancelled respectively.
    [[nodiscard]] std::error_code run(SegmentList& segments, std::stop_token stop) noexcept;

    // Last error reported by any segment attempt
    [[nodiscard]] std::error_code last_segment_error() const noexcept;

    [[nodiscard]] std::uint32_t peak_in_flight() const noexcept {
        return peak_in_flight_.load(std::memory_order_acquire);
    }
    [[nodiscard]] std::uint32_t retries() const noexcept {
        return retries_.load(std::memory_order_acquire);
    }

private:
    void worker(std::stop_token cancel) noexcept;

    // Drive one segment through its attempts; false once dispatch must stop
    bool run_segment(Segment& segment, std::stop_token cancel) noexcept;

    void record_failure(const Segment& segment, std::error_code session_ec) noexcept;

    RangeFetcher& fetcher_;
    SchedulerOptions options_;

    std::vector<Segment*> queue_;
    std::atomic<std::size_t> cursor_{0};
    std::stop_source dispatch_;

    std::atomic<std::uint32_t> in_flight_{0};
    std::atomic<std::uint32_t> peak_in_flight_{0};
    std::atomic<std::uint32_t> retries_{0};

    mutable std::mutex mutex_;
    std::error_code failure_;
    std::error_code last_error_;
};

} // namespace ferry::core
