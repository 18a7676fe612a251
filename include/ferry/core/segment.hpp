// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <vector>

namespace ferry::core {

// Segment state machine:
//   pending -> in_flight -> {done, failed}
//   failed  -> in_flight   (bounded retry)
//   pending -> done        (resumed from a prior session)
enum class SegmentState : std::uint8_t {
    pending,
    in_flight,
    done,
    failed,
};

[[nodiscard]] const char* to_string(SegmentState s) noexcept;

// A contiguous byte range [start, end] of the remote object
class Segment {
public:
    Segment(std::uint32_t index, std::uint64_t start, std::uint64_t size) noexcept;

    // Non-copyable, non-movable (atomic state)
    Segment(const Segment&) = delete;
    Segment& operator=(const Segment&) = delete;

    [[nodiscard]] std::uint32_t index() const noexcept { return index_; }
    [[nodiscard]] std::uint64_t start() const noexcept { return start_; }
    // Inclusive, as sent in the Range header
    [[nodiscard]] std::uint64_t end() const noexcept { return start_ + size_ - 1; }
    [[nodiscard]] std::uint64_t expected_size() const noexcept { return size_; }

    [[nodiscard]] SegmentState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] bool is_done() const noexcept { return state() == SegmentState::done; }
    [[nodiscard]] std::uint32_t attempts() const noexcept { return attempts_.load(std::memory_order_relaxed); }

    // pending|failed -> in_flight; false if the segment is not eligible
    [[nodiscard]] bool begin_attempt() noexcept;

    // in_flight -> done when stored_bytes matches exactly, otherwise
    // in_flight -> failed with size_mismatch
    [[nodiscard]] std::error_code complete(std::uint64_t stored_bytes) noexcept;

    // in_flight -> failed
    void fail(std::error_code ec) noexcept;

    // pending -> done for an artifact already holding expected_size bytes
    [[nodiscard]] bool mark_resumed(std::uint64_t stored_bytes) noexcept;

    // Last error (valid after the owning worker has finished with it)
    [[nodiscard]] const std::error_code& error() const noexcept { return error_; }

private:
    std::uint32_t index_;
    std::uint64_t start_;
    std::uint64_t size_;
    std::atomic<SegmentState> state_{SegmentState::pending};
    std::atomic<std::uint32_t> attempts_{0};
    std::error_code error_;
};

using SegmentList = std::vector<std::unique_ptr<Segment>>;

// Output of the planner
struct SegmentPlan {
    SegmentList segments;
    std::uint64_t total_size{0};
    std::uint64_t segment_size{0};
    std::uint32_t workers{1};  // desired workers clamped to [1, segment count]
};

// Partition [0, total_size) into ceil(total/segment_size) ranges; the last one
// holds the remainder. Signed inputs so negative sizes are rejected rather
// than wrapped.
[[nodiscard]] std::expected<SegmentPlan, std::error_code>
plan_segments(std::int64_t total_size,
              std::int64_t segment_size,
              std::uint32_t desired_workers) noexcept;

// One segment spanning the whole object, for servers without range support
[[nodiscard]] std::expected<SegmentPlan, std::error_code>
plan_single_segment(std::int64_t total_size) noexcept;

// Sum of expected sizes of done segments
[[nodiscard]] std::uint64_t done_bytes(const SegmentList& segments) noexcept;

[[nodiscard]] bool all_done(const SegmentList& segments) noexcept;

} // namespace ferry::core
