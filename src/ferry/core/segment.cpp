// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/segment.hpp>
#include <algorithm>
#include <limits>

namespace ferry::core {

const char* to_string(SegmentState s) noexcept {
    switch (s) {
        case SegmentState::pending:   return "pending";
        case SegmentState::in_flight: return "in_flight";
        case SegmentState::done:      return "done";
        case SegmentState::failed:    return "failed";
    }
    return "unknown";
}

//=============================================================================
// Segment
//=============================================================================

Segment::Segment(std::uint32_t index, std::uint64_t start, std::uint64_t size) noexcept
    : index_(index)
    , start_(start)
    , size_(size) {}

bool Segment::begin_attempt() noexcept {
    auto current = state_.load(std::memory_order_acquire);
    while (current == SegmentState::pending || current == SegmentState::failed) {
        if (state_.compare_exchange_weak(current, SegmentState::in_flight,
                                         std::memory_order_acq_rel)) {
            attempts_.fetch_add(1, std::memory_order_relaxed);
            error_.clear();
            return true;
        }
    }
    return false;
}

std::error_code Segment::complete(std::uint64_t stored_bytes) noexcept {
    if (state() != SegmentState::in_flight) {
        return make_error_code(DownloadErrc::incomplete_segments);
    }
    if (stored_bytes != size_) {
        fail(make_error_code(DownloadErrc::size_mismatch));
        return error_;
    }
    state_.store(SegmentState::done, std::memory_order_release);
    return {};
}

void Segment::fail(std::error_code ec) noexcept {
    error_ = ec;
    auto expected = SegmentState::in_flight;
    state_.compare_exchange_strong(expected, SegmentState::failed, std::memory_order_acq_rel);
}

bool Segment::mark_resumed(std::uint64_t stored_bytes) noexcept {
    if (stored_bytes != size_) return false;
    auto expected = SegmentState::pending;
    return state_.compare_exchange_strong(expected, SegmentState::done, std::memory_order_acq_rel);
}

//=============================================================================
// Planning
//=============================================================================

std::expected<SegmentPlan, std::error_code>
plan_segments(std::int64_t total_size,
              std::int64_t segment_size,
              std::uint32_t desired_workers) noexcept {
    if (total_size < 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_size));
    }
    if (segment_size <= 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_segment_size));
    }

    auto total = static_cast<std::uint64_t>(total_size);
    auto seg_size = static_cast<std::uint64_t>(segment_size);
    std::uint64_t count = total / seg_size + (total % seg_size != 0 ? 1 : 0);
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_segment_size));
    }

    SegmentPlan plan;
    plan.total_size = total;
    plan.segment_size = seg_size;

    try {
        plan.segments.reserve(static_cast<std::size_t>(count));
        std::uint64_t offset = 0;
        for (std::uint32_t i = 0; i < count; ++i) {
            std::uint64_t this_size = std::min(seg_size, total - offset);
            plan.segments.push_back(std::make_unique<Segment>(i, offset, this_size));
            offset += this_size;
        }
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_segment_size));
    }

    auto max_workers = static_cast<std::uint32_t>(std::max<std::uint64_t>(count, 1));
    plan.workers = std::clamp(desired_workers, 1u, max_workers);
    return plan;
}

std::expected<SegmentPlan, std::error_code>
plan_single_segment(std::int64_t total_size) noexcept {
    if (total_size < 0) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_size));
    }
    if (total_size == 0) {
        return plan_segments(0, 1, 1);
    }
    return plan_segments(total_size, total_size, 1);
}

std::uint64_t done_bytes(const SegmentList& segments) noexcept {
    std::uint64_t total = 0;
    for (const auto& seg : segments) {
        if (seg->is_done()) total += seg->expected_size();
    }
    return total;
}

bool all_done(const SegmentList& segments) noexcept {
    return std::all_of(segments.begin(), segments.end(),
                       [](const auto& seg) { return seg->is_done(); });
}

} // namespace ferry::core
