// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/scheduler.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>
#include <thread>

namespace ferry::core {

std::chrono::milliseconds backoff_delay(std::uint32_t retry,
                                        std::chrono::milliseconds base,
                                        std::chrono::milliseconds cap) noexcept {
    if (retry == 0 || base.count() <= 0) return std::chrono::milliseconds{0};

    auto delay = base;
    for (std::uint32_t i = 1; i < retry && delay < cap; ++i) {
        delay *= 2;
    }
    return std::min(delay, cap);
}

//=============================================================================
// Scheduler
//=============================================================================

Scheduler::Scheduler(RangeFetcher& fetcher, SchedulerOptions options) noexcept
    : fetcher_(fetcher)
    , options_(options) {}

std::error_code Scheduler::run(SegmentList& segments, std::stop_token stop) noexcept {
    try {
        queue_.clear();
        for (auto& seg : segments) {
            if (!seg->is_done()) queue_.push_back(seg.get());
        }
        cursor_.store(0, std::memory_order_release);
        dispatch_ = std::stop_source{};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            failure_.clear();
            last_error_.clear();
        }

        if (queue_.empty()) {
            return {};
        }

        // External cancellation also ends dispatch and backoff waits
        std::stop_callback on_cancel(stop, [this] { dispatch_.request_stop(); });

        auto count = std::clamp<std::uint32_t>(options_.workers, 1,
                                               static_cast<std::uint32_t>(queue_.size()));
        spdlog::debug("scheduler: {} segments over {} workers", queue_.size(), count);
        {
            std::vector<std::jthread> pool;
            pool.reserve(count);
            for (std::uint32_t i = 0; i < count; ++i) {
                pool.emplace_back([this, stop] { worker(stop); });
            }
            // jthread joins on destruction
        }

        if (stop.stop_requested()) {
            return make_error_code(DownloadErrc::cancelled);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (failure_) {
            return failure_;
        }
        if (!all_done(segments)) {
            return make_error_code(DownloadErrc::incomplete_segments);
        }
        return {};
    } catch (const std::system_error& e) {
        spdlog::error("scheduler: cannot start workers: {}", e.what());
        dispatch_.request_stop();
        return e.code();
    } catch (const std::bad_alloc&) {
        return make_error_code(DownloadErrc::cancelled);
    }
}

void Scheduler::worker(std::stop_token cancel) noexcept {
    auto dispatch = dispatch_.get_token();
    while (!dispatch.stop_requested()) {
        auto i = cursor_.fetch_add(1, std::memory_order_acq_rel);
        if (i >= queue_.size()) break;

        if (!run_segment(*queue_[i], cancel)) break;
    }
}

bool Scheduler::run_segment(Segment& segment, std::stop_token cancel) noexcept {
    auto dispatch = dispatch_.get_token();

    for (std::uint32_t attempt = 0; ; ++attempt) {
        auto now = in_flight_.fetch_add(1, std::memory_order_acq_rel) + 1;
        auto peak = peak_in_flight_.load(std::memory_order_relaxed);
        while (now > peak && !peak_in_flight_.compare_exchange_weak(peak, now)) {}

        auto ec = fetcher_.fetch(segment, cancel);
        in_flight_.fetch_sub(1, std::memory_order_acq_rel);

        if (!ec) return true;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_error_ = ec;
        }

        if (cancel.stop_requested() || ec == DownloadErrc::cancelled) {
            return false;
        }
        if (!is_retryable(ec)) {
            spdlog::error("segment {}: {} ({}), not retrying",
                          segment.index(), ec.message(), to_string(error_class(ec)));
            record_failure(segment, ec);
            return false;
        }
        if (attempt >= options_.max_retries) {
            spdlog::error("segment {}: giving up after {} attempts: {}",
                          segment.index(), attempt + 1, ec.message());
            record_failure(segment, make_error_code(DownloadErrc::retries_exhausted));
            return false;
        }

        auto delay = backoff_delay(attempt + 1, options_.retry_backoff, options_.retry_backoff_max);
        spdlog::warn("segment {}: {}, retry {}/{} in {}ms",
                     segment.index(), ec.message(), attempt + 1, options_.max_retries, delay.count());
        retries_.fetch_add(1, std::memory_order_relaxed);

        // Interruptible sleep
        std::mutex m;
        std::condition_variable_any cv;
        std::unique_lock<std::mutex> lock(m);
        cv.wait_for(lock, dispatch, delay, [] { return false; });

        if (dispatch.stop_requested()) {
            return false;
        }
    }
}

void Scheduler::record_failure(const Segment& segment, std::error_code session_ec) noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!failure_) {
            failure_ = session_ec;
            spdlog::debug("scheduler: segment {} ends the session", segment.index());
        }
    }
    dispatch_.request_stop();
}

std::error_code Scheduler::last_segment_error() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

} // namespace ferry::core
