// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/progress_monitor.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <condition_variable>
#include <mutex>

namespace ferry::core {

ProgressSample make_sample(std::uint64_t downloaded,
                           std::uint64_t total,
                           std::uint64_t baseline,
                           std::uint64_t previous,
                           std::chrono::duration<double> since_previous,
                           std::chrono::duration<double> elapsed) noexcept {
    ProgressSample s;
    s.downloaded = downloaded;
    s.total = total;
    s.elapsed = elapsed;
    s.percent = total > 0 ? 100.0 * static_cast<double>(downloaded) / static_cast<double>(total) : 100.0;

    // The counter drops when a failed attempt withdraws its bytes
    if (since_previous.count() > 0 && downloaded > previous) {
        s.instant_bps = static_cast<double>(downloaded - previous) / since_previous.count();
    }

    auto fresh = downloaded > baseline ? downloaded - baseline : 0;
    if (elapsed.count() > 0) {
        s.average_bps = static_cast<double>(fresh) / elapsed.count();
    }

    if (s.average_bps > 0) {
        auto remaining = total > downloaded ? total - downloaded : 0;
        s.eta = std::chrono::seconds{
            static_cast<std::int64_t>(std::ceil(static_cast<double>(remaining) / s.average_bps))};
    }
    return s;
}

//=============================================================================
// ProgressMonitor
//=============================================================================

ProgressMonitor::ProgressMonitor(const ByteCounter& counter,
                                 std::uint64_t total,
                                 std::chrono::milliseconds interval,
                                 ProgressCallback callback)
    : counter_(counter)
    , total_(total)
    , interval_(interval)
    , callback_(std::move(callback)) {}

ProgressMonitor::~ProgressMonitor() {
    stop();
}

void ProgressMonitor::start(std::uint64_t baseline) {
    if (thread_.joinable()) return;
    baseline_ = baseline;
    reached_.store(false, std::memory_order_release);
    samples_.store(0, std::memory_order_release);
    thread_ = std::jthread([this](std::stop_token st) { loop(st); });
}

void ProgressMonitor::stop() noexcept {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

void ProgressMonitor::emit(const ProgressSample& sample) noexcept {
    samples_.fetch_add(1, std::memory_order_acq_rel);
    spdlog::debug("progress {}/{} bytes ({:.1f}%), {:.0f} B/s",
                  sample.downloaded, sample.total, sample.percent, sample.instant_bps);
    if (!callback_) return;
    try {
        callback_(sample);
    } catch (const std::exception& e) {
        spdlog::warn("progress callback threw: {}", e.what());
    }
}

void ProgressMonitor::loop(std::stop_token stop) noexcept {
    using clock = std::chrono::steady_clock;

    const auto started = clock::now();
    auto previous_time = started;
    auto previous = counter_.load();

    std::mutex m;
    std::condition_variable_any cv;

    while (!stop.stop_requested()) {
        {
            std::unique_lock<std::mutex> lock(m);
            cv.wait_for(lock, stop, interval_, [] { return false; });
        }
        if (stop.stop_requested()) break;

        auto now = clock::now();
        auto current = counter_.load();
        emit(make_sample(current, total_, baseline_, previous, now - previous_time, now - started));
        previous = current;
        previous_time = now;

        if (current >= total_) {
            reached_.store(true, std::memory_order_release);
            return;
        }
    }

    // Stopped early: report completion the loop did not get to see
    auto current = counter_.load();
    if (current >= total_) {
        auto now = clock::now();
        emit(make_sample(current, total_, baseline_, previous, now - previous_time, now - started));
        reached_.store(true, std::memory_order_release);
    }
}

} // namespace ferry::core
