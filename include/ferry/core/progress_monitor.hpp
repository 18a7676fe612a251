// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/byte_counter.hpp>
#include <ferry/core/config.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <thread>

namespace ferry::core {

struct ProgressSample {
    std::uint64_t downloaded{0};
    std::uint64_t total{0};
    double instant_bps{0.0};   // since the previous sample
    double average_bps{0.0};   // this session only; resumed bytes excluded
    std::optional<std::chrono::seconds> eta;  // absent while average is 0
    std::chrono::duration<double> elapsed{0.0};
    double percent{0.0};
};

using ProgressCallback = std::function<void(const ProgressSample&)>;

// Build one sample from counter readings
[[nodiscard]] ProgressSample make_sample(std::uint64_t downloaded,
                                         std::uint64_t total,
                                         std::uint64_t baseline,
                                         std::uint64_t previous,
                                         std::chrono::duration<double> since_previous,
                                         std::chrono::duration<double> elapsed) noexcept;

// Periodic sampler of the shared byte counter on its own thread. Ends by
// itself once the counter reaches the total (after delivering that sample),
// or when stop() is called.
class ProgressMonitor {
public:
    ProgressMonitor(const ByteCounter& counter,
                    std::uint64_t total,
                    std::chrono::milliseconds interval,
                    ProgressCallback callback);
    ~ProgressMonitor();

    // Non-copyable, non-movable (owns a running thread)
    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    // `baseline` bytes were already held before this session started
    void start(std::uint64_t baseline);

    // Stop and join. A final sample is delivered if the total was reached
    // and not yet reported.
    void stop() noexcept;

    [[nodiscard]] bool running() const noexcept { return thread_.joinable(); }
    [[nodiscard]] bool reached_total() const noexcept { return reached_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint32_t samples() const noexcept { return samples_.load(std::memory_order_acquire); }

private:
    void loop(std::stop_token stop) noexcept;
    void emit(const ProgressSample& sample) noexcept;

    const ByteCounter& counter_;
    std::uint64_t total_;
    std::chrono::milliseconds interval_;
    ProgressCallback callback_;
    std::uint64_t baseline_{0};

    std::atomic<bool> reached_{false};
    std::atomic<std::uint32_t> samples_{0};
    std::jthread thread_;
};

} // namespace ferry::core
