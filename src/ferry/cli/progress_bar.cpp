// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/cli/progress_bar.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

namespace ferry::cli {

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::string_view label)
    : ProgressBar(label, std::cout) {}

ProgressBar::ProgressBar(std::string_view label, std::ostream& out)
    : out_(out)
    , label_(label) {}

std::string ProgressBar::render(const core::ProgressSample& sample) const {
    double percent = std::clamp(sample.percent, 0.0, 100.0);

    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);
    line += std::format(" {:5.1f}%", percent);
    line += std::format(" ({}/{})", format_bytes(sample.downloaded), format_bytes(sample.total));
    line += " | ";
    line += format_speed(sample.instant_bps);
    line += " | avg ";
    line += format_speed(sample.average_bps);
    if (sample.eta) {
        line += " | ETA ";
        line += format_eta(*sample.eta);
    }
    return line;
}

void ProgressBar::update(const core::ProgressSample& sample) noexcept {
    try {
        auto line = render(sample);

        std::lock_guard<std::mutex> lock(mutex_);
        // Pad over the remains of a longer previous line
        auto width = line.size();
        if (width < last_width_) {
            line.append(last_width_ - width, ' ');
        }
        last_width_ = width;
        drawn_ = true;
        out_ << '\r' << line << std::flush;
    } catch (const std::exception& e) {
        spdlog::debug("progress draw skipped: {}", e.what());
    }
}

void ProgressBar::finish() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (drawn_) {
        out_ << std::endl;
        drawn_ = false;
        last_width_ = 0;
    }
}

void ProgressBar::clear() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (drawn_) {
        out_ << '\r' << std::string(last_width_, ' ') << '\r' << std::flush;
        drawn_ = false;
        last_width_ = 0;
    }
}

std::string ProgressBar::render_bar(double percent) {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < bar_width) {
        bar += '>';
        bar.append(static_cast<std::size_t>(bar_width - filled - 1), ' ');
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(double bps) {
    constexpr double KB = 1024.0;
    constexpr double MB = 1024.0 * KB;
    constexpr double GB = 1024.0 * MB;

    if (bps >= GB) return std::format("{:.1f} GB/s", bps / GB);
    if (bps >= MB) return std::format("{:.1f} MB/s", bps / MB);
    if (bps >= KB) return std::format("{:.1f} KB/s", bps / KB);
    return std::format("{:.0f} B/s", bps);
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    auto d = static_cast<double>(bytes);
    if (bytes >= TB) return std::format("{:.2f} TB", d / TB);
    if (bytes >= GB) return std::format("{:.2f} GB", d / GB);
    if (bytes >= MB) return std::format("{:.1f} MB", d / MB);
    if (bytes >= KB) return std::format("{:.0f} KB", d / KB);
    return std::format("{} B", bytes);
}

std::string ProgressBar::format_eta(std::chrono::seconds eta) {
    auto total = std::max<std::int64_t>(eta.count(), 0);
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto secs = total % 60;

    if (hours > 0) {
        return std::format("{}:{:02d}:{:02d}", hours, minutes, secs);
    }
    return std::format("{:02d}:{:02d}", minutes, secs);
}

} // namespace ferry::cli
