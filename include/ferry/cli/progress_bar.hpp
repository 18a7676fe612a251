// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/progress_monitor.hpp>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

namespace ferry::cli {

// Single-line progress display: percent, current and average speed, ETA
class ProgressBar {
public:
    explicit ProgressBar(std::string_view label = {});
    ProgressBar(std::string_view label, std::ostream& out);

    // Redraw from a monitor sample (called on the monitor thread)
    void update(const core::ProgressSample& sample) noexcept;

    // Terminate the line after the last draw
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) noexcept { label_ = l; }

    // The line update() would draw, without the carriage return
    [[nodiscard]] std::string render(const core::ProgressSample& sample) const;

    [[nodiscard]] static std::string format_speed(double bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    // mm:ss, or h:mm:ss past the hour
    [[nodiscard]] static std::string format_eta(std::chrono::seconds eta);

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::ostream& out_;
    std::string label_;
    std::size_t last_width_{0};
    bool drawn_{false};
    std::mutex mutex_;
};

} // namespace ferry::cli
