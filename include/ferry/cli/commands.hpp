// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/download_engine.hpp>
#include <csignal>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ferry::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments; unset optionals keep the config file's values
struct CliArgs {
    std::vector<std::string> ids;
    std::string output_file;
    std::string output_dir;
    std::string config_file;
    std::optional<std::uint32_t> workers;
    std::optional<std::uint64_t> segment_mb;
    std::optional<std::uint32_t> retries;
    std::optional<std::uint32_t> timeout_sec;
    std::optional<std::uint64_t> memory_threshold_mb;
    std::optional<std::string> token;
    std::optional<std::string> url_template;
    std::vector<std::pair<std::string, std::string>> headers;
    bool clean{false};
    bool list_only{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;  // first usage error, empty when the line parsed
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Defaults, then the config file, then FERRY_TOKEN, then flags
[[nodiscard]] std::expected<core::TransferConfig, std::error_code>
build_config(const CliArgs& args) noexcept;

// spdlog level from the config, raised by -V and lowered by -q
void configure_logging(const core::TransferConfig& config, bool verbose, bool quiet) noexcept;

// Set by SIGINT/SIGTERM; polled to cancel the running transfer
extern volatile std::sig_atomic_t stop_requested;

void install_signal_handlers() noexcept;

// Download a single object
[[nodiscard]] CliResult download(const std::string& id,
                                 const std::string& output,
                                 const core::TransferConfig& config,
                                 bool quiet) noexcept;

// Resolve and print object metadata without downloading
[[nodiscard]] CliResult info(const std::string& id, const core::TransferConfig& config) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace ferry::cli
