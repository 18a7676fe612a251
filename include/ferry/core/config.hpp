// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/error.hpp>
#include <cstdint>
#include <chrono>
#include <expected>
#include <map>
#include <string>
#include <string_view>

namespace ferry::core {

constexpr std::uint64_t MIB = 1024 * 1024;

constexpr std::uint64_t DEFAULT_SEGMENT_SIZE = 64 * MIB;           // 64 MB parts
constexpr std::uint32_t DEFAULT_WORKERS = 8;
constexpr std::uint32_t MAX_WORKERS = 64;
constexpr std::size_t DEFAULT_CHUNK_SIZE = 1 * MIB;                // write granularity

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t REQUEST_TIMEOUT_SEC = 300;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 30;
constexpr std::uint32_t RETRY_COUNT = 3;

constexpr std::chrono::milliseconds RETRY_BACKOFF_BASE{1000};
constexpr std::chrono::milliseconds RETRY_BACKOFF_MAX{60'000};
constexpr std::chrono::milliseconds PROGRESS_INTERVAL{1000};

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr std::string_view ENV_TOKEN = "FERRY_TOKEN";

// Runtime configuration for a transfer session
struct TransferConfig {
    std::uint32_t workers{DEFAULT_WORKERS};
    std::uint64_t segment_size{DEFAULT_SEGMENT_SIZE};
    std::size_t chunk_size{DEFAULT_CHUNK_SIZE};
    std::uint32_t max_retries{RETRY_COUNT};
    std::chrono::milliseconds retry_backoff{RETRY_BACKOFF_BASE};
    std::chrono::milliseconds retry_backoff_max{RETRY_BACKOFF_MAX};
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds request_timeout{REQUEST_TIMEOUT_SEC};
    std::chrono::milliseconds progress_interval{PROGRESS_INTERVAL};

    // Objects at or below this size are staged in memory (0 = always disk)
    std::uint64_t memory_threshold{0};

    std::string output_dir{"downloads"};
    bool keep_parts_on_failure{true};

    // "{id}" is replaced with the object id; the default treats ids as URLs
    std::string url_template{"{id}"};
    std::string bearer_token;
    std::map<std::string, std::string> headers;
    std::string log_level{"info"};

    // Reject values the planner and scheduler cannot work with
    [[nodiscard]] std::error_code validate() const noexcept;
};

// Load a JSON configuration file; missing keys keep their defaults
[[nodiscard]] std::expected<TransferConfig, std::error_code>
load_config(std::string_view path) noexcept;

// Parse configuration from a JSON document
[[nodiscard]] std::expected<TransferConfig, std::error_code>
parse_config(std::string_view json) noexcept;

// Expand the catalog URL template for an object id
// value * unit, or invalid_config when the product does not fit in 64 bits
[[nodiscard]] std::expected<std::uint64_t, std::error_code>
to_bytes(std::uint64_t value, std::uint64_t unit) noexcept;

[[nodiscard]] std::string expand_url_template(std::string_view tmpl, std::string_view id);

} // namespace ferry::core
