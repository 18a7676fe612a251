// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/config.hpp>
#include <ferry/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <limits>
#include <sstream>

namespace ferry::core {

namespace {

template<typename T>
void read_value(const nlohmann::json& j, const char* key, T& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

} // namespace

std::error_code TransferConfig::validate() const noexcept {
    if (workers == 0 || workers > MAX_WORKERS) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (segment_size == 0) {
        return make_error_code(DownloadErrc::invalid_segment_size);
    }
    if (chunk_size == 0) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (retry_backoff.count() < 0 || retry_backoff_max < retry_backoff) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (progress_interval.count() <= 0) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    if (url_template.find("{id}") == std::string::npos) {
        return make_error_code(DownloadErrc::invalid_config);
    }
    return {};
}

std::expected<std::uint64_t, std::error_code>
to_bytes(std::uint64_t value, std::uint64_t unit) noexcept {
    if (unit != 0 && value > std::numeric_limits<std::uint64_t>::max() / unit) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
    return value * unit;
}

std::expected<TransferConfig, std::error_code>
parse_config(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_config));
        }

        TransferConfig cfg;
        read_value(j, "workers", cfg.workers);
        read_value(j, "max_retries", cfg.max_retries);
        read_value(j, "output_dir", cfg.output_dir);
        read_value(j, "keep_parts_on_failure", cfg.keep_parts_on_failure);
        read_value(j, "url_template", cfg.url_template);
        read_value(j, "bearer_token", cfg.bearer_token);
        read_value(j, "headers", cfg.headers);
        read_value(j, "log_level", cfg.log_level);

        // Sizes are expressed in human units in the file
        if (auto it = j.find("segment_size_mb"); it != j.end()) {
            auto bytes = to_bytes(it->get<std::uint64_t>(), MIB);
            if (!bytes) return std::unexpected(bytes.error());
            cfg.segment_size = *bytes;
        }
        if (auto it = j.find("chunk_size_kb"); it != j.end()) {
            auto bytes = to_bytes(it->get<std::uint64_t>(), 1024);
            if (!bytes || *bytes > std::numeric_limits<std::size_t>::max()) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_config));
            }
            cfg.chunk_size = static_cast<std::size_t>(*bytes);
        }
        if (auto it = j.find("memory_threshold_mb"); it != j.end()) {
            auto bytes = to_bytes(it->get<std::uint64_t>(), MIB);
            if (!bytes) return std::unexpected(bytes.error());
            cfg.memory_threshold = *bytes;
        }
        if (auto it = j.find("retry_backoff_ms"); it != j.end()) {
            cfg.retry_backoff = std::chrono::milliseconds{it->get<std::int64_t>()};
        }
        if (auto it = j.find("retry_backoff_max_ms"); it != j.end()) {
            cfg.retry_backoff_max = std::chrono::milliseconds{it->get<std::int64_t>()};
        }
        if (auto it = j.find("connect_timeout_sec"); it != j.end()) {
            cfg.connect_timeout = std::chrono::seconds{it->get<std::int64_t>()};
        }
        if (auto it = j.find("request_timeout_sec"); it != j.end()) {
            cfg.request_timeout = std::chrono::seconds{it->get<std::int64_t>()};
        }
        if (auto it = j.find("progress_interval_ms"); it != j.end()) {
            cfg.progress_interval = std::chrono::milliseconds{it->get<std::int64_t>()};
        }

        if (auto ec = cfg.validate()) {
            return std::unexpected(ec);
        }
        return cfg;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("config: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::invalid_config));
    }
}

std::expected<TransferConfig, std::error_code>
load_config(std::string_view path) noexcept {
    std::ifstream file{std::string(path)};
    if (!file) {
        spdlog::error("config: cannot open '{}'", path);
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_config(ss.str());
}

std::string expand_url_template(std::string_view tmpl, std::string_view id) {
    std::string out;
    out.reserve(tmpl.size() + id.size());
    constexpr std::string_view placeholder = "{id}";

    std::size_t pos = 0;
    while (true) {
        auto hit = tmpl.find(placeholder, pos);
        if (hit == std::string_view::npos) {
            out.append(tmpl.substr(pos));
            break;
        }
        out.append(tmpl.substr(pos, hit - pos));
        out.append(id);
        pos = hit + placeholder.size();
    }
    return out;
}

} // namespace ferry::core
