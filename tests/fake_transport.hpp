// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/transport.hpp>
#include <algorithm>
#include <expected>
#include <iterator>
#include <optional>
#include <span>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace ferry::test {

// Deterministic, non-repeating-looking payload
inline std::vector<std::byte> make_payload(std::size_t size, std::uint32_t seed = 1) {
    std::vector<std::byte> data(size);
    std::uint32_t x = seed * 2654435761u + 1;
    for (std::size_t i = 0; i < size; ++i) {
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        data[i] = static_cast<std::byte>(x & 0xff);
    }
    return data;
}

inline std::vector<std::byte> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<std::byte> out(raw.size());
    std::transform(raw.begin(), raw.end(), out.begin(), [](char c) { return static_cast<std::byte>(c); });
    return out;
}

inline void write_file(const std::filesystem::path& path, std::span<const std::byte> data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

// Scratch directory removed on scope exit
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / std::format("ferry-test-{:08x}{:08x}", rd(), rd());
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path operator/(std::string_view name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

// In-memory HTTP server for one object. Behaves like HttpSession: on_headers
// sees every final response, non-2xx statuses become errors, handler errors
// take precedence.
class FakeTransport final : public core::Transport {
public:
    enum class Fault {
        network,     // drop the connection halfway through the body
        truncate,    // end the body early but report success
        server,      // 503 before any body
        ignore_range // answer a ranged GET with 200 and the whole object
    };

    explicit FakeTransport(std::vector<std::byte> content, std::string url = "https://files.test/data/object.bin")
        : content_(std::move(content))
        , url_(std::move(url)) {}

    // Knobs; set before the transfer starts
    bool supports_ranges{true};
    bool head_reports_length{true};
    bool head_supported{true};
    bool head_advertises_ranges{true};
    std::int32_t head_status{200};
    std::string content_disposition;
    std::size_t wire_chunk{4096};
    std::chrono::microseconds chunk_delay{0};

    // Inject `count` faults into GETs whose range starts at `start`
    void fail(std::uint64_t start, Fault fault, std::uint32_t count = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        faults_[start] = {fault, count};
    }

    [[nodiscard]] std::uint32_t gets() const noexcept { return gets_.load(); }
    [[nodiscard]] std::uint32_t heads() const noexcept { return heads_.load(); }
    [[nodiscard]] std::uint32_t peak_concurrency() const noexcept { return peak_.load(); }
    [[nodiscard]] const std::vector<std::byte>& content() const noexcept { return content_; }
    [[nodiscard]] const std::string& url() const noexcept { return url_; }

    std::vector<std::string> requested_urls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return urls_;
    }

    std::expected<core::HttpResponse, std::error_code>
    head(const std::string& url) noexcept override {
        heads_.fetch_add(1);
        record(url);
        if (!head_supported) {
            return std::unexpected(core::status_to_error(405));
        }
        if (auto ec = core::status_to_error(head_status)) {
            return std::unexpected(ec);
        }

        core::HttpResponse r;
        r.status_code = 200;
        if (head_reports_length) {
            r.content_length = content_.size();
            r.headers["content-length"] = std::to_string(content_.size());
        }
        r.accepts_ranges = supports_ranges && head_advertises_ranges;
        if (r.accepts_ranges) r.headers["accept-ranges"] = "bytes";
        apply_disposition(r);
        return r;
    }

    std::expected<core::HttpResponse, std::error_code>
    get(const core::RangeRequest& request,
        const core::ResponseHandler& handler,
        std::stop_token stop) noexcept override {
        gets_.fetch_add(1);
        record(request.url);

        auto now = ++active_;
        auto peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {}
        struct Leave {
            std::atomic<std::uint32_t>& n;
            ~Leave() { --n; }
        } leave{active_};

        const std::uint64_t size = content_.size();
        std::uint64_t first = 0;
        std::uint64_t last = size == 0 ? 0 : size - 1;
        bool ranged = request.range.has_value() && supports_ranges;

        auto fault = take_fault(request.range ? request.range->first : 0);
        if (fault && *fault == Fault::ignore_range) ranged = false;

        core::HttpResponse r;
        if (fault && *fault == Fault::server) {
            r.status_code = 503;
        } else if (ranged) {
            first = request.range->first;
            if (first >= size) {
                r.status_code = 416;
                r.headers["content-range"] = std::format("bytes */{}", size);
            } else {
                last = std::min<std::uint64_t>(request.range->second, size - 1);
                r.status_code = 206;
                r.headers["content-range"] = std::format("bytes {}-{}/{}", first, last, size);
                r.content_length = last - first + 1;
                r.accepts_ranges = true;
            }
        } else {
            r.status_code = 200;
            r.content_length = size;
            r.accepts_ranges = supports_ranges;
        }
        apply_disposition(r);

        if (handler.on_headers) {
            if (auto ec = handler.on_headers(r)) return std::unexpected(ec);
        }
        if (auto ec = core::status_to_error(r.status_code)) {
            return std::unexpected(ec);
        }

        std::uint64_t body = size == 0 ? 0 : last - first + 1;
        std::uint64_t limit = body;
        if (fault && (*fault == Fault::network || *fault == Fault::truncate)) {
            limit = body / 2;
        }

        for (std::uint64_t off = 0; off < limit; ) {
            if (stop.stop_requested()) {
                return std::unexpected(make_error_code(core::DownloadErrc::cancelled));
            }
            auto n = std::min<std::uint64_t>(wire_chunk, limit - off);
            if (handler.on_data) {
                auto chunk = std::span<const std::byte>(content_.data() + first + off, n);
                if (auto ec = handler.on_data(chunk)) return std::unexpected(ec);
            }
            off += n;
            if (chunk_delay.count() > 0) std::this_thread::sleep_for(chunk_delay);
        }

        if (fault && *fault == Fault::network) {
            return std::unexpected(make_error_code(core::DownloadErrc::network_error));
        }
        return r;
    }

private:
    std::optional<Fault> take_fault(std::uint64_t start) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = faults_.find(start);
        if (it == faults_.end() || it->second.second == 0) return std::nullopt;
        --it->second.second;
        return it->second.first;
    }

    void record(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        urls_.push_back(url);
    }

    void apply_disposition(core::HttpResponse& r) const {
        if (content_disposition.empty()) return;
        r.headers["content-disposition"] = content_disposition;
        r.filename = core::parse_content_disposition(content_disposition);
    }

    std::vector<std::byte> content_;
    std::string url_;

    std::atomic<std::uint32_t> gets_{0};
    std::atomic<std::uint32_t> heads_{0};
    std::atomic<std::uint32_t> active_{0};
    std::atomic<std::uint32_t> peak_{0};

    mutable std::mutex mutex_;
    std::map<std::uint64_t, std::pair<Fault, std::uint32_t>> faults_;
    std::vector<std::string> urls_;
};

} // namespace ferry::test
