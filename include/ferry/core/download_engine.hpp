// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/byte_counter.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/error.hpp>
#include <ferry/core/progress_monitor.hpp>
#include <ferry/core/remote_object.hpp>
#include <ferry/core/segment.hpp>
#include <ferry/core/transport.hpp>
#include <ferry/disk/part_store.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>

namespace ferry::core {

// Overall session state
enum class DownloadState : std::uint8_t {
    idle,         // Not started
    resolving,    // Fetching object metadata
    planning,     // Segmenting and scanning for resumable parts
    downloading,  // Workers running
    merging,      // Assembling the final artifact
    completed,    // All done
    failed,       // Failed with error
    cancelled,    // Cancelled by caller
};

[[nodiscard]] const char* to_string(DownloadState s) noexcept;

// The finished artifact, handed to whatever consumes it next
struct DownloadResult {
    std::filesystem::path path;
    std::uint64_t size{0};
    std::string name;
    std::uint32_t segments{0};
    std::uint32_t resumed_segments{0};  // reused from a previous session
};

// One transfer session: resolve, plan, resume scan, parallel fetch with
// progress sampling, ordered merge. Owns its segments and part store for the
// duration of run().
class DownloadEngine {
public:
    DownloadEngine(ObjectCatalog& catalog, Transport& transport, TransferConfig config);
    ~DownloadEngine();

    // Non-copyable, non-movable (atomic members can't be moved)
    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;
    DownloadEngine(DownloadEngine&&) noexcept = delete;
    DownloadEngine& operator=(DownloadEngine&&) noexcept = delete;

    // Explicit destination; defaults to <output_dir>/<object name>
    void output_path(std::filesystem::path path) noexcept { output_path_ = std::move(path); }
    [[nodiscard]] const std::filesystem::path& output_path() const noexcept { return output_path_; }

    // Progress samples are delivered on the monitor thread
    void callback(ProgressCallback cb) noexcept {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(cb);
    }

    [[nodiscard]] const TransferConfig& config() const noexcept { return config_; }

    // Metadata only
    [[nodiscard]] std::expected<RemoteObject, std::error_code> resolve(std::string_view id) noexcept;

    // Blocks until the artifact is merged or the session fails. Parts are kept
    // on failure unless the config says otherwise.
    [[nodiscard]] std::expected<DownloadResult, std::error_code>
    run(std::string_view id, std::stop_token stop = {}) noexcept;

    // Abort a run() in progress from another thread. Each run() starts with
    // a fresh cancellation state.
    void cancel() noexcept {
        std::lock_guard<std::mutex> lock(cancel_mutex_);
        cancel_.request_stop();
    }

    [[nodiscard]] DownloadState state() const noexcept { return state_.load(std::memory_order_acquire); }

    // Shared counter of bytes held for the current run
    [[nodiscard]] const ByteCounter& counter() const noexcept { return counter_; }

    // Destination used for an object when no explicit output path is set
    [[nodiscard]] std::filesystem::path destination_for(const RemoteObject& object) const;

private:
    [[nodiscard]] std::unique_ptr<disk::PartStore>
    make_store(const RemoteObject& object, const std::filesystem::path& destination) const;

    // Mark segments whose committed part is already complete; returns the
    // number reused
    [[nodiscard]] std::uint32_t scan_resumable(SegmentList& segments, disk::PartStore& store) noexcept;

    [[nodiscard]] std::error_code fail(std::error_code ec, disk::PartStore* store) noexcept;

    ObjectCatalog& catalog_;
    Transport& transport_;
    TransferConfig config_;
    std::filesystem::path output_path_;

    std::atomic<DownloadState> state_{DownloadState::idle};
    ByteCounter counter_;
    std::stop_source cancel_;
    std::mutex cancel_mutex_;  // Protects cancel_ replacement

    ProgressCallback callback_;
    std::mutex callback_mutex_;  // Protects callback_ access
};

} // namespace ferry::core
