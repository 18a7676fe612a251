// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/download_engine.hpp>
#include <ferry/core/merger.hpp>
#include <ferry/core/range_fetcher.hpp>
#include <ferry/core/scheduler.hpp>
#include <ferry/core/session_manifest.hpp>
#include <spdlog/spdlog.h>

namespace ferry::core {

namespace fs = std::filesystem;

const char* to_string(DownloadState s) noexcept {
    switch (s) {
        case DownloadState::idle:        return "idle";
        case DownloadState::resolving:   return "resolving";
        case DownloadState::planning:    return "planning";
        case DownloadState::downloading: return "downloading";
        case DownloadState::merging:     return "merging";
        case DownloadState::completed:   return "completed";
        case DownloadState::failed:      return "failed";
        case DownloadState::cancelled:   return "cancelled";
    }
    return "unknown";
}

//=============================================================================
// DownloadEngine
//=============================================================================

DownloadEngine::DownloadEngine(ObjectCatalog& catalog, Transport& transport, TransferConfig config)
    : catalog_(catalog)
    , transport_(transport)
    , config_(std::move(config)) {}

DownloadEngine::~DownloadEngine() = default;

std::expected<RemoteObject, std::error_code>
DownloadEngine::resolve(std::string_view id) noexcept {
    return catalog_.resolve(id);
}

fs::path DownloadEngine::destination_for(const RemoteObject& object) const {
    if (!output_path_.empty()) {
        return output_path_;
    }
    return fs::path(config_.output_dir) / object.name;
}

std::unique_ptr<disk::PartStore>
DownloadEngine::make_store(const RemoteObject& object, const fs::path& destination) const {
    if (config_.memory_threshold > 0 && object.total_size <= config_.memory_threshold) {
        spdlog::debug("staging {} bytes in memory", object.total_size);
        return std::make_unique<disk::MemoryPartStore>();
    }
    return std::make_unique<disk::DiskPartStore>(disk::DiskPartStore::parts_dir_for(destination));
}

std::uint32_t DownloadEngine::scan_resumable(SegmentList& segments, disk::PartStore& store) noexcept {
    std::uint32_t reused = 0;
    for (auto& seg : segments) {
        auto size = store.size_of(seg->index());
        if (!size) continue;

        if (seg->mark_resumed(*size)) {
            ++reused;
            continue;
        }

        // Committed but wrong length: refetch from scratch
        spdlog::debug("part {} holds {} of {} bytes, discarding", seg->index(), *size, seg->expected_size());
        if (auto ec = store.remove(seg->index())) {
            spdlog::warn("part {}: {}", seg->index(), ec.message());
        }
    }
    return reused;
}

std::error_code DownloadEngine::fail(std::error_code ec, disk::PartStore* store) noexcept {
    state_.store(ec == DownloadErrc::cancelled ? DownloadState::cancelled : DownloadState::failed,
                 std::memory_order_release);

    if (store) {
        if (config_.keep_parts_on_failure) {
            spdlog::info("partial progress kept in {}", store->describe());
        } else if (auto clear_ec = store->clear()) {
            spdlog::warn("could not remove parts in {}: {}", store->describe(), clear_ec.message());
        }
    }
    return ec;
}

std::expected<DownloadResult, std::error_code>
DownloadEngine::run(std::string_view id, std::stop_token stop) noexcept {
    try {
        std::stop_token cancel;
        {
            std::lock_guard<std::mutex> lock(cancel_mutex_);
            cancel_ = std::stop_source{};
            cancel = cancel_.get_token();
        }
        std::stop_callback forward(stop, [this] { this->cancel(); });

        counter_.reset();

        // 1. Resolve
        state_.store(DownloadState::resolving, std::memory_order_release);
        auto object = catalog_.resolve(id);
        if (!object) {
            return std::unexpected(fail(object.error(), nullptr));
        }
        if (cancel.stop_requested()) {
            return std::unexpected(fail(make_error_code(DownloadErrc::cancelled), nullptr));
        }

        // 2. Plan
        state_.store(DownloadState::planning, std::memory_order_release);
        auto total = static_cast<std::int64_t>(object->total_size);
        auto plan = object->supports_ranges
            ? plan_segments(total, static_cast<std::int64_t>(config_.segment_size), config_.workers)
            : plan_single_segment(total);
        if (!plan) {
            return std::unexpected(fail(plan.error(), nullptr));
        }
        if (!object->supports_ranges) {
            spdlog::warn("{}: server does not accept byte ranges, using one connection", object->name);
        }

        // 3. Part store and resume scan
        const auto destination = destination_for(*object);
        auto store = make_store(*object, destination);

        SessionManifest manifest;
        manifest.object_id = object->id;
        manifest.name = object->name;
        manifest.total_size = plan->total_size;
        manifest.segment_size = plan->segment_size;
        manifest.segment_count = static_cast<std::uint32_t>(plan->segments.size());
        if (auto ec = store->prepare(manifest)) {
            spdlog::error("part store {}: {}", store->describe(), ec.message());
            return std::unexpected(fail(ec, nullptr));
        }

        auto reused = scan_resumable(plan->segments, *store);
        const auto baseline = done_bytes(plan->segments);
        counter_.reset(baseline);
        if (reused > 0) {
            spdlog::info("resuming {}: {}/{} parts present ({} bytes)",
                         object->name, reused, plan->segments.size(), baseline);
        }
        spdlog::info("{}: {} bytes in {} segments, {} workers",
                     object->name, plan->total_size, plan->segments.size(), plan->workers);

        // 4. Fetch, with progress sampled alongside
        state_.store(DownloadState::downloading, std::memory_order_release);

        FetchOptions fetch_options;
        fetch_options.chunk_size = config_.chunk_size;
        fetch_options.request_timeout = config_.request_timeout;
        fetch_options.ranged = object->supports_ranges;
        RangeFetcher fetcher(transport_, *store, counter_, object->url, fetch_options);

        SchedulerOptions sched_options;
        sched_options.workers = plan->workers;
        sched_options.max_retries = config_.max_retries;
        sched_options.retry_backoff = config_.retry_backoff;
        sched_options.retry_backoff_max = config_.retry_backoff_max;
        Scheduler scheduler(fetcher, sched_options);

        ProgressCallback cb;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            cb = callback_;
        }
        ProgressMonitor monitor(counter_, plan->total_size, config_.progress_interval, std::move(cb));
        monitor.start(baseline);

        auto sched_ec = scheduler.run(plan->segments, cancel);
        monitor.stop();

        if (sched_ec) {
            if (sched_ec == DownloadErrc::retries_exhausted) {
                spdlog::error("{}: last segment error: {}",
                              object->name, scheduler.last_segment_error().message());
            }
            return std::unexpected(fail(sched_ec, store.get()));
        }

        // 5. Merge
        state_.store(DownloadState::merging, std::memory_order_release);
        Merger merger(*store, config_.chunk_size);
        auto merged = merger.merge(plan->segments, plan->total_size, destination);
        if (!merged) {
            return std::unexpected(fail(merged.error(), store.get()));
        }

        state_.store(DownloadState::completed, std::memory_order_release);

        DownloadResult result;
        result.path = destination;
        result.size = *merged;
        result.name = object->name;
        result.segments = static_cast<std::uint32_t>(plan->segments.size());
        result.resumed_segments = reused;
        return result;
    } catch (const std::system_error& e) {
        spdlog::error("download {}: {}", id, e.what());
        return std::unexpected(fail(e.code(), nullptr));
    } catch (const std::bad_alloc&) {
        spdlog::error("download {}: out of memory", id);
        return std::unexpected(fail(make_error_code(disk::DiskErrc::write_error), nullptr));
    }
}

} // namespace ferry::core
