// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/merger.hpp>
#include <ferry/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <vector>

namespace ferry::core {

namespace fs = std::filesystem;

Merger::Merger(disk::PartStore& store, std::size_t chunk_size) noexcept
    : store_(store)
    , chunk_size_(chunk_size) {}

fs::path Merger::partial_path(const fs::path& destination) {
    auto p = destination;
    p += ".partial";
    return p;
}

std::expected<std::uint64_t, std::error_code>
Merger::merge(const SegmentList& segments,
              std::uint64_t total_size,
              const fs::path& destination) noexcept {
    if (!all_done(segments)) {
        spdlog::error("merge: {} of {} segments not done",
                      std::count_if(segments.begin(), segments.end(),
                                    [](const auto& s) { return !s->is_done(); }),
                      segments.size());
        return std::unexpected(make_error_code(DownloadErrc::incomplete_segments));
    }

    try {
        std::vector<const Segment*> ordered;
        ordered.reserve(segments.size());
        for (const auto& s : segments) ordered.push_back(s.get());
        std::sort(ordered.begin(), ordered.end(),
                  [](const Segment* a, const Segment* b) { return a->index() < b->index(); });

        std::error_code ec;
        if (destination.has_parent_path()) {
            fs::create_directories(destination.parent_path(), ec);
            if (ec) {
                spdlog::error("merge: cannot create {}: {}", destination.parent_path().string(), ec.message());
                return std::unexpected(make_error_code(DownloadErrc::merge_failed));
            }
        }

        const auto partial = partial_path(destination);
        auto abandon = [&](std::string_view what, const std::error_code& cause)
            -> std::expected<std::uint64_t, std::error_code> {
            spdlog::error("merge: {}: {}", what, cause.message());
            std::error_code rm;
            fs::remove(partial, rm);
            return std::unexpected(make_error_code(DownloadErrc::merge_failed));
        };

        disk::FileWriter out;
        if (auto open_ec = out.open(partial)) {
            return abandon(partial.string(), open_ec);
        }

        for (const auto* seg : ordered) {
            const auto before = out.bytes_written();
            auto read_ec = store_.read(seg->index(), [&out](std::span<const std::byte> chunk) {
                return out.write(chunk.data(), chunk.size());
            }, chunk_size_);
            if (read_ec) {
                out.close();
                return abandon(std::format("part {}", seg->index()), read_ec);
            }
            if (out.bytes_written() - before != seg->expected_size()) {
                out.close();
                return abandon(std::format("part {} has {} bytes, expected {}", seg->index(),
                                           out.bytes_written() - before, seg->expected_size()),
                               make_error_code(DownloadErrc::size_mismatch));
            }
        }

        if (out.bytes_written() != total_size) {
            out.close();
            return abandon(std::format("assembled {} of {} bytes", out.bytes_written(), total_size),
                           make_error_code(DownloadErrc::size_mismatch));
        }
        if (auto sync_ec = out.sync()) {
            out.close();
            return abandon("sync", sync_ec);
        }
        out.close();

        fs::rename(partial, destination, ec);
        if (ec) {
            return abandon(std::format("rename to {}", destination.string()), ec);
        }

        if (auto clear_ec = store_.clear()) {
            spdlog::warn("merge: could not remove parts in {}: {}", store_.describe(), clear_ec.message());
        }

        spdlog::info("merged {} parts into {} ({} bytes)", ordered.size(), destination.string(), total_size);
        return total_size;
    } catch (const std::exception& e) {
        spdlog::error("merge: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::merge_failed));
    }
}

} // namespace ferry::core
