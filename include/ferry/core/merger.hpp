// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/config.hpp>
#include <ferry/core/segment.hpp>
#include <ferry/disk/part_store.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace ferry::core {

// Assembles committed parts into the final artifact. Output goes to
// "<dest>.partial" and is renamed over dest only once it holds exactly
// total_size bytes, so dest is never left truncated.
class Merger {
public:
    explicit Merger(disk::PartStore& store, std::size_t chunk_size = DEFAULT_CHUNK_SIZE) noexcept;

    // Requires every segment done. Returns bytes written. Parts are cleared
    // afterwards; a cleanup failure is only logged.
    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    merge(const SegmentList& segments,
          std::uint64_t total_size,
          const std::filesystem::path& destination) noexcept;

    [[nodiscard]] static std::filesystem::path partial_path(const std::filesystem::path& destination);

private:
    disk::PartStore& store_;
    std::size_t chunk_size_;
};

} // namespace ferry::core
