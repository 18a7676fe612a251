// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/core/session_manifest.hpp>
#include <ferry/disk/error.hpp>
#include <ferry/disk/file_writer.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <vector>

namespace ferry::disk {

class PartStore;

// Exclusive write handle for one part. Destroying it without finalize()
// discards everything written through it.
class PartWriter {
public:
    virtual ~PartWriter() = default;

    PartWriter(const PartWriter&) = delete;
    PartWriter& operator=(const PartWriter&) = delete;

    [[nodiscard]] virtual std::error_code write(std::span<const std::byte> data) noexcept = 0;
    [[nodiscard]] virtual std::uint64_t written() const noexcept = 0;
    [[nodiscard]] std::uint32_t index() const noexcept { return index_; }

protected:
    explicit PartWriter(std::uint32_t index) noexcept : index_(index) {}

private:
    std::uint32_t index_;
};

using PartSink = std::function<std::error_code(std::span<const std::byte>)>;

// Segment index -> committed byte blob. Only finalized parts are visible to
// exists(), size_of() and read(); that is what makes a crash mid-write safe
// to resume from.
class PartStore {
public:
    virtual ~PartStore() = default;

    // Bind the namespace to a session; parts left by a different session
    // are discarded
    [[nodiscard]] virtual std::error_code prepare(const core::SessionManifest& manifest) noexcept = 0;

    // Fails with writer_busy while another handle for the index is live
    [[nodiscard]] virtual std::expected<std::unique_ptr<PartWriter>, std::error_code>
    open_for_write(std::uint32_t index) noexcept = 0;

    // Commit the writer's bytes; returns the committed size
    [[nodiscard]] virtual std::expected<std::uint64_t, std::error_code>
    finalize(std::unique_ptr<PartWriter> writer) noexcept = 0;

    [[nodiscard]] virtual std::optional<std::uint64_t> size_of(std::uint32_t index) const noexcept = 0;

    [[nodiscard]] bool exists(std::uint32_t index) const noexcept { return size_of(index).has_value(); }

    // Stream a committed part in chunks of at most chunk_size bytes
    [[nodiscard]] virtual std::error_code
    read(std::uint32_t index, const PartSink& sink, std::size_t chunk_size) const noexcept = 0;

    [[nodiscard]] virtual std::error_code remove(std::uint32_t index) noexcept = 0;

    // Drop every part and the manifest
    [[nodiscard]] virtual std::error_code clear() noexcept = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

//=============================================================================
// DiskPartStore
//=============================================================================

// <root>/part_00000 ... plus <root>/session.json. In-progress writes live in
// part_NNNNN.tmp until finalize() renames them.
class DiskPartStore final : public PartStore {
public:
    explicit DiskPartStore(std::filesystem::path root);

    [[nodiscard]] std::error_code prepare(const core::SessionManifest& manifest) noexcept override;

    [[nodiscard]] std::expected<std::unique_ptr<PartWriter>, std::error_code>
    open_for_write(std::uint32_t index) noexcept override;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    finalize(std::unique_ptr<PartWriter> writer) noexcept override;

    [[nodiscard]] std::optional<std::uint64_t> size_of(std::uint32_t index) const noexcept override;

    [[nodiscard]] std::error_code
    read(std::uint32_t index, const PartSink& sink, std::size_t chunk_size) const noexcept override;

    [[nodiscard]] std::error_code remove(std::uint32_t index) noexcept override;
    [[nodiscard]] std::error_code clear() noexcept override;

    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] std::filesystem::path part_path(std::uint32_t index) const;
    [[nodiscard]] std::filesystem::path manifest_path() const;

    // Parts directory for a destination file: "<destination>.parts"
    [[nodiscard]] static std::filesystem::path parts_dir_for(const std::filesystem::path& destination);

private:
    friend class DiskPartWriter;

    void release(std::uint32_t index) noexcept;
    [[nodiscard]] std::error_code remove_parts() noexcept;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::set<std::uint32_t> writing_;
};

//=============================================================================
// MemoryPartStore
//=============================================================================

// Keeps parts in RAM; used for small objects and in tests
class MemoryPartStore final : public PartStore {
public:
    MemoryPartStore() = default;

    [[nodiscard]] std::error_code prepare(const core::SessionManifest& manifest) noexcept override;

    [[nodiscard]] std::expected<std::unique_ptr<PartWriter>, std::error_code>
    open_for_write(std::uint32_t index) noexcept override;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    finalize(std::unique_ptr<PartWriter> writer) noexcept override;

    [[nodiscard]] std::optional<std::uint64_t> size_of(std::uint32_t index) const noexcept override;

    [[nodiscard]] std::error_code
    read(std::uint32_t index, const PartSink& sink, std::size_t chunk_size) const noexcept override;

    [[nodiscard]] std::error_code remove(std::uint32_t index) noexcept override;
    [[nodiscard]] std::error_code clear() noexcept override;

    [[nodiscard]] std::string describe() const override { return "memory"; }

    [[nodiscard]] std::size_t part_count() const noexcept;

private:
    friend class MemoryPartWriter;

    void release(std::uint32_t index) noexcept;

    mutable std::mutex mutex_;
    std::optional<core::SessionManifest> manifest_;
    std::map<std::uint32_t, std::vector<std::byte>> parts_;
    std::set<std::uint32_t> writing_;
};

} // namespace ferry::disk
