// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/disk/part_store.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <format>
#include <fstream>

namespace ferry::disk {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view PART_PREFIX = "part_";
constexpr std::string_view TMP_SUFFIX = ".tmp";
constexpr std::string_view MANIFEST_NAME = "session.json";

} // namespace

//=============================================================================
// DiskPartWriter
//=============================================================================

class DiskPartWriter final : public PartWriter {
public:
    DiskPartWriter(DiskPartStore& store, std::uint32_t index, FileWriter file) noexcept
        : PartWriter(index)
        , store_(store)
        , file_(std::move(file)) {}

    ~DiskPartWriter() override {
        if (!committed_) {
            auto tmp = file_.path();
            file_.close();
            std::error_code ec;
            fs::remove(tmp, ec);
        }
        store_.release(index());
    }

    std::error_code write(std::span<const std::byte> data) noexcept override {
        return file_.write(data.data(), data.size());
    }

    std::uint64_t written() const noexcept override { return file_.bytes_written(); }

    // fsync, close and rename into place
    std::error_code commit(const fs::path& final_path) noexcept {
        if (auto ec = file_.sync()) return ec;
        auto tmp = file_.path();
        file_.close();

        std::error_code ec;
        fs::rename(tmp, final_path, ec);
        if (ec) return ec;
        committed_ = true;
        return {};
    }

private:
    DiskPartStore& store_;
    FileWriter file_;
    bool committed_{false};
};

//=============================================================================
// DiskPartStore
//=============================================================================

DiskPartStore::DiskPartStore(fs::path root)
    : root_(std::move(root)) {}

fs::path DiskPartStore::parts_dir_for(const fs::path& destination) {
    auto dir = destination;
    dir += ".parts";
    return dir;
}

fs::path DiskPartStore::part_path(std::uint32_t index) const {
    return root_ / std::format("{}{:05d}", PART_PREFIX, index);
}

fs::path DiskPartStore::manifest_path() const {
    return root_ / MANIFEST_NAME;
}

std::string DiskPartStore::describe() const {
    return root_.string();
}

std::error_code DiskPartStore::prepare(const core::SessionManifest& manifest) noexcept {
    try {
        std::error_code ec;
        fs::create_directories(root_, ec);
        if (ec) return ec;

        auto existing = core::SessionManifest::load(manifest_path());
        if (existing) {
            if (!existing->matches(manifest)) {
                spdlog::warn("part store {}: belongs to a different session ({} bytes / {} per part), discarding",
                             root_.string(), existing->total_size, existing->segment_size);
                if (auto rm = remove_parts()) return rm;
            }
        } else if (existing.error() != make_error_code(DiskErrc::file_not_found)) {
            spdlog::warn("part store {}: unreadable manifest, discarding parts", root_.string());
            if (auto rm = remove_parts()) return rm;
        } else if (auto rm = remove_parts()) {
            // Parts without a manifest cannot be attributed to this object
            return rm;
        }

        return manifest.save(manifest_path());
    } catch (const std::exception& e) {
        spdlog::error("part store {}: {}", root_.string(), e.what());
        return make_error_code(DiskErrc::write_error);
    }
}

std::error_code DiskPartStore::remove_parts() noexcept {
    std::error_code ec;
    if (!fs::exists(root_, ec)) return {};

    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        auto name = it->path().filename().string();
        if (name.starts_with(PART_PREFIX)) {
            std::error_code rm;
            fs::remove(it->path(), rm);
            if (rm) return rm;
        }
    }
    return ec;
}

std::expected<std::unique_ptr<PartWriter>, std::error_code>
DiskPartStore::open_for_write(std::uint32_t index) noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!writing_.insert(index).second) {
            return std::unexpected(make_error_code(DiskErrc::writer_busy));
        }
    }

    try {
        auto tmp = part_path(index);
        tmp += TMP_SUFFIX;

        FileWriter file;
        if (auto ec = file.open(tmp)) {
            release(index);
            return std::unexpected(ec);
        }
        return std::make_unique<DiskPartWriter>(*this, index, std::move(file));
    } catch (const std::bad_alloc&) {
        release(index);
        return std::unexpected(make_error_code(DiskErrc::write_error));
    }
}

std::expected<std::uint64_t, std::error_code>
DiskPartStore::finalize(std::unique_ptr<PartWriter> writer) noexcept {
    auto* disk_writer = dynamic_cast<DiskPartWriter*>(writer.get());
    if (!disk_writer) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    try {
        auto index = writer->index();
        if (auto ec = disk_writer->commit(part_path(index))) {
            return std::unexpected(ec);
        }
        writer.reset();

        auto size = size_of(index);
        if (!size) {
            return std::unexpected(make_error_code(DiskErrc::not_committed));
        }
        return *size;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::write_error));
    }
}

std::optional<std::uint64_t> DiskPartStore::size_of(std::uint32_t index) const noexcept {
    try {
        std::error_code ec;
        auto size = fs::file_size(part_path(index), ec);
        if (ec) return std::nullopt;
        return static_cast<std::uint64_t>(size);
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

std::error_code DiskPartStore::read(std::uint32_t index, const PartSink& sink,
                                    std::size_t chunk_size) const noexcept {
    try {
        std::ifstream in(part_path(index), std::ios::binary);
        if (!in) {
            return make_error_code(DiskErrc::not_committed);
        }

        std::vector<std::byte> buffer(std::max<std::size_t>(chunk_size, 1));
        while (in) {
            in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            auto got = static_cast<std::size_t>(in.gcount());
            if (got == 0) break;
            if (auto ec = sink(std::span<const std::byte>(buffer.data(), got))) {
                return ec;
            }
        }
        if (in.bad()) {
            return make_error_code(DiskErrc::read_error);
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::error("part store {}: read part {}: {}", root_.string(), index, e.what());
        return make_error_code(DiskErrc::read_error);
    }
}

std::error_code DiskPartStore::remove(std::uint32_t index) noexcept {
    try {
        std::error_code ec;
        fs::remove(part_path(index), ec);
        return ec;
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::write_error);
    }
}

std::error_code DiskPartStore::clear() noexcept {
    std::error_code ec;
    fs::remove_all(root_, ec);
    return ec;
}

void DiskPartStore::release(std::uint32_t index) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    writing_.erase(index);
}

//=============================================================================
// MemoryPartWriter
//=============================================================================

class MemoryPartWriter final : public PartWriter {
public:
    MemoryPartWriter(MemoryPartStore& store, std::uint32_t index) noexcept
        : PartWriter(index)
        , store_(store) {}

    ~MemoryPartWriter() override {
        store_.release(index());
    }

    std::error_code write(std::span<const std::byte> data) noexcept override {
        try {
            buffer_.insert(buffer_.end(), data.begin(), data.end());
            return {};
        } catch (const std::bad_alloc&) {
            return make_error_code(DiskErrc::disk_full);
        }
    }

    std::uint64_t written() const noexcept override { return buffer_.size(); }

    std::vector<std::byte> take() noexcept { return std::move(buffer_); }

private:
    MemoryPartStore& store_;
    std::vector<std::byte> buffer_;
};

//=============================================================================
// MemoryPartStore
//=============================================================================

std::error_code MemoryPartStore::prepare(const core::SessionManifest& manifest) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (manifest_ && !manifest_->matches(manifest)) {
        parts_.clear();
    }
    try {
        manifest_ = manifest;
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::write_error);
    }
    return {};
}

std::expected<std::unique_ptr<PartWriter>, std::error_code>
MemoryPartStore::open_for_write(std::uint32_t index) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        if (!writing_.insert(index).second) {
            return std::unexpected(make_error_code(DiskErrc::writer_busy));
        }
        return std::make_unique<MemoryPartWriter>(*this, index);
    } catch (const std::bad_alloc&) {
        writing_.erase(index);
        return std::unexpected(make_error_code(DiskErrc::disk_full));
    }
}

std::expected<std::uint64_t, std::error_code>
MemoryPartStore::finalize(std::unique_ptr<PartWriter> writer) noexcept {
    auto* mem_writer = dynamic_cast<MemoryPartWriter*>(writer.get());
    if (!mem_writer) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    auto index = writer->index();
    auto bytes = mem_writer->take();
    std::uint64_t size = bytes.size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            parts_[index] = std::move(bytes);
        } catch (const std::bad_alloc&) {
            return std::unexpected(make_error_code(DiskErrc::disk_full));
        }
    }
    writer.reset();
    return size;
}

std::optional<std::uint64_t> MemoryPartStore::size_of(std::uint32_t index) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = parts_.find(index);
    if (it == parts_.end()) return std::nullopt;
    return it->second.size();
}

std::error_code MemoryPartStore::read(std::uint32_t index, const PartSink& sink,
                                      std::size_t chunk_size) const noexcept {
    std::span<const std::byte> data;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = parts_.find(index);
        if (it == parts_.end()) {
            return make_error_code(DiskErrc::not_committed);
        }
        // Committed parts are immutable until remove()/clear()
        data = std::span<const std::byte>(it->second);
    }

    chunk_size = std::max<std::size_t>(chunk_size, 1);
    for (std::size_t off = 0; off < data.size(); off += chunk_size) {
        auto n = std::min(chunk_size, data.size() - off);
        if (auto ec = sink(data.subspan(off, n))) return ec;
    }
    return {};
}

std::error_code MemoryPartStore::remove(std::uint32_t index) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    parts_.erase(index);
    return {};
}

std::error_code MemoryPartStore::clear() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    parts_.clear();
    manifest_.reset();
    return {};
}

std::size_t MemoryPartStore::part_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return parts_.size();
}

void MemoryPartStore::release(std::uint32_t index) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    writing_.erase(index);
}

} // namespace ferry::disk
