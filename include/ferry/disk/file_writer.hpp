// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <ferry/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace ferry::disk {

// Sequential writer over a POSIX file descriptor. One owner at a time.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Create or truncate
    [[nodiscard]] std::error_code open(const std::filesystem::path& path) noexcept;

    // Append, retrying short writes
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Flush to stable storage
    [[nodiscard]] std::error_code sync() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return written_; }

private:
    int fd_{-1};
    std::filesystem::path path_;
    std::uint64_t written_{0};
};

// Fixed-capacity staging buffer; fills to capacity before a flush
class SegmentBuffer {
public:
    explicit SegmentBuffer(std::size_t capacity);

    [[nodiscard]] const std::byte* data() const noexcept { return buffer_.data(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return buffer_.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool full() const noexcept { return size_ == buffer_.size(); }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    void reset() noexcept { size_ = 0; }

    // Copy as much as fits; returns bytes consumed
    std::size_t append(const std::byte* data, std::size_t size) noexcept;

private:
    std::vector<std::byte> buffer_;
    std::size_t size_{0};
};

} // namespace ferry::disk
