// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/disk/file_writer.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace ferry::disk {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case 0:             return {};
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:        return make_error_code(DiskErrc::invalid_path);
        case EEXIST:        return make_error_code(DiskErrc::file_exists);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_))
    , written_(other.written_) {
    other.fd_ = -1;
    other.written_ = 0;
}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        written_ = other.written_;
        other.fd_ = -1;
        other.written_ = 0;
    }
    return *this;
}

std::error_code FileWriter::open(const std::filesystem::path& path) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::file_exists);
    }

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return errno_to_error_code(errno);
    }

    fd_ = fd;
    path_ = path;
    written_ = 0;
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* p = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::write(fd_, p, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno);
        }
        p += n;
        size -= static_cast<std::size_t>(n);
        written_ += static_cast<std::uint64_t>(n);
    }
    return {};
}

std::error_code FileWriter::sync() noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fdatasync(fd_) != 0) {
        return errno_to_error_code(errno);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

//=============================================================================
// SegmentBuffer
//=============================================================================

SegmentBuffer::SegmentBuffer(std::size_t capacity) {
    buffer_.resize(capacity);
}

std::size_t SegmentBuffer::append(const std::byte* data, std::size_t size) noexcept {
    std::size_t n = std::min(size, buffer_.size() - size_);
    std::memcpy(buffer_.data() + size_, data, n);
    size_ += n;
    return n;
}

} // namespace ferry::disk
