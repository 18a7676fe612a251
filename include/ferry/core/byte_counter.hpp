// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <atomic>
#include <cstdint>

namespace ferry::core {

// Session-wide count of bytes held in the part store. Shared by every fetch
// worker (writers) and the progress monitor (reader).
class ByteCounter {
public:
    ByteCounter() = default;
    explicit ByteCounter(std::uint64_t initial) noexcept : bytes_(initial) {}

    ByteCounter(const ByteCounter&) = delete;
    ByteCounter& operator=(const ByteCounter&) = delete;

    // Returns the new total
    std::uint64_t add(std::uint64_t n) noexcept {
        return bytes_.fetch_add(n, std::memory_order_acq_rel) + n;
    }

    // Withdraw bytes a failed attempt had credited
    void subtract(std::uint64_t n) noexcept {
        bytes_.fetch_sub(n, std::memory_order_acq_rel);
    }

    [[nodiscard]] std::uint64_t load() const noexcept {
        return bytes_.load(std::memory_order_acquire);
    }

    void reset(std::uint64_t value = 0) noexcept {
        bytes_.store(value, std::memory_order_release);
    }

private:
    std::atomic<std::uint64_t> bytes_{0};
};

} // namespace ferry::core
