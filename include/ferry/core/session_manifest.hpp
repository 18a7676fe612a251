// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace ferry::core {

// Identity of a part-store namespace. Parts are only reused by a session
// whose manifest matches the one they were written under.
struct SessionManifest {
    static constexpr std::uint32_t FORMAT_VERSION = 1;

    std::uint32_t format{FORMAT_VERSION};
    std::string object_id;
    std::string name;
    std::uint64_t total_size{0};
    std::uint64_t segment_size{0};
    std::uint32_t segment_count{0};

    // Same object planned the same way (name is informational)
    [[nodiscard]] bool matches(const SessionManifest& other) const noexcept;

    [[nodiscard]] std::string to_json() const;

    [[nodiscard]] static std::expected<SessionManifest, std::error_code>
    from_json(std::string_view json) noexcept;

    // Written via a temporary file and rename
    [[nodiscard]] std::error_code save(const std::filesystem::path& path) const noexcept;

    [[nodiscard]] static std::expected<SessionManifest, std::error_code>
    load(const std::filesystem::path& path) noexcept;
};

} // namespace ferry::core
