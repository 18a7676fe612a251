// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ferry/core/session_manifest.hpp>
#include <ferry/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace ferry::core {

namespace fs = std::filesystem;

bool SessionManifest::matches(const SessionManifest& other) const noexcept {
    return format == other.format
        && object_id == other.object_id
        && total_size == other.total_size
        && segment_size == other.segment_size
        && segment_count == other.segment_count;
}

std::string SessionManifest::to_json() const {
    nlohmann::json j;
    j["format"] = format;
    j["object_id"] = object_id;
    j["name"] = name;
    j["total_size"] = total_size;
    j["segment_size"] = segment_size;
    j["segment_count"] = segment_count;
    return j.dump(2);
}

std::expected<SessionManifest, std::error_code>
SessionManifest::from_json(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);

        SessionManifest m;
        m.format = j.at("format").get<std::uint32_t>();
        m.object_id = j.at("object_id").get<std::string>();
        m.name = j.value("name", std::string{});
        m.total_size = j.at("total_size").get<std::uint64_t>();
        m.segment_size = j.at("segment_size").get<std::uint64_t>();
        m.segment_count = j.at("segment_count").get<std::uint32_t>();
        return m;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("manifest: {}", e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::manifest_corrupt));
    }
}

std::error_code SessionManifest::save(const fs::path& path) const noexcept {
    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }

        auto tmp = path;
        tmp += ".tmp";
        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
            file << to_json() << '\n';
            if (!file.flush()) {
                return make_error_code(disk::DiskErrc::write_error);
            }
        }

        std::error_code ec;
        fs::rename(tmp, path, ec);
        return ec;
    } catch (const std::exception& e) {
        spdlog::error("manifest: save {}: {}", path.string(), e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::expected<SessionManifest, std::error_code>
SessionManifest::load(const fs::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        return from_json(ss.str());
    } catch (const std::exception& e) {
        spdlog::error("manifest: load {}: {}", path.string(), e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

} // namespace ferry::core
