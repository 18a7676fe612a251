// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/disk/part_store.hpp>
#include "fake_transport.hpp"
#include <memory>

using namespace ferry;
using namespace ferry::disk;
namespace fs = std::filesystem;

namespace {

core::SessionManifest manifest_for(std::string id, std::uint64_t total, std::uint64_t seg) {
    core::SessionManifest m;
    m.object_id = std::move(id);
    m.total_size = total;
    m.segment_size = seg;
    m.segment_count = static_cast<std::uint32_t>((total + seg - 1) / seg);
    return m;
}

std::vector<std::byte> read_all(const PartStore& store, std::uint32_t index, std::size_t chunk,
                                std::size_t* calls = nullptr) {
    std::vector<std::byte> out;
    auto ec = store.read(index, [&](std::span<const std::byte> data) {
        CHECK(data.size() <= chunk);
        out.insert(out.end(), data.begin(), data.end());
        if (calls) ++*calls;
        return std::error_code{};
    }, chunk);
    REQUIRE_FALSE(ec);
    return out;
}

// Contract shared by both implementations
void check_store_contract(PartStore& store) {
    REQUIRE_FALSE(store.prepare(manifest_for("obj", 300, 100)));
    auto payload = test::make_payload(100);

    SECTION("Only finalized parts are visible") {
        auto writer = store.open_for_write(0);
        REQUIRE(writer.has_value());
        REQUIRE_FALSE((*writer)->write(std::span(payload).first(60)));
        CHECK((*writer)->written() == 60);
        CHECK_FALSE(store.exists(0));

        REQUIRE_FALSE((*writer)->write(std::span(payload).subspan(60)));
        auto size = store.finalize(std::move(*writer));
        REQUIRE(size.has_value());
        CHECK(*size == 100);
        CHECK(store.exists(0));
        CHECK(store.size_of(0) == 100u);

        std::size_t calls = 0;
        CHECK(read_all(store, 0, 32, &calls) == payload);
        CHECK(calls == 4);
    }

    SECTION("One writer per index") {
        auto first = store.open_for_write(1);
        REQUIRE(first.has_value());
        auto second = store.open_for_write(1);
        REQUIRE_FALSE(second.has_value());
        CHECK(second.error() == DiskErrc::writer_busy);

        // A different index is independent
        CHECK(store.open_for_write(2).has_value());

        first->reset();
        CHECK(store.open_for_write(1).has_value());
    }

    SECTION("Abandoned writer leaves nothing behind") {
        {
            auto writer = store.open_for_write(2);
            REQUIRE(writer.has_value());
            REQUIRE_FALSE((*writer)->write(payload));
        }
        CHECK_FALSE(store.exists(2));
        CHECK(store.read(2, [](std::span<const std::byte>) { return std::error_code{}; }, 16)
              == DiskErrc::not_committed);
    }

    SECTION("Rewriting replaces the committed part") {
        for (std::uint32_t round = 0; round < 2; ++round) {
            auto data = test::make_payload(40 + round * 10, round + 7);
            auto writer = store.open_for_write(0);
            REQUIRE(writer.has_value());
            REQUIRE_FALSE((*writer)->write(data));
            REQUIRE(store.finalize(std::move(*writer)).has_value());
            CHECK(read_all(store, 0, 1024) == data);
        }
        CHECK(store.size_of(0) == 50u);
    }

    SECTION("Remove and clear") {
        for (std::uint32_t i = 0; i < 3; ++i) {
            auto writer = store.open_for_write(i);
            REQUIRE(writer.has_value());
            REQUIRE_FALSE((*writer)->write(payload));
            REQUIRE(store.finalize(std::move(*writer)).has_value());
        }
        REQUIRE_FALSE(store.remove(1));
        CHECK(store.exists(0));
        CHECK_FALSE(store.exists(1));
        CHECK(store.exists(2));

        REQUIRE_FALSE(store.clear());
        CHECK_FALSE(store.exists(0));
        CHECK_FALSE(store.exists(2));
    }

    SECTION("Sink errors stop the read") {
        auto writer = store.open_for_write(0);
        REQUIRE(writer.has_value());
        REQUIRE_FALSE((*writer)->write(payload));
        REQUIRE(store.finalize(std::move(*writer)).has_value());

        int calls = 0;
        auto ec = store.read(0, [&](std::span<const std::byte>) {
            ++calls;
            return make_error_code(DiskErrc::disk_full);
        }, 10);
        CHECK(ec == DiskErrc::disk_full);
        CHECK(calls == 1);
    }
}

} // namespace

TEST_CASE("MemoryPartStore contract", "[partstore]") {
    MemoryPartStore store;
    check_store_contract(store);
    CHECK(store.describe() == "memory");
}

TEST_CASE("DiskPartStore contract", "[partstore]") {
    test::TempDir dir;
    DiskPartStore store(dir / "object.parts");
    check_store_contract(store);
}

TEST_CASE("DiskPartStore layout", "[partstore]") {
    test::TempDir dir;
    DiskPartStore store(dir / "big.parts");
    REQUIRE_FALSE(store.prepare(manifest_for("obj", 300, 100)));

    CHECK(fs::exists(store.manifest_path()));
    CHECK(store.manifest_path().filename() == "session.json");
    CHECK(store.part_path(0).filename() == "part_00000");
    CHECK(store.part_path(42).filename() == "part_00042");

    auto writer = store.open_for_write(3);
    REQUIRE(writer.has_value());
    REQUIRE_FALSE((*writer)->write(test::make_payload(10)));

    // In-progress bytes live in a .tmp file until finalize
    CHECK(fs::exists(dir / "big.parts" / "part_00003.tmp"));
    CHECK_FALSE(fs::exists(store.part_path(3)));

    REQUIRE(store.finalize(std::move(*writer)).has_value());
    CHECK(fs::exists(store.part_path(3)));
    CHECK_FALSE(fs::exists(dir / "big.parts" / "part_00003.tmp"));
}

TEST_CASE("DiskPartStore::parts_dir_for", "[partstore]") {
    CHECK(DiskPartStore::parts_dir_for("downloads/movie.mkv") == fs::path("downloads/movie.mkv.parts"));
    CHECK(DiskPartStore::parts_dir_for("/data/archive") == fs::path("/data/archive.parts"));
    CHECK(DiskPartStore::parts_dir_for("dl/x.parts") == fs::path("dl/x.parts.parts"));

    SECTION("Destinations sharing a stem get separate directories") {
        auto mp4 = DiskPartStore::parts_dir_for("dl/video.mp4");
        auto mkv = DiskPartStore::parts_dir_for("dl/video.mkv");
        CHECK(mp4 != mkv);
        CHECK(mp4 != fs::path("dl/video.mp4"));
    }
}

TEST_CASE("DiskPartStore sessions for same-stem destinations stay apart", "[partstore]") {
    test::TempDir dir;
    auto payload = test::make_payload(100);

    DiskPartStore mp4(DiskPartStore::parts_dir_for(dir / "video.mp4"));
    REQUIRE_FALSE(mp4.prepare(manifest_for("mp4", 300, 100)));
    {
        auto writer = mp4.open_for_write(0);
        REQUIRE(writer.has_value());
        REQUIRE_FALSE((*writer)->write(payload));
        REQUIRE(mp4.finalize(std::move(*writer)).has_value());
    }

    DiskPartStore mkv(DiskPartStore::parts_dir_for(dir / "video.mkv"));
    REQUIRE_FALSE(mkv.prepare(manifest_for("mkv", 500, 250)));
    REQUIRE_FALSE(mkv.clear());

    CHECK(mp4.size_of(0) == 100u);
    CHECK(fs::exists(mp4.manifest_path()));
}

TEST_CASE("DiskPartStore::prepare guards the namespace", "[partstore]") {
    test::TempDir dir;
    auto root = dir / "x.parts";
    auto payload = test::make_payload(100);

    auto write_part = [&](DiskPartStore& store, std::uint32_t index) {
        auto writer = store.open_for_write(index);
        REQUIRE(writer.has_value());
        REQUIRE_FALSE((*writer)->write(payload));
        REQUIRE(store.finalize(std::move(*writer)).has_value());
    };

    {
        DiskPartStore store(root);
        REQUIRE_FALSE(store.prepare(manifest_for("obj", 300, 100)));
        write_part(store, 0);
        write_part(store, 1);
    }

    SECTION("Same session keeps parts") {
        DiskPartStore store(root);
        REQUIRE_FALSE(store.prepare(manifest_for("obj", 300, 100)));
        CHECK(store.size_of(0) == 100u);
        CHECK(store.size_of(1) == 100u);
    }

    SECTION("Different segmentation discards parts") {
        DiskPartStore store(root);
        REQUIRE_FALSE(store.prepare(manifest_for("obj", 300, 150)));
        CHECK_FALSE(store.exists(0));
        CHECK_FALSE(store.exists(1));

        auto saved = core::SessionManifest::load(store.manifest_path());
        REQUIRE(saved.has_value());
        CHECK(saved->segment_size == 150);
    }

    SECTION("Different object discards parts") {
        DiskPartStore store(root);
        REQUIRE_FALSE(store.prepare(manifest_for("other", 300, 100)));
        CHECK_FALSE(store.exists(0));
    }

    SECTION("Parts without a manifest are not trusted") {
        fs::remove(root / "session.json");
        DiskPartStore store(root);
        REQUIRE_FALSE(store.prepare(manifest_for("obj", 300, 100)));
        CHECK_FALSE(store.exists(0));
    }

    SECTION("Clear removes the directory") {
        DiskPartStore store(root);
        REQUIRE_FALSE(store.clear());
        CHECK_FALSE(fs::exists(root));
    }
}

TEST_CASE("PartStore rejects foreign writers", "[partstore]") {
    test::TempDir dir;
    DiskPartStore disk_store(dir / "a.parts");
    MemoryPartStore mem_store;
    REQUIRE_FALSE(disk_store.prepare(manifest_for("obj", 10, 10)));
    REQUIRE_FALSE(mem_store.prepare(manifest_for("obj", 10, 10)));

    auto writer = mem_store.open_for_write(0);
    REQUIRE(writer.has_value());
    auto result = disk_store.finalize(std::move(*writer));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == DiskErrc::handle_invalid);
}
