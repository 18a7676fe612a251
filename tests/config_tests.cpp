// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/config.hpp>
#include <ferry/disk/error.hpp>
#include "fake_transport.hpp"
#include <fstream>
#include <limits>
#include <string>

using namespace ferry::core;

TEST_CASE("TransferConfig defaults", "[config]") {
    TransferConfig cfg;
    CHECK(cfg.workers == 8);
    CHECK(cfg.segment_size == 64 * MIB);
    CHECK(cfg.max_retries == 3);
    CHECK(cfg.request_timeout == std::chrono::seconds{300});
    CHECK(cfg.progress_interval == std::chrono::milliseconds{1000});
    CHECK(cfg.memory_threshold == 0);
    CHECK(cfg.keep_parts_on_failure);
    CHECK(cfg.url_template == "{id}");
    CHECK_FALSE(cfg.validate());
}

TEST_CASE("TransferConfig::validate", "[config]") {
    TransferConfig cfg;

    SECTION("Zero workers") {
        cfg.workers = 0;
        CHECK(cfg.validate() == DownloadErrc::invalid_config);
    }
    SECTION("Too many workers") {
        cfg.workers = MAX_WORKERS + 1;
        CHECK(cfg.validate() == DownloadErrc::invalid_config);
    }
    SECTION("Zero segment size") {
        cfg.segment_size = 0;
        CHECK(cfg.validate() == DownloadErrc::invalid_segment_size);
    }
    SECTION("Backoff cap below base") {
        cfg.retry_backoff = std::chrono::milliseconds{500};
        cfg.retry_backoff_max = std::chrono::milliseconds{100};
        CHECK(cfg.validate() == DownloadErrc::invalid_config);
    }
    SECTION("Template without placeholder") {
        cfg.url_template = "https://example.com/fixed";
        CHECK(cfg.validate() == DownloadErrc::invalid_config);
    }
}

TEST_CASE("parse_config reads JSON", "[config]") {
    SECTION("Overrides keep other defaults") {
        auto cfg = parse_config(R"({
            "workers": 4,
            "segment_size_mb": 16,
            "chunk_size_kb": 256,
            "max_retries": 5,
            "retry_backoff_ms": 200,
            "retry_backoff_max_ms": 2000,
            "request_timeout_sec": 60,
            "memory_threshold_mb": 8,
            "url_template": "https://api.example.com/files/{id}?alt=media",
            "headers": {"X-Client": "ferry"},
            "keep_parts_on_failure": false
        })");
        REQUIRE(cfg.has_value());
        CHECK(cfg->workers == 4);
        CHECK(cfg->segment_size == 16 * MIB);
        CHECK(cfg->chunk_size == 256 * 1024);
        CHECK(cfg->max_retries == 5);
        CHECK(cfg->retry_backoff == std::chrono::milliseconds{200});
        CHECK(cfg->retry_backoff_max == std::chrono::milliseconds{2000});
        CHECK(cfg->request_timeout == std::chrono::seconds{60});
        CHECK(cfg->memory_threshold == 8 * MIB);
        CHECK(cfg->headers.at("X-Client") == "ferry");
        CHECK_FALSE(cfg->keep_parts_on_failure);
        CHECK(cfg->connect_timeout == std::chrono::seconds{CONNECTION_TIMEOUT_SEC});
        CHECK(cfg->output_dir == "downloads");
    }

    SECTION("Malformed JSON") {
        auto cfg = parse_config("{ workers: ");
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error() == DownloadErrc::invalid_config);
    }

    SECTION("Wrong type") {
        CHECK(parse_config(R"({"workers": "many"})").error() == DownloadErrc::invalid_config);
    }

    SECTION("Not an object") {
        CHECK(parse_config("[1, 2, 3]").error() == DownloadErrc::invalid_config);
    }

    SECTION("Parsed values are validated") {
        CHECK(parse_config(R"({"workers": 0})").error() == DownloadErrc::invalid_config);
    }
}

TEST_CASE("to_bytes rejects products past 64 bits", "[config]") {
    constexpr auto max_mib = std::numeric_limits<std::uint64_t>::max() / MIB;
    CHECK(to_bytes(64, MIB) == 64 * MIB);
    CHECK(to_bytes(0, MIB) == 0u);
    CHECK(to_bytes(max_mib, MIB) == max_mib * MIB);
    CHECK(to_bytes(max_mib + 1, MIB).error() == DownloadErrc::invalid_config);
}

TEST_CASE("parse_config rejects sizes that overflow", "[config]") {
    auto key = GENERATE(as<std::string>{}, "segment_size_mb", "memory_threshold_mb", "chunk_size_kb");
    auto json = R"({")" + key + R"(": 18446744073709551615})";
    auto cfg = parse_config(json);
    REQUIRE_FALSE(cfg.has_value());
    CHECK(cfg.error() == DownloadErrc::invalid_config);
}

TEST_CASE("load_config", "[config]") {
    ferry::test::TempDir dir;

    SECTION("Missing file") {
        auto cfg = load_config((dir / "nope.json").string());
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error() == ferry::disk::DiskErrc::file_not_found);
    }

    SECTION("File on disk") {
        auto path = dir / "ferry.json";
        std::ofstream(path) << R"({"workers": 2, "log_level": "debug"})";
        auto cfg = load_config(path.string());
        REQUIRE(cfg.has_value());
        CHECK(cfg->workers == 2);
        CHECK(cfg->log_level == "debug");
    }
}

TEST_CASE("expand_url_template", "[config]") {
    CHECK(expand_url_template("{id}", "https://x.test/a.bin") == "https://x.test/a.bin");
    CHECK(expand_url_template("https://api.test/files/{id}?alt=media", "1AbC")
          == "https://api.test/files/1AbC?alt=media");
    CHECK(expand_url_template("https://m.test/{id}/{id}", "k") == "https://m.test/k/k");
}
