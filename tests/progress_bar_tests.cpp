// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/cli/progress_bar.hpp>
#include <sstream>

using namespace ferry::cli;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("ProgressBar formatting", "[progress_bar]") {
    SECTION("ETA as mm:ss") {
        CHECK(ProgressBar::format_eta(0s) == "00:00");
        CHECK(ProgressBar::format_eta(75s) == "01:15");
        CHECK(ProgressBar::format_eta(3599s) == "59:59");
        CHECK(ProgressBar::format_eta(3725s) == "1:02:05");
    }

    SECTION("Speeds") {
        CHECK(ProgressBar::format_speed(512) == "512 B/s");
        CHECK(ProgressBar::format_speed(1536) == "1.5 KB/s");
        CHECK(ProgressBar::format_speed(10.0 * 1024 * 1024) == "10.0 MB/s");
    }

    SECTION("Sizes") {
        CHECK(ProgressBar::format_bytes(999) == "999 B");
        CHECK(ProgressBar::format_bytes(150ull * 1024 * 1024) == "150.0 MB");
    }
}

TEST_CASE("ProgressBar renders a sample", "[progress_bar]") {
    std::ostringstream out;
    ProgressBar bar("Downloading", out);

    ferry::core::ProgressSample s;
    s.downloaded = 50 * 1024 * 1024;
    s.total = 100 * 1024 * 1024;
    s.percent = 50.0;
    s.instant_bps = 2.0 * 1024 * 1024;
    s.average_bps = 1.0 * 1024 * 1024;
    s.eta = 50s;

    auto line = bar.render(s);
    CHECK_THAT(line, ContainsSubstring("Downloading: ["));
    CHECK_THAT(line, ContainsSubstring(" 50.0%"));
    CHECK_THAT(line, ContainsSubstring("2.0 MB/s"));
    CHECK_THAT(line, ContainsSubstring("avg 1.0 MB/s"));
    CHECK_THAT(line, ContainsSubstring("ETA 00:50"));

    s.eta.reset();
    CHECK_THAT(bar.render(s), !ContainsSubstring("ETA"));

    bar.update(s);
    bar.finish();
    CHECK_THAT(out.str(), ContainsSubstring("\r"));
    CHECK(out.str().back() == '\n');
}
