// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <ferry/core/byte_counter.hpp>
#include <ferry/core/config.hpp>
#include <ferry/core/segment.hpp>
#include <thread>
#include <vector>

using namespace ferry::core;

namespace {

void check_partition(const SegmentPlan& plan, std::uint64_t total, std::uint64_t seg_size) {
    const auto& segs = plan.segments;
    REQUIRE(segs.size() == (total + seg_size - 1) / seg_size);

    std::uint64_t next = 0;
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < segs.size(); ++i) {
        CHECK(segs[i]->index() == i);
        CHECK(segs[i]->start() == next);  // contiguous, no overlap
        CHECK(segs[i]->expected_size() > 0);
        CHECK(segs[i]->expected_size() <= seg_size);
        CHECK(segs[i]->end() == segs[i]->start() + segs[i]->expected_size() - 1);
        next = segs[i]->end() + 1;
        sum += segs[i]->expected_size();
    }
    CHECK(next == total);
    CHECK(sum == total);
}

} // namespace

TEST_CASE("plan_segments partitions the object", "[segment][planner]") {
    SECTION("150 MB in 64 MB parts") {
        auto plan = plan_segments(150 * MIB, 64 * MIB, 8);
        REQUIRE(plan.has_value());
        REQUIRE(plan->segments.size() == 3);
        CHECK(plan->segments[0]->expected_size() == 64 * MIB);
        CHECK(plan->segments[1]->expected_size() == 64 * MIB);
        CHECK(plan->segments[2]->expected_size() == 22 * MIB);
        CHECK(plan->segments[2]->end() == 150 * MIB - 1);
        CHECK(plan->total_size == 150 * MIB);
        CHECK(plan->workers == 3);
        check_partition(*plan, 150 * MIB, 64 * MIB);
    }

    SECTION("Exact multiple") {
        auto plan = plan_segments(4096, 1024, 2);
        REQUIRE(plan.has_value());
        check_partition(*plan, 4096, 1024);
        CHECK(plan->workers == 2);
    }

    SECTION("Object smaller than one part") {
        auto plan = plan_segments(10, 1024, 8);
        REQUIRE(plan.has_value());
        REQUIRE(plan->segments.size() == 1);
        CHECK(plan->segments[0]->expected_size() == 10);
        CHECK(plan->workers == 1);
    }

    SECTION("Assorted sizes") {
        auto [total, seg] = GENERATE(table<std::int64_t, std::int64_t>({
            {1, 1}, {7, 3}, {1000, 999}, {1000, 1001}, {65537, 4096}, {1'000'003, 7919},
        }));
        auto plan = plan_segments(total, seg, 4);
        REQUIRE(plan.has_value());
        check_partition(*plan, static_cast<std::uint64_t>(total), static_cast<std::uint64_t>(seg));
    }
}

TEST_CASE("plan_segments edge cases", "[segment][planner]") {
    SECTION("Empty object yields an empty plan") {
        auto plan = plan_segments(0, 64 * MIB, 8);
        REQUIRE(plan.has_value());
        CHECK(plan->segments.empty());
        CHECK(plan->total_size == 0);
        CHECK(plan->workers == 1);
    }

    SECTION("Negative size is a planning error") {
        auto plan = plan_segments(-1, 1024, 4);
        REQUIRE_FALSE(plan.has_value());
        CHECK(plan.error() == DownloadErrc::invalid_size);
        CHECK(error_class(plan.error()) == ErrorClass::planning);
    }

    SECTION("Non-positive segment size is a planning error") {
        CHECK(plan_segments(100, 0, 4).error() == DownloadErrc::invalid_segment_size);
        CHECK(plan_segments(100, -5, 4).error() == DownloadErrc::invalid_segment_size);
    }

    SECTION("Zero workers still gets one") {
        auto plan = plan_segments(100, 10, 0);
        REQUIRE(plan.has_value());
        CHECK(plan->workers == 1);
    }
}

TEST_CASE("plan_single_segment covers the whole object", "[segment][planner]") {
    auto plan = plan_single_segment(12345);
    REQUIRE(plan.has_value());
    REQUIRE(plan->segments.size() == 1);
    CHECK(plan->segments[0]->start() == 0);
    CHECK(plan->segments[0]->expected_size() == 12345);
    CHECK(plan->workers == 1);

    auto empty = plan_single_segment(0);
    REQUIRE(empty.has_value());
    CHECK(empty->segments.empty());
}

TEST_CASE("Segment state machine", "[segment]") {
    Segment seg(3, 1000, 500);
    CHECK(seg.state() == SegmentState::pending);
    CHECK(seg.end() == 1499);

    SECTION("Successful attempt") {
        REQUIRE(seg.begin_attempt());
        CHECK(seg.state() == SegmentState::in_flight);
        CHECK(seg.attempts() == 1);
        CHECK_FALSE(seg.begin_attempt());  // exclusive
        CHECK_FALSE(seg.complete(500));
        CHECK(seg.is_done());
        CHECK_FALSE(seg.begin_attempt());  // done is terminal
    }

    SECTION("Wrong size never reaches done") {
        REQUIRE(seg.begin_attempt());
        auto ec = seg.complete(499);
        CHECK(ec == DownloadErrc::size_mismatch);
        CHECK(seg.state() == SegmentState::failed);
        CHECK(seg.error() == DownloadErrc::size_mismatch);

        // failed -> in_flight on retry
        REQUIRE(seg.begin_attempt());
        CHECK(seg.attempts() == 2);
        CHECK_FALSE(seg.error());
        CHECK_FALSE(seg.complete(500));
        CHECK(seg.is_done());
    }

    SECTION("Transfer failure") {
        REQUIRE(seg.begin_attempt());
        seg.fail(make_error_code(DownloadErrc::network_error));
        CHECK(seg.state() == SegmentState::failed);
        CHECK(seg.error() == DownloadErrc::network_error);
    }

    SECTION("Resume requires the exact size") {
        CHECK_FALSE(seg.mark_resumed(499));
        CHECK(seg.state() == SegmentState::pending);
        CHECK(seg.mark_resumed(500));
        CHECK(seg.is_done());
        CHECK(seg.attempts() == 0);
    }
}

TEST_CASE("done_bytes and all_done", "[segment]") {
    auto plan = plan_segments(250, 100, 2);
    REQUIRE(plan.has_value());
    auto& segs = plan->segments;

    CHECK(done_bytes(segs) == 0);
    CHECK_FALSE(all_done(segs));

    CHECK(segs[2]->mark_resumed(50));
    CHECK(done_bytes(segs) == 50);

    CHECK(segs[0]->mark_resumed(100));
    CHECK(segs[1]->mark_resumed(100));
    CHECK(done_bytes(segs) == 250);
    CHECK(all_done(segs));

    SegmentList none;
    CHECK(all_done(none));
}

TEST_CASE("ByteCounter under concurrent updates", "[counter]") {
    ByteCounter counter;
    constexpr int threads = 8;
    constexpr int iterations = 10'000;

    {
        std::vector<std::jthread> pool;
        for (int t = 0; t < threads; ++t) {
            pool.emplace_back([&counter, t] {
                for (int i = 0; i < iterations; ++i) {
                    counter.add(static_cast<std::uint64_t>(t + 1));
                    if (i % 10 == 0) {
                        counter.subtract(1);
                        counter.add(1);
                    }
                }
            });
        }
    }

    std::uint64_t expected = 0;
    for (int t = 0; t < threads; ++t) expected += static_cast<std::uint64_t>(t + 1) * iterations;
    CHECK(counter.load() == expected);

    counter.reset(42);
    CHECK(counter.load() == 42);
    CHECK(counter.add(8) == 50);
}
