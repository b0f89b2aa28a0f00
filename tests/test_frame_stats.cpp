/// @file test_frame_stats.cpp
/// @brief Tests for rolling frame-rate statistics

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "timing/frame_stats.hpp"

using namespace drawreel;
using Catch::Approx;

TEST_CASE("No frames recorded", "[frame_stats]") {
    FrameStats stats;
    FrameMetrics m = stats.metrics();

    CHECK(m.total_frames == 0);
    CHECK(m.dropped_frames == 0);
    CHECK(m.fps == 0.0);
    CHECK(m.average_fps == 0.0);
    CHECK_FALSE(stats.below(50.0));
}

TEST_CASE("Steady 60 fps", "[frame_stats]") {
    FrameStats stats;
    for (int i = 0; i < 60; i++) {
        stats.record(1000.0 / 60.0);
    }
    FrameMetrics m = stats.metrics();

    CHECK(m.total_frames == 60);
    CHECK(m.dropped_frames == 0);
    CHECK(m.fps == Approx(60.0));
    CHECK(m.average_fps == Approx(60.0));
    CHECK(m.min_fps == Approx(60.0));
    CHECK(m.max_fps == Approx(60.0));
    CHECK(m.frame_time_ms == Approx(16.6667).epsilon(0.001));
    CHECK_FALSE(stats.below(50.0));
}

TEST_CASE("Slow frames count as dropped", "[frame_stats]") {
    FrameStats stats;
    stats.record(10.0);
    stats.record(40.0);
    stats.record(20.0);
    stats.record(16.0);
    FrameMetrics m = stats.metrics();

    CHECK(m.total_frames == 4);
    CHECK(m.dropped_frames == 2);
    CHECK(m.fps == Approx(62.5));
    CHECK(m.min_fps == Approx(25.0));
    CHECK(m.max_fps == Approx(100.0));
    CHECK(m.average_fps == Approx(1000.0 * 4.0 / 86.0));
    CHECK(stats.below(50.0));
}

TEST_CASE("History is bounded but totals are not", "[frame_stats]") {
    FrameStats stats(10);
    for (int i = 0; i < 10; i++) {
        stats.record(50.0);
    }
    for (int i = 0; i < 10; i++) {
        stats.record(10.0);
    }
    FrameMetrics m = stats.metrics();

    CHECK(m.total_frames == 20);
    CHECK(m.dropped_frames == 10);
    // Only the last ten (fast) frames feed the rates
    CHECK(m.average_fps == Approx(100.0));
    CHECK(m.min_fps == Approx(100.0));
}

TEST_CASE("Invalid intervals are ignored and reset clears", "[frame_stats]") {
    FrameStats stats;
    stats.record(0.0);
    stats.record(-5.0);
    CHECK(stats.metrics().total_frames == 0);

    stats.record(20.0);
    REQUIRE(stats.metrics().total_frames == 1);
    stats.reset();
    CHECK(stats.metrics().total_frames == 0);
    CHECK(stats.metrics().dropped_frames == 0);
    CHECK(stats.metrics().fps == 0.0);
}
