#include "engine/SlidingWindowBuffer.hpp"

#include <doctest/doctest.h>

using fl::engine::FlowRange;
using fl::engine::Sample;
using fl::engine::SlidingWindowBuffer;

TEST_CASE("empty buffer reports no statistics")
{
    SlidingWindowBuffer<Sample> buffer(fl::engine::kHourSeconds);
    CHECK_FALSE(buffer.windowed_average(3600.0, 1000.0).has_value());
    CHECK_FALSE(buffer.windowed_max(3600.0, 1000.0).has_value());
    CHECK_FALSE(buffer.windowed_min(3600.0, 1000.0).has_value());
    CHECK(buffer.empty());
}

TEST_CASE("trim drops only entries older than the retention horizon")
{
    SlidingWindowBuffer<Sample> buffer(100.0);
    buffer.append({10.0, 1.0});
    buffer.append({50.0, 2.0});
    buffer.append({100.0, 3.0});
    buffer.append({150.0, 4.0});

    buffer.trim(150.0);
    REQUIRE(buffer.count() == 3);
    CHECK(buffer.entries().front() == Sample{50.0, 2.0});

    // Idempotent at the same instant.
    buffer.trim(150.0);
    CHECK(buffer.count() == 3);

    buffer.trim(1000.0);
    CHECK(buffer.empty());
}

TEST_CASE("window statistics include entries exactly at the cutoff")
{
    SlidingWindowBuffer<Sample> buffer(fl::engine::kDaySeconds);
    buffer.append({1000.0, 4.0});
    buffer.append({2000.0, 2.0});
    buffer.append({3000.0, 6.0});

    auto avg = buffer.windowed_average(1000.0, 3000.0);
    REQUIRE(avg);
    CHECK(*avg == doctest::Approx(4.0));
    CHECK(buffer.windowed_max(5000.0, 3000.0) == 6.0);
    CHECK(buffer.windowed_min(5000.0, 3000.0) == 2.0);
    CHECK(buffer.windowed_max(500.0, 3000.0) == 6.0);
    CHECK_FALSE(buffer.windowed_max(10.0, 5000.0).has_value());
}

TEST_CASE("flow ranges fold over the selected field")
{
    SlidingWindowBuffer<FlowRange> buffer(fl::engine::kWeekSeconds);
    buffer.append({0.0, 3.0, 0.5});
    buffer.append({3600.0, 1.5, 0.2});
    buffer.append({7200.0, 4.0, 0.9});

    CHECK(buffer.windowed_max(fl::engine::kDaySeconds, 7200.0,
                              &FlowRange::max) == 4.0);
    CHECK(buffer.windowed_min(fl::engine::kDaySeconds, 7200.0,
                              &FlowRange::min) == 0.2);
    CHECK(buffer.windowed_min(3600.0, 7200.0, &FlowRange::min) == 0.2);
    CHECK(buffer.windowed_min(1800.0, 7200.0, &FlowRange::min) == 0.9);
}

TEST_CASE("assign replaces contents until the next trim")
{
    SlidingWindowBuffer<Sample> buffer(60.0);
    buffer.append({1.0, 1.0});
    buffer.assign({{0.0, 9.0}, {500.0, 8.0}});
    CHECK(buffer.count() == 2);
    buffer.trim(500.0);
    CHECK(buffer.to_vector() == std::vector<Sample>{{500.0, 8.0}});
}
