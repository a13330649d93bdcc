#include "engine/LeakDetector.hpp"

#include <string>

#include <doctest/doctest.h>

using fl::engine::LeakDetector;
using fl::engine::LeakEventKind;

TEST_CASE("sustained flow above the threshold raises one leak event")
{
    LeakDetector detector;
    CHECK(detector.evaluate(0.1, 0.05));
    CHECK(detector.is_leaking());

    auto event = detector.drain();
    REQUIRE(event);
    CHECK(event->kind == LeakEventKind::Detected);
    CHECK(event->min_flow == 0.1);
    CHECK(event->threshold == 0.05);
    CHECK(std::string(fl::engine::leak_event_name(event->kind)) ==
          "water_leak_detected");

    // Still leaking: no new transition, nothing pending.
    CHECK_FALSE(detector.evaluate(0.1, 0.05));
    CHECK_FALSE(detector.drain().has_value());
}

TEST_CASE("flow at or below the threshold clears a leak")
{
    LeakDetector detector;
    detector.evaluate(0.1, 0.05);
    detector.drain();

    CHECK(detector.evaluate(0.0, 0.05));
    CHECK_FALSE(detector.is_leaking());
    auto event = detector.drain();
    REQUIRE(event);
    CHECK(event->kind == LeakEventKind::Cleared);
    CHECK(event->min_flow == 0.0);

    // Equal to the threshold is not a leak.
    CHECK_FALSE(detector.evaluate(0.05, 0.05));
    CHECK_FALSE(detector.is_leaking());
}

TEST_CASE("an absent minimum leaves the detector untouched")
{
    LeakDetector detector;
    detector.evaluate(0.3, 0.05);
    CHECK_FALSE(detector.evaluate(std::nullopt, 0.05));
    CHECK(detector.is_leaking());
    REQUIRE(detector.pending());
    CHECK(detector.pending()->kind == LeakEventKind::Detected);
}

TEST_CASE("restore sets the state without a pending event")
{
    LeakDetector detector;
    detector.evaluate(0.3, 0.05);
    detector.restore(true);
    CHECK(detector.is_leaking());
    CHECK_FALSE(detector.pending().has_value());
    CHECK_FALSE(detector.evaluate(0.3, 0.05));
}
