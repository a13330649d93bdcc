#include "TestUtils.hpp"
#include "telemetry/TelemetryFeed.hpp"

#include <chrono>
#include <fstream>
#include <vector>

#include <doctest/doctest.h>

using fl::telemetry::Reading;
using fl::telemetry::TelemetryFeed;

TEST_CASE("parse_line reads a complete reading")
{
    bool malformed = true;
    auto reading = TelemetryFeed::parse_line(
        R"({"flow_rate":2.5,"volume_delta":150,"available":true,"timestamp":1700000000.5})",
        &malformed);
    REQUIRE(reading);
    CHECK_FALSE(malformed);
    CHECK(reading->flow_rate == 2.5);
    CHECK(reading->volume_delta == 150.0);
    CHECK(reading->available);
    CHECK(reading->timestamp == 1700000000.5);
}

TEST_CASE("parse_line fills optional fields with defaults")
{
    auto reading = TelemetryFeed::parse_line(R"({"flow_rate":0})");
    REQUIRE(reading);
    CHECK(reading->volume_delta == 0.0);
    CHECK(reading->available);
    CHECK_FALSE(reading->timestamp.has_value());

    auto offline = TelemetryFeed::parse_line(R"({"available":false})");
    REQUIRE(offline);
    CHECK_FALSE(offline->available);

    auto stamped = TelemetryFeed::parse_line(
        R"({"flow_rate":1,"timestamp":"1970-01-01T00:01:00Z"})");
    REQUIRE(stamped);
    CHECK(stamped->timestamp == 60.0);
}

TEST_CASE("parse_line separates comments from malformed input")
{
    bool malformed = true;
    CHECK_FALSE(TelemetryFeed::parse_line("   ", &malformed).has_value());
    CHECK_FALSE(malformed);
    CHECK_FALSE(
        TelemetryFeed::parse_line("# meter restarted", &malformed).has_value());
    CHECK_FALSE(malformed);

    char const *bad[] = {
        "not json",
        "[1,2]",
        R"({"volume_delta":5})",
        R"({"flow_rate":1,"volume_delta":-3})",
        R"({"flow_rate":1,"volume_delta":"10"})",
        R"({"flow_rate":1,"timestamp":"someday"})",
        R"({"flow_rate":1,"timestamp":true})",
    };
    for (auto const *line : bad)
    {
        CAPTURE(line);
        malformed = false;
        CHECK_FALSE(TelemetryFeed::parse_line(line, &malformed).has_value());
        CHECK(malformed);
    }
}

TEST_CASE("file feed delivers every valid line and then finishes")
{
    auto root = fl::test::make_temp_root("telemetry-feed");
    auto path = root / "readings.ndjson";
    {
        std::ofstream out(path);
        out << R"({"flow_rate":1.0,"volume_delta":10})" << '\n';
        out << "# comment\n";
        out << "garbage\n";
        out << R"({"flow_rate":2.0,"volume_delta":20})" << '\n';
        // No trailing newline on the last line.
        out << R"({"flow_rate":3.0,"volume_delta":30})";
    }

    TelemetryFeed feed(path, 2);
    REQUIRE(feed.start());

    std::vector<Reading> received;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!feed.finished() && std::chrono::steady_clock::now() < deadline)
    {
        feed.wait_for_readings(std::chrono::milliseconds(50));
        for (auto &reading : feed.drain())
        {
            received.push_back(reading);
        }
    }
    feed.stop();

    CHECK(feed.finished());
    REQUIRE(received.size() == 3);
    CHECK(received[0].volume_delta == 10.0);
    CHECK(received[1].flow_rate == 2.0);
    CHECK(received[2].volume_delta == 30.0);
    CHECK(feed.malformed_lines() == 1);
}

TEST_CASE("missing source cannot start")
{
    auto root = fl::test::make_temp_root("telemetry-missing");
    TelemetryFeed feed(root / "nope.ndjson");
    CHECK_FALSE(feed.start());
}
