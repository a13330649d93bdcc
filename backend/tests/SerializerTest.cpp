#include "TestUtils.hpp"
#include "report/Serializer.hpp"
#include "utils/Json.hpp"

#include <string>

#include <doctest/doctest.h>

namespace
{

fl::engine::AccountingSnapshot sample_snapshot()
{
    fl::engine::AccountingSnapshot snap;
    snap.taken_at = fl::test::local("2024-05-05T12:30:00");
    snap.available = true;
    snap.flow_rate = 1.25;
    snap.volume_delta = 40.0;
    snap.volume_last_reset = snap.taken_at;
    for (auto period : fl::engine::kAllPeriods)
    {
        auto &entry = snap.periods[fl::engine::period_index(period)];
        entry.period = period;
        entry.volume = 10.0;
        entry.cost = 0.02;
        entry.reset_at = fl::test::local("2024-05-05T12:00:00");
    }
    snap.statistics.avg_flow_1h = 1.1;
    snap.hourly_max_flow = 3.0;
    snap.counts.flow_samples = 12;
    snap.settings.water_tariff = 2.0;
    snap.settings.unit_system = fl::engine::UnitSystem::Us;
    return snap;
}

} // namespace

TEST_CASE("status report carries periods, statistics and settings")
{
    auto payload = fl::report::serialize_status(sample_snapshot());
    auto doc = fl::json::Document::parse(payload);
    REQUIRE(doc.is_valid());
    auto *root = doc.root();

    CHECK(fl::json::get_bool(root, "available") == true);
    CHECK(fl::json::get_number(root, "flow_rate") == 1.25);
    CHECK(fl::json::get_bool(root, "water_leak_detected") == false);

    auto *periods = yyjson_obj_get(root, "periods");
    REQUIRE(periods != nullptr);
    auto *hourly = yyjson_obj_get(periods, "hourly");
    REQUIRE(hourly != nullptr);
    CHECK(fl::json::get_number(hourly, "volume") == 10.0);
    CHECK(fl::json::get_number(hourly, "cost") == 0.02);
    auto reset = fl::json::get_string(hourly, "reset_at");
    REQUIRE(reset);
    CHECK(fl::engine::calendar::parse_iso8601(*reset) ==
          fl::test::local("2024-05-05T12:00:00"));

    auto *lifetime = yyjson_obj_get(periods, "lifetime");
    REQUIRE(lifetime != nullptr);
    auto started = fl::json::get_string(lifetime, "reset_at");
    REQUIRE(started);
    CHECK(fl::engine::calendar::parse_iso8601(*started) ==
          fl::test::local("2024-05-05T12:00:00"));

    auto *stats = yyjson_obj_get(root, "statistics");
    REQUIRE(stats != nullptr);
    CHECK(fl::json::get_number(stats, "avg_flow_1h") == 1.1);
    CHECK(yyjson_is_null(yyjson_obj_get(stats, "peak_flow_24h")));
    CHECK(yyjson_is_null(yyjson_obj_get(root, "hourly_min_flow")));

    auto *buffers = yyjson_obj_get(root, "buffers");
    CHECK(fl::json::get_int(buffers, "flow_samples") == 12);

    auto *settings = yyjson_obj_get(root, "settings");
    CHECK(fl::json::get_string(settings, "unitSystem") == std::string("us"));
    CHECK(fl::json::get_number(settings, "waterTariff") == 2.0);
}

TEST_CASE("lifetime start is null when it was never recorded")
{
    auto snap = sample_snapshot();
    snap.periods[fl::engine::period_index(fl::engine::Period::Lifetime)]
        .reset_known = false;
    auto doc = fl::json::Document::parse(fl::report::serialize_status(snap));
    REQUIRE(doc.is_valid());
    auto *periods = yyjson_obj_get(doc.root(), "periods");
    auto *lifetime = yyjson_obj_get(periods, "lifetime");
    REQUIRE(lifetime != nullptr);
    CHECK(yyjson_is_null(yyjson_obj_get(lifetime, "reset_at")));
    CHECK(fl::json::get_number(lifetime, "volume") == 10.0);
}

TEST_CASE("leak event report names the transition")
{
    fl::engine::LeakEvent event{fl::engine::LeakEventKind::Cleared, 0.0, 0.05};
    auto payload = fl::report::serialize_leak_event(event, 0.0);
    auto doc = fl::json::Document::parse(payload);
    REQUIRE(doc.is_valid());
    CHECK(fl::json::get_string(doc.root(), "event") ==
          std::string("water_leak_cleared"));
    CHECK(fl::json::get_number(doc.root(), "threshold") == 0.05);
    CHECK(fl::json::get_string(doc.root(), "at").has_value());
}
