#include "TestUtils.hpp"
#include "engine/Core.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <doctest/doctest.h>

namespace
{

fl::engine::CoreSettings offline_settings(std::filesystem::path const &root)
{
    fl::engine::CoreSettings settings{};
    settings.state_path = root / "state.db";
    settings.read_input = false;
    return settings;
}

fl::telemetry::Reading reading(double flow, double ml)
{
    fl::telemetry::Reading r;
    r.flow_rate = flow;
    r.volume_delta = ml;
    r.timestamp = fl::engine::calendar::now_seconds();
    return r;
}

} // namespace

TEST_CASE("Core applies queued readings and publishes updates")
{
    auto root = fl::test::make_temp_root("core-ingest");
    auto core = fl::engine::Core::create(offline_settings(root));

    int updates = 0;
    core->events().subscribe<fl::engine::AccountingUpdatedEvent>(
        [&](auto const &event)
        {
            if (event.available)
                ++updates;
        });

    core->ingest(reading(2.0, 300.0));
    core->ingest(reading(1.5, 200.0));
    CHECK(core->process_pending() == 2);
    CHECK(core->process_pending() == 0);
    CHECK(updates == 2);

    auto snap = core->snapshot();
    CHECK(snap.available);
    CHECK(snap.flow_rate == 1.5);
    CHECK(snap.period(fl::engine::Period::Lifetime).volume ==
          doctest::Approx(0.5));
    CHECK(snap.counts.flow_samples == 2);
}

TEST_CASE("Core state survives a restart")
{
    auto root = fl::test::make_temp_root("core-restart");
    {
        auto core = fl::engine::Core::create(offline_settings(root));
        core->ingest(reading(1.0, 750.0));
        core->process_pending();
        CHECK(core->save_now());
    }

    auto core = fl::engine::Core::create(offline_settings(root));
    auto snap = core->snapshot();
    CHECK(snap.period(fl::engine::Period::Lifetime).volume ==
          doctest::Approx(0.75));
    CHECK(snap.counts.flow_samples == 1);

    auto offline = fl::engine::Core::offline_snapshot(
        offline_settings(root), {}, fl::engine::calendar::now_seconds());
    REQUIRE(offline);
    CHECK(offline->period(fl::engine::Period::Lifetime).volume ==
          doctest::Approx(0.75));
}

TEST_CASE("Core overrides are validated and persisted")
{
    auto root = fl::test::make_temp_root("core-overrides");
    {
        fl::engine::SettingsUpdate overrides;
        overrides.water_tariff = 3.0;
        overrides.leak_threshold = -1.0;
        auto core =
            fl::engine::Core::create(offline_settings(root), overrides);
        CHECK(core->settings().water_tariff == 3.0);
        CHECK(core->settings().leak_threshold == 0.0);

        fl::engine::SettingsUpdate update;
        update.unit_system = fl::engine::UnitSystem::Us;
        core->update_settings(update);
        CHECK(core->snapshot().settings.unit_system ==
              fl::engine::UnitSystem::Us);
    }

    auto core = fl::engine::Core::create(offline_settings(root));
    CHECK(core->settings().water_tariff == 3.0);
    CHECK(core->settings().unit_system == fl::engine::UnitSystem::Us);
}

TEST_CASE("Core run stops at end of input after a final save")
{
    auto root = fl::test::make_temp_root("core-run");
    auto input = root / "feed.ndjson";
    {
        std::ofstream out(input);
        out << R"({"flow_rate":2.0,"volume_delta":100})" << '\n';
        out << R"({"flow_rate":2.5,"volume_delta":150})" << '\n';
        out << R"({"available":false})" << '\n';
        out << R"({"flow_rate":0.5,"volume_delta":50})" << '\n';
    }

    auto settings = offline_settings(root);
    settings.read_input = true;
    settings.input_path = input;
    auto core = fl::engine::Core::create(settings);

    int saves = 0;
    core->events().subscribe<fl::engine::StateSavedEvent>(
        [&](auto const &event)
        {
            if (event.success)
                ++saves;
        });

    core->run();
    CHECK_FALSE(core->is_running());
    CHECK(saves >= 1);
    CHECK(core->snapshot().period(fl::engine::Period::Lifetime).volume ==
          doctest::Approx(0.3));

    auto offline = fl::engine::Core::offline_snapshot(
        offline_settings(root), {}, fl::engine::calendar::now_seconds());
    REQUIRE(offline);
    CHECK(offline->period(fl::engine::Period::Lifetime).volume ==
          doctest::Approx(0.3));
}

TEST_CASE("offline snapshot needs an existing store")
{
    auto root = fl::test::make_temp_root("core-offline-missing");
    auto snap = fl::engine::Core::offline_snapshot(
        offline_settings(root), {}, fl::engine::calendar::now_seconds());
    CHECK_FALSE(snap.has_value());
    CHECK_FALSE(std::filesystem::exists(root / "state.db"));
}
