#include "TestUtils.hpp"
#include "engine/ConfigurationService.hpp"
#include "engine/Core.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/PersistenceManager.hpp"
#include "utils/StateStore.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <doctest/doctest.h>

TEST_CASE("ConfigurationService persists accepted settings")
{
    auto temp_root = fl::test::make_temp_root("config-persist");
    auto db_path = temp_root / "state.db";
    {
        fl::engine::PersistenceManager persistence(db_path);
        REQUIRE(persistence.is_valid());

        fl::engine::EventBus bus;
        int notifications = 0;
        bus.subscribe<fl::engine::SettingsChangedEvent>(
            [&](auto const &) { ++notifications; });

        fl::engine::CoreSettings defaults;
        defaults.state_path = db_path;
        fl::engine::ConfigurationService config(&persistence, &bus, defaults);
        CHECK(config.get().water_tariff == 0.0);
        CHECK_FALSE(config.is_dirty());

        fl::engine::SettingsUpdate update;
        update.water_tariff = 2.5;
        update.leak_threshold = 25.0;
        update.unit_system = fl::engine::UnitSystem::Us;
        auto result = config.update(update);

        CHECK(result.accounting_changed);
        CHECK(result.rejected == std::vector<std::string>{"leakThreshold"});
        CHECK(notifications == 1);
        CHECK(config.is_dirty());

        auto modified = config.get();
        CHECK(modified.water_tariff == 2.5);
        CHECK(modified.leak_threshold == 0.0);
        CHECK(modified.unit_system == fl::engine::UnitSystem::Us);

        config.persist_if_dirty();
        CHECK_FALSE(config.is_dirty());

        fl::storage::Database reader(db_path);
        REQUIRE(reader.is_valid());
        CHECK(reader.get_setting("waterTariff") == std::string("2.5"));
        CHECK(reader.get_setting("unitSystem") == std::string("us"));
        CHECK(reader.get_setting("saveIntervalSeconds") == std::string("300"));
    }

    fl::engine::PersistenceManager reopened(db_path);
    auto loaded = reopened.load_settings(fl::engine::CoreSettings{});
    CHECK(loaded.water_tariff == 2.5);
    CHECK(loaded.unit_system == fl::engine::UnitSystem::Us);
    CHECK(loaded.save_interval_seconds == 300);
}

TEST_CASE("unchanged values do not mark the configuration dirty")
{
    fl::engine::EventBus bus;
    int notifications = 0;
    bus.subscribe<fl::engine::SettingsChangedEvent>(
        [&](auto const &) { ++notifications; });
    fl::engine::ConfigurationService config(nullptr, &bus, {});

    fl::engine::SettingsUpdate update;
    update.water_tariff = 0.0;
    update.save_interval_seconds = 5;
    auto result = config.update(update);
    CHECK_FALSE(result.persist);
    CHECK(result.rejected == std::vector<std::string>{"saveIntervalSeconds"});
    CHECK(notifications == 0);
    CHECK_FALSE(config.is_dirty());
}

TEST_CASE("invalid stored settings fall back to defaults")
{
    auto temp_root = fl::test::make_temp_root("config-invalid");
    auto db_path = temp_root / "state.db";
    {
        fl::storage::Database db(db_path);
        REQUIRE(db.is_valid());
        db.set_setting("waterTariff", "cheap");
        db.set_setting("leakThreshold", "99");
        db.set_setting("unitSystem", "furlongs");
        db.set_setting("saveIntervalSeconds", "60");
    }
    fl::engine::PersistenceManager persistence(db_path);
    fl::engine::CoreSettings defaults;
    defaults.water_tariff = 1.0;
    auto loaded = persistence.load_settings(defaults);
    CHECK(loaded.water_tariff == 1.0);
    CHECK(loaded.leak_threshold == 0.0);
    CHECK(loaded.unit_system == fl::engine::UnitSystem::Metric);
    CHECK(loaded.save_interval_seconds == 60);
}
