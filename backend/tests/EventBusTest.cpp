#include "engine/EventBus.hpp"
#include "engine/Events.hpp"

#include <doctest/doctest.h>

TEST_CASE("events reach only subscribers of their type")
{
    fl::engine::EventBus bus;
    int saved = 0;
    int updated = 0;
    bus.subscribe<fl::engine::StateSavedEvent>(
        [&](auto const &event)
        {
            if (event.success)
                ++saved;
        });
    bus.subscribe<fl::engine::AccountingUpdatedEvent>(
        [&](auto const &) { ++updated; });

    CHECK(bus.publish(fl::engine::StateSavedEvent{10.0, true}) == 1);
    CHECK(bus.publish(fl::engine::SettingsChangedEvent{}) == 0);
    CHECK(saved == 1);
    CHECK(updated == 0);
}

TEST_CASE("unsubscribed handlers stop receiving events")
{
    fl::engine::EventBus bus;
    int calls = 0;
    auto id = bus.subscribe<fl::engine::SettingsChangedEvent>(
        [&](auto const &) { ++calls; });
    bus.publish(fl::engine::SettingsChangedEvent{});
    CHECK(bus.unsubscribe(id));
    CHECK_FALSE(bus.unsubscribe(id));
    bus.publish(fl::engine::SettingsChangedEvent{});
    CHECK(calls == 1);
}
