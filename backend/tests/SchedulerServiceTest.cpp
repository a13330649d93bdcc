#include "engine/SchedulerService.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using fl::engine::SchedulerService;

TEST_CASE("tasks run once per elapsed interval in due order")
{
    SchedulerService scheduler;
    auto start = SchedulerService::Clock::time_point{};
    std::vector<std::string> order;
    scheduler.schedule("slow", 300ms, [&] { order.push_back("slow"); }, start);
    scheduler.schedule("fast", 100ms, [&] { order.push_back("fast"); }, start);

    CHECK(scheduler.tick(start + 50ms) == 0);
    CHECK(scheduler.time_until_next_task(start + 50ms) == 50ms);

    CHECK(scheduler.tick(start + 100ms) == 1);
    CHECK(scheduler.tick(start + 400ms) == 2);
    CHECK(order == std::vector<std::string>{"fast", "fast", "slow"});
}

TEST_CASE("reschedule restarts the countdown with the new period")
{
    SchedulerService scheduler;
    auto start = SchedulerService::Clock::time_point{};
    int runs = 0;
    auto id = scheduler.schedule("save", 10s, [&] { ++runs; }, start);

    REQUIRE(scheduler.reschedule(id, 2s, start + 1s));
    CHECK(scheduler.tick(start + 2s) == 0);
    CHECK(scheduler.tick(start + 3s) == 1);
    CHECK(runs == 1);
    CHECK_FALSE(scheduler.reschedule(id + 100, 1s, start));
}

TEST_CASE("cancelled tasks no longer run")
{
    SchedulerService scheduler;
    auto start = SchedulerService::Clock::time_point{};
    int runs = 0;
    auto id = scheduler.schedule("flush", 1s, [&] { ++runs; }, start);
    CHECK(scheduler.task_count() == 1);
    CHECK(scheduler.cancel(id));
    CHECK_FALSE(scheduler.cancel(id));
    CHECK(scheduler.tick(start + 5s) == 0);
    CHECK(runs == 0);
    CHECK(scheduler.time_until_next_task(start) == 24h);
}
