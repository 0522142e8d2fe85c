#include "engine/SchedulerService.hpp"

#include <chrono>
#include <vector>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using ts::engine::SchedulerService;

TEST_CASE("one-shot tasks run once when due")
{
    SchedulerService scheduler;
    auto const start = SchedulerService::Clock::now();
    int runs = 0;
    auto id = scheduler.schedule_once(100ms, [&] { ++runs; });

    CHECK(scheduler.is_scheduled(id));
    CHECK(scheduler.tick(start) == 0);
    CHECK(scheduler.tick(start + 500ms) == 1);
    CHECK(scheduler.tick(start + 1s) == 0);
    CHECK(runs == 1);
    CHECK_FALSE(scheduler.is_scheduled(id));
    CHECK_FALSE(scheduler.cancel(id));
}

TEST_CASE("cancelled tasks never run")
{
    SchedulerService scheduler;
    auto const start = SchedulerService::Clock::now();
    bool ran = false;
    auto id = scheduler.schedule_once(10ms, [&] { ran = true; });
    CHECK(scheduler.cancel(id));
    CHECK(scheduler.pending() == 0);
    scheduler.tick(start + 1s);
    CHECK_FALSE(ran);
}

TEST_CASE("repeating tasks reschedule from the tick time")
{
    SchedulerService scheduler;
    auto const start = SchedulerService::Clock::now();
    int runs = 0;
    auto id = scheduler.schedule(100ms, [&] { ++runs; });

    scheduler.tick(start + 150ms);
    scheduler.tick(start + 200ms);
    scheduler.tick(start + 300ms);
    CHECK(runs == 2);
    CHECK(scheduler.is_scheduled(id));

    scheduler.cancel(id);
    scheduler.tick(start + 1s);
    CHECK(runs == 2);
}

TEST_CASE("a task may cancel itself or schedule another")
{
    SchedulerService scheduler;
    auto const start = SchedulerService::Clock::now();
    std::vector<int> order;
    SchedulerService::TaskId self = 0;
    self = scheduler.schedule(50ms,
                              [&]
                              {
                                  order.push_back(1);
                                  scheduler.cancel(self);
                                  scheduler.schedule_once(
                                      10s, [&] { order.push_back(2); });
                              });
    scheduler.tick(start + 100ms);
    CHECK(order == std::vector<int>{1});
    CHECK(scheduler.pending() == 1);
    scheduler.tick(start + 1min);
    CHECK(order == std::vector<int>{1, 2});
}

TEST_CASE("time_until_next_task reports the earliest live task")
{
    SchedulerService scheduler;
    auto const start = SchedulerService::Clock::now();
    CHECK(scheduler.time_until_next_task(start) >= 1h);

    auto late = scheduler.schedule_once(10s, [] {});
    scheduler.schedule_once(2s, [] {});
    auto wait = scheduler.time_until_next_task(start);
    CHECK(wait <= 2s);
    CHECK(wait > 1s);

    scheduler.cancel(late);
    CHECK(scheduler.time_until_next_task(start + 5s) == 0ms);
}
