#include "FakeSwarmEngine.hpp"
#include "TorrentFixtures.hpp"

#include "engine/LifecycleManager.hpp"
#include "engine/SchedulerService.hpp"
#include "engine/SeedStore.hpp"
#include "engine/StatsAggregator.hpp"
#include "utils/Duration.hpp"

#include <chrono>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using ts::engine::LifecycleManager;
using ts::engine::SchedulerService;
using ts::engine::SeedStore;
using ts::engine::StatsAggregator;

TEST_CASE("collect reports uptime, rates and per-torrent stream counts")
{
    ts::test::FakeSwarmEngine engine;
    SchedulerService scheduler;
    SeedStore seeds(ts::test::make_temp_root("stats-collect"), {}, false);
    LifecycleManager lifecycle(engine, scheduler, seeds, {60000ms, false});

    auto a = ts::test::make_session("aaaa", "Alpha", {"Alpha/a.mkv",
                                                      "Alpha/b.mkv"});
    a.download_rate = 1000;
    a.upload_rate = 10;
    a.peers = 4;
    auto b = ts::test::make_session("bbbb", "Beta");
    b.download_rate = 500;
    b.upload_rate = 5;
    engine.insert(a);
    engine.insert(b);
    lifecycle.stream_opened("aaaa", "a.mkv");
    lifecycle.stream_opened("aaaa", "b.mkv");
    lifecycle.stream_opened("bbbb", "Beta");

    auto const started = StatsAggregator::Clock::now();
    StatsAggregator aggregator(engine, lifecycle, started);
    auto stats = aggregator.collect(started + 125s);

    CHECK(stats.uptime_ms == 125000ms);
    CHECK(stats.uptime == "2m 5s");
    CHECK(stats.open_streams == 3);
    CHECK(stats.download_rate == 1500);
    CHECK(stats.upload_rate == 15);
    REQUIRE(stats.torrents.size() == 2);
    CHECK(stats.torrents[0].session.name == "Alpha");
    CHECK(stats.torrents[0].open_streams == 2);
    CHECK(stats.torrents[0].session.peers == 4);
    CHECK(stats.torrents[0].session.files.size() == 2);
    CHECK(stats.torrents[1].session.name == "Beta");
    CHECK(stats.torrents[1].open_streams == 1);
}

TEST_CASE("a draining torrent stays listed with no streams")
{
    ts::test::FakeSwarmEngine engine;
    SchedulerService scheduler;
    SeedStore seeds(ts::test::make_temp_root("stats-draining"), {}, false);
    LifecycleManager lifecycle(engine, scheduler, seeds, {60000ms, false});
    engine.insert(ts::test::make_session("cccc", "Gamma"));
    lifecycle.stream_opened("cccc", "Gamma");
    lifecycle.stream_closed("cccc", "Gamma");

    StatsAggregator aggregator(engine, lifecycle);
    auto stats = aggregator.collect();
    CHECK(stats.open_streams == 0);
    REQUIRE(stats.torrents.size() == 1);
    CHECK(stats.torrents[0].open_streams == 0);
}

TEST_CASE("format_duration keeps the two most significant units")
{
    using ts::utils::format_duration;
    CHECK(format_duration(0ms) == "0s");
    CHECK(format_duration(-5s) == "0s");
    CHECK(format_duration(42s) == "42s");
    CHECK(format_duration(3723s) == "1h 2m");
    CHECK(format_duration(std::chrono::hours(50)) == "2d 2h");
}
