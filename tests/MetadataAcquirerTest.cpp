#include "FakeSwarmEngine.hpp"

#include "engine/MetadataAcquirer.hpp"
#include "engine/SchedulerService.hpp"

#include <chrono>
#include <optional>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using ts::engine::AddSource;
using ts::engine::MetadataAcquirer;
using ts::engine::SchedulerService;
using ts::engine::TorrentSummary;

namespace
{

std::string const kHash = "0123456789abcdef0123456789abcdef01234567";

} // namespace

TEST_CASE("resolve returns the summary and drops the metadata session")
{
    ts::test::FakeSwarmEngine engine;
    SchedulerService scheduler;
    engine.publish(ts::test::magnet_for(kHash),
                   ts::test::make_session(kHash, "Show",
                                          {"Show/a.mkv", "Show/b.mkv"}));
    MetadataAcquirer acquirer(engine, scheduler, 5000ms, "/tmp/scratch");

    int calls = 0;
    std::optional<TorrentSummary> result;
    acquirer.resolve(AddSource::magnet(ts::test::magnet_for(kHash)),
                     [&](std::optional<TorrentSummary> summary)
                     {
                         ++calls;
                         result = std::move(summary);
                     });

    CHECK(calls == 1);
    REQUIRE(result.has_value());
    CHECK(result->name == "Show");
    CHECK(result->hash == kHash);
    REQUIRE(result->files.size() == 2);
    CHECK(result->files[1].path == "Show/b.mkv");
    CHECK(result->size == 2000);

    CHECK(engine.last_add_options.upload_only);
    CHECK(engine.last_add_options.deselect_all);
    CHECK(engine.last_add_options.save_path == "/tmp/scratch");
    REQUIRE(engine.destroy_calls.size() == 1);
    CHECK(engine.destroy_calls[0].delete_data);
    CHECK(engine.session_count() == 0);
    CHECK(acquirer.in_flight() == 0);
    CHECK(scheduler.pending() == 0);
}

TEST_CASE("resolve yields nullopt once the timeout wins")
{
    ts::test::FakeSwarmEngine engine;
    SchedulerService scheduler;
    MetadataAcquirer acquirer(engine, scheduler, 50ms, "/tmp/scratch");

    int calls = 0;
    bool got_summary = true;
    acquirer.resolve(AddSource::magnet(ts::test::magnet_for(kHash)),
                     [&](std::optional<TorrentSummary> summary)
                     {
                         ++calls;
                         got_summary = summary.has_value();
                     });
    CHECK(calls == 0);
    CHECK(acquirer.in_flight() == 1);

    scheduler.tick(SchedulerService::Clock::now() + 100ms);
    CHECK(calls == 1);
    CHECK_FALSE(got_summary);
    CHECK(acquirer.in_flight() == 0);
}

TEST_CASE("metadata arriving after the timeout is discarded")
{
    ts::test::FakeSwarmEngine engine;
    SchedulerService scheduler;
    engine.hold_adds = true;
    engine.publish(ts::test::magnet_for(kHash),
                   ts::test::make_session(kHash, "Show"));
    MetadataAcquirer acquirer(engine, scheduler, 50ms, "/tmp/scratch");

    int calls = 0;
    acquirer.resolve(AddSource::magnet(ts::test::magnet_for(kHash)),
                     [&](std::optional<TorrentSummary> summary)
                     {
                         ++calls;
                         CHECK_FALSE(summary.has_value());
                     });
    scheduler.tick(SchedulerService::Clock::now() + 100ms);
    CHECK(calls == 1);

    engine.release_adds();
    CHECK(calls == 1);
    CHECK(engine.cancelled_adds == 1);
    CHECK(engine.session_count() == 0);
}

TEST_CASE("a rejected source resolves to nullopt straight away")
{
    ts::test::FakeSwarmEngine engine;
    SchedulerService scheduler;
    MetadataAcquirer acquirer(engine, scheduler, 5000ms, "/tmp/scratch");

    int calls = 0;
    acquirer.resolve(AddSource::metainfo({'x', 'y'}),
                     [&](std::optional<TorrentSummary> summary)
                     {
                         ++calls;
                         CHECK_FALSE(summary.has_value());
                     });
    CHECK(calls == 1);
    CHECK(scheduler.pending() == 0);
}
