#include "FakeSwarmEngine.hpp"
#include "TorrentFixtures.hpp"

#include "engine/LifecycleManager.hpp"
#include "engine/SchedulerService.hpp"
#include "engine/SeedStore.hpp"
#include "engine/StreamBroker.hpp"

#include <chrono>
#include <optional>
#include <string>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using ts::engine::AddSource;
using ts::engine::LifecycleManager;
using ts::engine::LifecyclePhase;
using ts::engine::OpenStreamResult;
using ts::engine::OpenStreamStatus;
using ts::engine::ReadResult;
using ts::engine::ReadStatus;
using ts::engine::SchedulerService;
using ts::engine::SeedStore;
using ts::engine::StreamBroker;

namespace
{

std::string const kHash = "0123456789abcdef0123456789abcdef01234567";

struct BrokerFixture
{
    explicit BrokerFixture(std::string_view tag)
        : seeds(ts::test::make_temp_root(tag), {}, false),
          lifecycle(engine, scheduler, seeds, {1000ms, false}),
          broker(engine, scheduler, lifecycle, {"downloads", 50ms})
    {
        engine.publish(ts::test::magnet_for(kHash),
                       ts::test::make_session(kHash, "Show",
                                              {"Show/e01.mkv",
                                               "Show/e02.mkv"}));
    }

    std::optional<OpenStreamResult> open(std::string path)
    {
        std::optional<OpenStreamResult> outcome;
        broker.open(AddSource::magnet(ts::test::magnet_for(kHash)), kHash,
                    std::move(path),
                    [&outcome](OpenStreamResult result)
                    { outcome = std::move(result); });
        return outcome;
    }

    void advance(std::chrono::milliseconds by)
    {
        now += by;
        scheduler.tick(now);
    }

    ts::test::FakeSwarmEngine engine;
    SchedulerService scheduler;
    SeedStore seeds;
    LifecycleManager lifecycle;
    StreamBroker broker;
    SchedulerService::Clock::time_point now = SchedulerService::Clock::now();
};

} // namespace

TEST_CASE("opening a file issues a ticket and counts one stream")
{
    BrokerFixture f("broker-open");
    auto outcome = f.open("/Show/e02.mkv");
    REQUIRE(outcome.has_value());
    CHECK(outcome->status == OpenStreamStatus::Ok);
    REQUIRE(outcome->ticket.has_value());
    CHECK(outcome->ticket->hash == kHash);
    CHECK(outcome->ticket->file_index == 1);
    CHECK(outcome->ticket->file_name == "e02.mkv");
    CHECK(outcome->ticket->file_path == "Show/e02.mkv");
    CHECK(outcome->ticket->length == 1000);

    CHECK(f.lifecycle.open_streams(kHash) == 1);
    CHECK(f.broker.open_tickets() == 1);
    CHECK(f.engine.last_add_options.deselect_all);
    CHECK(f.engine.last_add_options.save_path == "downloads");
    REQUIRE(f.engine.selected.size() == 1);
    CHECK(f.engine.selected[0].second == 1);
}

TEST_CASE("a second stream of the same torrent reuses the session")
{
    BrokerFixture f("broker-second");
    auto first = f.open("Show/e01.mkv");
    auto second = f.open("Show/e01.mkv");
    REQUIRE(first->ticket.has_value());
    REQUIRE(second->ticket.has_value());
    CHECK(first->ticket->id != second->ticket->id);
    CHECK(f.lifecycle.open_streams(kHash) == 2);
    CHECK(f.engine.session_count() == 1);
}

TEST_CASE("closing a ticket twice releases one reference")
{
    BrokerFixture f("broker-double-close");
    auto first = f.open("Show/e01.mkv");
    auto second = f.open("Show/e02.mkv");
    REQUIRE(first->ticket.has_value());
    REQUIRE(second->ticket.has_value());

    f.broker.close(first->ticket->id);
    f.broker.close(first->ticket->id);
    CHECK(f.lifecycle.open_streams(kHash) == 1);
    CHECK(f.lifecycle.phase(kHash) == LifecyclePhase::Active);

    f.broker.close(second->ticket->id);
    CHECK(f.lifecycle.phase(kHash) == LifecyclePhase::Draining);
    f.advance(1100ms);
    CHECK(f.engine.destroy_calls.size() == 1);
    CHECK(f.engine.destroy_calls[0].delete_data);
}

TEST_CASE("a missing file reports FileNotFound and lets the session age out")
{
    BrokerFixture f("broker-missing");
    auto outcome = f.open("Show/e09.mkv");
    REQUIRE(outcome.has_value());
    CHECK(outcome->status == OpenStreamStatus::FileNotFound);
    CHECK_FALSE(outcome->ticket.has_value());
    CHECK(f.lifecycle.open_streams(kHash) == 0);
    CHECK(f.lifecycle.teardown_pending(kHash));

    f.advance(1100ms);
    CHECK(f.engine.session_count() == 0);
}

TEST_CASE("no metadata within the timeout reports NoMetadata")
{
    BrokerFixture f("broker-timeout");
    std::string const unknown = "ffffffffffffffffffffffffffffffffffffffff";
    std::optional<OpenStreamResult> outcome;
    f.broker.open(AddSource::magnet(ts::test::magnet_for(unknown)), unknown,
                  "x/y.mkv",
                  [&outcome](OpenStreamResult result)
                  { outcome = std::move(result); });
    CHECK_FALSE(outcome.has_value());

    f.advance(100ms);
    REQUIRE(outcome.has_value());
    CHECK(outcome->status == OpenStreamStatus::NoMetadata);
    CHECK_FALSE(f.lifecycle.has_record(unknown));
}

TEST_CASE("an open during removal waits and then adds a fresh session")
{
    BrokerFixture f("broker-removing");
    auto first = f.open("Show/e01.mkv");
    REQUIRE(first->ticket.has_value());
    f.engine.hold_destroys = true;
    f.broker.close(first->ticket->id);
    f.advance(1100ms);
    REQUIRE(f.lifecycle.phase(kHash) == LifecyclePhase::Removing);

    auto const adds_before = f.engine.add_calls;
    std::optional<OpenStreamResult> first_retry;
    std::optional<OpenStreamResult> second_retry;
    for (auto *slot : {&first_retry, &second_retry})
    {
        f.broker.open(AddSource::magnet(ts::test::magnet_for(kHash)), kHash,
                      "Show/e01.mkv",
                      [slot](OpenStreamResult result)
                      { *slot = std::move(result); });
    }
    CHECK_FALSE(first_retry.has_value());
    CHECK(f.engine.add_calls == adds_before);

    f.engine.release_destroys();
    REQUIRE(first_retry.has_value());
    REQUIRE(second_retry.has_value());
    CHECK(first_retry->status == OpenStreamStatus::Ok);
    CHECK(second_retry->status == OpenStreamStatus::Ok);
    CHECK(f.engine.add_calls == adds_before + 2);
    CHECK(f.engine.session_count() == 1);
    CHECK(f.lifecycle.open_streams(kHash) == 2);
    CHECK(f.lifecycle.phase(kHash) == LifecyclePhase::Active);
}

TEST_CASE("pending reads are parked until the piece arrives")
{
    BrokerFixture f("broker-read");
    auto outcome = f.open("Show/e01.mkv");
    REQUIRE(outcome->ticket.has_value());
    auto const id = outcome->ticket->id;

    f.engine.piece_available = false;
    std::optional<ReadResult> chunk;
    f.broker.read(id, 100, 4096,
                  [&chunk](ReadResult result) { chunk = std::move(result); });
    CHECK_FALSE(chunk.has_value());
    CHECK(f.broker.pending_reads() == 1);

    f.broker.retry_pending_reads();
    CHECK_FALSE(chunk.has_value());

    f.engine.piece_available = true;
    f.broker.retry_pending_reads();
    REQUIRE(chunk.has_value());
    CHECK(chunk->status == ReadStatus::Ok);
    CHECK(chunk->data.size() == 900);
    CHECK(f.broker.pending_reads() == 0);
}

TEST_CASE("reads on a closed ticket report Gone")
{
    BrokerFixture f("broker-read-closed");
    auto outcome = f.open("Show/e01.mkv");
    REQUIRE(outcome->ticket.has_value());
    auto const id = outcome->ticket->id;

    f.engine.piece_available = false;
    bool parked_called = false;
    f.broker.read(id, 0, 10, [&](ReadResult) { parked_called = true; });
    f.broker.close(id);
    CHECK(f.broker.pending_reads() == 0);
    CHECK_FALSE(parked_called);

    std::optional<ReadResult> chunk;
    f.broker.read(id, 0, 10,
                  [&chunk](ReadResult result) { chunk = std::move(result); });
    REQUIRE(chunk.has_value());
    CHECK(chunk->status == ReadStatus::Gone);
}

TEST_CASE("find_file matches the full synthesized path")
{
    auto session = ts::test::make_session(kHash, "Show",
                                          {"Show/a/e01.mkv", "Show/e01.mkv"});
    auto file = ts::engine::find_file(session, "/Show/e01.mkv");
    REQUIRE(file.has_value());
    CHECK(file->index == 1);
    CHECK_FALSE(ts::engine::find_file(session, "e01.mkv").has_value());
    CHECK_FALSE(ts::engine::find_file(session, "").has_value());
}
