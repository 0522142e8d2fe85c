#include "engine/StatsAggregator.hpp"

#include "engine/LifecycleManager.hpp"
#include "utils/Duration.hpp"

#include <utility>

namespace ts::engine
{

StatsAggregator::StatsAggregator(SwarmEngine const &engine,
                                 LifecycleManager const &lifecycle,
                                 Clock::time_point started)
    : engine_(engine), lifecycle_(lifecycle), started_(started)
{
}

StreamStats StatsAggregator::collect(Clock::time_point now) const
{
    StreamStats stats;
    stats.uptime_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - started_);
    stats.uptime = utils::format_duration(stats.uptime_ms);
    stats.open_streams = lifecycle_.total_open_streams();

    auto const totals = engine_.totals();
    stats.download_rate = totals.download_rate;
    stats.upload_rate = totals.upload_rate;

    auto sessions = engine_.list();
    stats.torrents.reserve(sessions.size());
    for (auto &session : sessions)
    {
        ActiveTorrentStats entry;
        entry.open_streams = lifecycle_.open_streams(session.hash);
        entry.session = std::move(session);
        stats.torrents.push_back(std::move(entry));
    }
    return stats;
}

} // namespace ts::engine
