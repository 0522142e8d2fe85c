#pragma once

#include "engine/SwarmEngine.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace ts::engine
{

class LifecycleManager;

struct ActiveTorrentStats
{
    SessionInfo session;
    int open_streams = 0;
};

struct StreamStats
{
    std::string uptime;
    std::chrono::milliseconds uptime_ms{0};
    int open_streams = 0;
    std::uint64_t download_rate = 0;
    std::uint64_t upload_rate = 0;
    std::vector<ActiveTorrentStats> torrents;
};

class StatsAggregator
{
  public:
    using Clock = std::chrono::steady_clock;

    StatsAggregator(SwarmEngine const &engine,
                    LifecycleManager const &lifecycle,
                    Clock::time_point started = Clock::now());

    StreamStats collect(Clock::time_point now = Clock::now()) const;

  private:
    SwarmEngine const &engine_;
    LifecycleManager const &lifecycle_;
    Clock::time_point started_;
};

} // namespace ts::engine
