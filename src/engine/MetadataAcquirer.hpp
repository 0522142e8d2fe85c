#pragma once

#include "engine/SchedulerService.hpp"
#include "engine/SwarmEngine.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>

namespace ts::engine
{

// Learns a torrent's file listing through a metadata-only engine that is
// kept apart from the streaming engine. Sessions it creates are destroyed
// as soon as the metadata arrives or the timeout wins.
class MetadataAcquirer
{
  public:
    // nullopt: no metadata within the timeout, or the source was rejected.
    using Callback = std::function<void(std::optional<TorrentSummary>)>;

    MetadataAcquirer(SwarmEngine &engine, SchedulerService &scheduler,
                     std::chrono::milliseconds timeout,
                     std::filesystem::path scratch_dir);

    void resolve(AddSource source, Callback callback);

    std::size_t in_flight() const noexcept
    {
        return in_flight_;
    }

  private:
    SwarmEngine &engine_;
    SchedulerService &scheduler_;
    std::chrono::milliseconds timeout_;
    std::filesystem::path scratch_dir_;
    std::size_t in_flight_ = 0;
};

} // namespace ts::engine
