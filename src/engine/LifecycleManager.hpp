#pragma once

#include "engine/SchedulerService.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ts::engine
{

class SeedStore;
class SwarmEngine;

struct LifecycleSettings
{
    std::chrono::milliseconds grace_period{60000};
    bool keep_downloaded_files = false;
};

enum class LifecyclePhase
{
    Active,   // open_streams > 0, no timer
    Draining, // open_streams == 0, teardown timer armed
    Removing  // timer fired, engine destroy in flight
};

char const *to_string(LifecyclePhase phase) noexcept;

// Per-torrent record. A torrent with no record has no open streams and no
// pending teardown.
struct SessionLifecycle
{
    LifecyclePhase phase = LifecyclePhase::Active;
    int open_streams = 0;
    std::optional<SchedulerService::TaskId> timer;
    SchedulerService::Clock::time_point deadline{};
    std::vector<std::function<void()>> teardown_waiters;
};

// Counts the streams attached to each torrent and retires a torrent once
// nobody has watched it for the grace period. Lives on the engine thread:
// every method, timer and engine completion runs there.
class LifecycleManager
{
  public:
    LifecycleManager(SwarmEngine &engine, SchedulerService &scheduler,
                     SeedStore &seeds, LifecycleSettings settings);
    LifecycleManager(LifecycleManager const &) = delete;
    LifecycleManager &operator=(LifecycleManager const &) = delete;
    ~LifecycleManager();

    // Cancels any pending teardown. Returns false, and counts nothing, while
    // the torrent is being removed; the caller waits with after_teardown()
    // and adds a fresh session.
    bool stream_opened(std::string const &hash, std::string_view file_name);

    // A close without a matching open is clamped: it behaves like the last
    // close of the torrent and is logged as a warning.
    void stream_closed(std::string const &hash, std::string_view file_name);

    // Registers a torrent restored from the seed directory: no streams, a
    // full grace period. Returns false when a record already exists.
    bool admit_seed(std::string const &hash, std::string_view name);

    // Runs `callback` once the in-flight removal of `hash` finished.
    // Returns false (and drops the callback) when nothing is being removed.
    bool after_teardown(std::string const &hash,
                        std::function<void()> callback);

    bool has_record(std::string const &hash) const;
    std::optional<LifecyclePhase> phase(std::string const &hash) const;
    int open_streams(std::string const &hash) const;
    int total_open_streams() const;
    bool teardown_pending(std::string const &hash) const;
    std::optional<SchedulerService::Clock::time_point>
    teardown_deadline(std::string const &hash) const;
    std::size_t size() const noexcept;

  private:
    void arm_teardown(std::string const &hash, SessionLifecycle &record);
    void on_teardown_due(std::string const &hash);
    void finish_teardown(std::string const &hash, std::string const &name,
                         bool removed);

    SwarmEngine &engine_;
    SchedulerService &scheduler_;
    SeedStore &seeds_;
    LifecycleSettings settings_;
    std::unordered_map<std::string, SessionLifecycle> records_;
};

} // namespace ts::engine
