#pragma once

#include <cstddef>
#include <filesystem>

namespace ts::engine
{

class LifecycleManager;
class SeedStore;
class SwarmEngine;

struct ReconcileReport
{
    std::size_t admitted = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
};

// Restores the torrents left in the seed directory by a previous run. Each
// restored torrent gets a full grace period and no streams.
class SeedReconciler
{
  public:
    SeedReconciler(SwarmEngine &engine, LifecycleManager &lifecycle,
                   SeedStore &seeds, std::filesystem::path download_dir);

    // Never throws; per-file failures are logged and counted.
    ReconcileReport reconcile();

  private:
    SwarmEngine &engine_;
    LifecycleManager &lifecycle_;
    SeedStore &seeds_;
    std::filesystem::path download_dir_;
};

} // namespace ts::engine
