#include "engine/SeedReconciler.hpp"

#include "engine/LifecycleManager.hpp"
#include "engine/Metainfo.hpp"
#include "engine/SeedStore.hpp"
#include "engine/SwarmEngine.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <exception>
#include <string>
#include <system_error>
#include <utility>

namespace ts::engine
{

SeedReconciler::SeedReconciler(SwarmEngine &engine,
                               LifecycleManager &lifecycle, SeedStore &seeds,
                               std::filesystem::path download_dir)
    : engine_(engine), lifecycle_(lifecycle), seeds_(seeds),
      download_dir_(std::move(download_dir))
{
}

ReconcileReport SeedReconciler::reconcile()
{
    ReconcileReport report;
    std::error_code ec;
    if (!std::filesystem::is_directory(seeds_.directory(), ec))
    {
        TS_LOG_INFO("No files to auto seed; seed directory {} does not exist",
                    seeds_.directory().string());
        return report;
    }
    auto entries = seeds_.list(ec);
    if (ec)
    {
        TS_LOG_WARN("Failed to list seed directory {}: {}",
                    seeds_.directory().string(), ec.message());
        return report;
    }

    for (auto const &path : entries)
    {
        if (path.extension() != ".torrent")
        {
            ++report.skipped;
            continue;
        }
        try
        {
            std::error_code read_ec;
            auto bytes = utils::read_file_bytes(path, read_ec);
            if (read_ec)
            {
                TS_LOG_WARN("Failed to read seed file {}: {}", path.string(),
                            read_ec.message());
                ++report.failed;
                continue;
            }
            auto hash = compute_content_id(bytes);
            if (!hash)
            {
                TS_LOG_WARN("Seed file {} is not a valid torrent",
                            path.string());
                ++report.failed;
                continue;
            }
            auto const name = path.stem().string();
            if (!lifecycle_.admit_seed(*hash, name))
            {
                TS_LOG_DEBUG("Seed file {} already tracked as {}", name,
                             *hash);
                ++report.skipped;
                continue;
            }
            AddOptions options;
            options.save_path = download_dir_;
            engine_.add(AddSource::metainfo(std::move(bytes)),
                        std::move(options), CancellationToken{},
                        [name](AddResult result)
                        {
                            if (!result.session)
                            {
                                TS_LOG_WARN("Failed to seed {}: {}", name,
                                            result.error);
                            }
                        });
            ++report.admitted;
        }
        catch (std::exception const &ex)
        {
            TS_LOG_WARN("Failed to restore seed file {}: {}", path.string(),
                        ex.what());
            ++report.failed;
        }
    }
    TS_LOG_INFO("Seed directory reconciled: {} admitted, {} failed, {} "
                "skipped",
                report.admitted, report.failed, report.skipped);
    return report;
}

} // namespace ts::engine
