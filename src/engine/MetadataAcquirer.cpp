#include "engine/MetadataAcquirer.hpp"

#include "engine/AddRace.hpp"
#include "engine/Metainfo.hpp"
#include "utils/Log.hpp"

#include <utility>

namespace ts::engine
{

MetadataAcquirer::MetadataAcquirer(SwarmEngine &engine,
                                   SchedulerService &scheduler,
                                   std::chrono::milliseconds timeout,
                                   std::filesystem::path scratch_dir)
    : engine_(engine), scheduler_(scheduler), timeout_(timeout),
      scratch_dir_(std::move(scratch_dir))
{
}

void MetadataAcquirer::resolve(AddSource source, Callback callback)
{
    AddOptions options;
    options.save_path = scratch_dir_;
    options.deselect_all = true;
    options.upload_only = true;

    ++in_flight_;
    race_add(
        engine_, scheduler_, std::move(source), std::move(options), timeout_,
        [this, callback = std::move(callback)](std::optional<AddResult> result)
        {
            --in_flight_;
            if (!result)
            {
                TS_LOG_INFO("No metadata within {} ms", timeout_.count());
                callback(std::nullopt);
                return;
            }
            if (!result->session)
            {
                TS_LOG_WARN("Metadata add failed: {}", result->error);
                callback(std::nullopt);
                return;
            }
            auto summary = summary_from_session(*result->session);
            TS_LOG_INFO("Fetched info: {}", summary.name);
            // The engine reports a missing session as a plain `false`, so a
            // second destroy from a concurrent resolve is harmless.
            engine_.destroy(summary.hash, true, [](bool) {});
            callback(std::move(summary));
        });
}

} // namespace ts::engine
