#include "engine/AddRace.hpp"

#include <memory>
#include <utility>

namespace ts::engine
{

namespace
{

struct RaceState
{
    bool settled = false;
    CancellationSource cancellation;
    SchedulerService::TaskId timer = 0;
    RaceCompletion completion;
};

} // namespace

void race_add(SwarmEngine &engine, SchedulerService &scheduler,
              AddSource source, AddOptions options,
              std::chrono::milliseconds timeout, RaceCompletion completion)
{
    auto state = std::make_shared<RaceState>();
    state->completion = std::move(completion);

    // Timer first: an engine that completes synchronously must still find
    // a timer to cancel.
    state->timer = scheduler.schedule_once(
        timeout,
        [state]
        {
            if (state->settled)
            {
                return;
            }
            state->settled = true;
            state->cancellation.cancel();
            auto done = std::move(state->completion);
            done(std::nullopt);
        });

    engine.add(std::move(source), std::move(options),
               state->cancellation.token(),
               [state, &scheduler](AddResult result)
               {
                   if (state->settled)
                   {
                       return;
                   }
                   state->settled = true;
                   scheduler.cancel(state->timer);
                   auto done = std::move(state->completion);
                   done(std::move(result));
               });
}

} // namespace ts::engine
