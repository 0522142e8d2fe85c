#pragma once

#include "engine/SchedulerService.hpp"
#include "engine/SwarmEngine.hpp"

#include <chrono>
#include <functional>
#include <optional>

namespace ts::engine
{

// nullopt means the timeout won.
using RaceCompletion = std::function<void(std::optional<AddResult>)>;

// Adds `source` to `engine` and races the add against `timeout`. Exactly
// one outcome reaches `completion`; when the timeout wins the add is
// cancelled and the engine drops whatever it had started.
void race_add(SwarmEngine &engine, SchedulerService &scheduler,
              AddSource source, AddOptions options,
              std::chrono::milliseconds timeout, RaceCompletion completion);

} // namespace ts::engine
