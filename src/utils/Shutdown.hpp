#pragma once

#include <chrono>

namespace ts::runtime
{

// SIGINT and SIGTERM request shutdown; nothing else is done in the handler.
void install_signal_handlers();

void request_shutdown() noexcept;
bool should_shutdown() noexcept;

// Blocks until shutdown is requested, checking every `poll`.
void wait_for_shutdown(std::chrono::milliseconds poll =
                           std::chrono::milliseconds(200));

} // namespace ts::runtime
