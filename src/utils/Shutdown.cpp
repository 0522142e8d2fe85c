#include "utils/Shutdown.hpp"

#include <atomic>
#include <csignal>
#include <thread>

namespace ts::runtime
{

namespace
{

std::atomic_bool shutdown_flag{false};

void on_termination_signal(int)
{
    shutdown_flag.store(true, std::memory_order_relaxed);
}

} // namespace

void install_signal_handlers()
{
    std::signal(SIGINT, on_termination_signal);
    std::signal(SIGTERM, on_termination_signal);
}

void request_shutdown() noexcept
{
    shutdown_flag.store(true, std::memory_order_relaxed);
}

bool should_shutdown() noexcept
{
    return shutdown_flag.load(std::memory_order_relaxed);
}

void wait_for_shutdown(std::chrono::milliseconds poll)
{
    while (!should_shutdown())
    {
        std::this_thread::sleep_for(poll);
    }
}

} // namespace ts::runtime
