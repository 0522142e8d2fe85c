#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ts::utils
{

// "2d 3h", "1h 4m", "5m 12s", "42s". Shows the two most significant units.
inline std::string format_duration(std::chrono::milliseconds elapsed)
{
    auto total = elapsed.count() < 0 ? std::int64_t{0}
                                     : static_cast<std::int64_t>(
                                           elapsed.count() / 1000);
    auto const days = total / 86400;
    auto const hours = (total % 86400) / 3600;
    auto const minutes = (total % 3600) / 60;
    auto const seconds = total % 60;
    if (days > 0)
    {
        return std::to_string(days) + "d " + std::to_string(hours) + "h";
    }
    if (hours > 0)
    {
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    }
    if (minutes > 0)
    {
        return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    }
    return std::to_string(seconds) + "s";
}

} // namespace ts::utils
