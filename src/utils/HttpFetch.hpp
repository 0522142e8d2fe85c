#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace ts::utils
{

struct FetchResult
{
    int status = 0;
    std::vector<std::uint8_t> body;
    std::string error;

    bool ok() const noexcept
    {
        return error.empty() && status >= 200 && status < 300;
    }
};

// Blocking GET on a private mongoose manager. Follows up to
// `max_redirects` Location headers. Intended for the async task worker,
// never the engine or HTTP server threads.
FetchResult http_get(std::string const &url, std::chrono::milliseconds timeout,
                     int max_redirects = 3);

} // namespace ts::utils
