#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace ts::http
{

struct ByteRange
{
    enum class Kind
    {
        Full,         // no usable Range header: 200 with the whole file
        Partial,      // 206
        Unsatisfiable // 416
    };

    Kind kind = Kind::Full;
    std::uint64_t start = 0;
    std::uint64_t count = 0;

    std::uint64_t last() const noexcept
    {
        return count == 0 ? start : start + count - 1;
    }
};

// Single-range subset of RFC 9110: "bytes=a-b", "bytes=a-" and "bytes=-n".
// Only the first range of a list is honoured; anything malformed is
// ignored and yields the full body.
ByteRange parse_range(std::string_view header, std::uint64_t length);

std::string mime_type_for(std::string_view file_name);

// Percent-encodes everything except RFC 3986 unreserved characters and '/'.
std::string url_encode(std::string_view value);

} // namespace ts::http
