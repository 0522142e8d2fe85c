#include "http/HttpUtils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <optional>
#include <utility>

namespace ts::http
{

namespace
{

std::string_view trim(std::string_view value)
{
    while (!value.empty() &&
           std::isspace(static_cast<unsigned char>(value.front())))
    {
        value.remove_prefix(1);
    }
    while (!value.empty() &&
           std::isspace(static_cast<unsigned char>(value.back())))
    {
        value.remove_suffix(1);
    }
    return value;
}

std::optional<std::uint64_t> parse_number(std::string_view text)
{
    if (text.empty())
    {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                     value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
    {
        return std::nullopt;
    }
    return value;
}

ByteRange full(std::uint64_t length)
{
    return {ByteRange::Kind::Full, 0, length};
}

} // namespace

ByteRange parse_range(std::string_view header, std::uint64_t length)
{
    header = trim(header);
    constexpr std::string_view kPrefix = "bytes=";
    if (header.size() < kPrefix.size() ||
        header.substr(0, kPrefix.size()) != kPrefix)
    {
        return full(length);
    }
    auto first_range = header.substr(kPrefix.size());
    if (auto comma = first_range.find(','); comma != std::string_view::npos)
    {
        first_range = first_range.substr(0, comma);
    }
    first_range = trim(first_range);
    auto dash = first_range.find('-');
    if (dash == std::string_view::npos)
    {
        return full(length);
    }
    auto first_text = trim(first_range.substr(0, dash));
    auto last_text = trim(first_range.substr(dash + 1));

    if (first_text.empty())
    {
        auto suffix = parse_number(last_text);
        if (!suffix)
        {
            return full(length);
        }
        if (*suffix == 0 || length == 0)
        {
            return {ByteRange::Kind::Unsatisfiable, 0, 0};
        }
        auto count = std::min(*suffix, length);
        return {ByteRange::Kind::Partial, length - count, count};
    }

    auto first = parse_number(first_text);
    if (!first)
    {
        return full(length);
    }
    std::uint64_t last = length == 0 ? 0 : length - 1;
    if (!last_text.empty())
    {
        auto parsed = parse_number(last_text);
        if (!parsed || *parsed < *first)
        {
            return full(length);
        }
        last = std::min(*parsed, last);
    }
    if (*first >= length)
    {
        return {ByteRange::Kind::Unsatisfiable, 0, 0};
    }
    return {ByteRange::Kind::Partial, *first, last - *first + 1};
}

std::string mime_type_for(std::string_view file_name)
{
    static constexpr std::array<std::pair<std::string_view, char const *>, 18>
        kTypes = {{
            {"mp4", "video/mp4"},
            {"m4v", "video/x-m4v"},
            {"mkv", "video/x-matroska"},
            {"webm", "video/webm"},
            {"avi", "video/x-msvideo"},
            {"mov", "video/quicktime"},
            {"ts", "video/mp2t"},
            {"mp3", "audio/mpeg"},
            {"m4a", "audio/mp4"},
            {"flac", "audio/flac"},
            {"ogg", "audio/ogg"},
            {"wav", "audio/wav"},
            {"srt", "application/x-subrip"},
            {"vtt", "text/vtt"},
            {"txt", "text/plain"},
            {"jpg", "image/jpeg"},
            {"png", "image/png"},
            {"pdf", "application/pdf"},
        }};
    auto dot = file_name.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == file_name.size())
    {
        return "application/octet-stream";
    }
    std::string extension;
    for (auto ch : file_name.substr(dot + 1))
    {
        extension.push_back(
            static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    for (auto const &[ext, type] : kTypes)
    {
        if (ext == extension)
        {
            return type;
        }
    }
    return "application/octet-stream";
}

std::string url_encode(std::string_view value)
{
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (auto ch : value)
    {
        auto byte = static_cast<unsigned char>(ch);
        if (std::isalnum(byte) || ch == '-' || ch == '_' || ch == '.' ||
            ch == '~' || ch == '/')
        {
            out.push_back(ch);
            continue;
        }
        out.push_back('%');
        out.push_back(kHex[byte >> 4]);
        out.push_back(kHex[byte & 0x0F]);
    }
    return out;
}

} // namespace ts::http
