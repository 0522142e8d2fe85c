#include "utils/FS.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace ts::utils
{

namespace
{

int open_temp(std::filesystem::path const &path)
{
    return ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
}

std::error_code last_errno()
{
    return std::error_code(errno, std::generic_category());
}

bool same_entry(std::filesystem::path const &a, std::filesystem::path const &b)
{
    std::error_code ec;
    if (std::filesystem::equivalent(a, b, ec))
    {
        return true;
    }
    return a.lexically_normal() == b.lexically_normal();
}

} // namespace

std::filesystem::path default_download_root()
{
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec)
    {
        tmp = std::filesystem::current_path();
    }
    return tmp / "torrent-stream-server";
}

bool ensure_directory(std::filesystem::path const &path, std::error_code &ec)
{
    ec.clear();
    if (path.empty())
    {
        return false;
    }
    std::filesystem::create_directories(path, ec);
    if (!ec)
    {
        return true;
    }
    std::error_code exists_ec;
    if (std::filesystem::is_directory(path, exists_ec))
    {
        ec.clear();
        return true;
    }
    return false;
}

std::vector<std::uint8_t> read_file_bytes(std::filesystem::path const &path,
                                          std::error_code &ec)
{
    ec.clear();
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return {};
    }
    std::vector<std::uint8_t> buffer((std::istreambuf_iterator<char>(input)),
                                     std::istreambuf_iterator<char>());
    if (input.bad())
    {
        ec = std::make_error_code(std::errc::io_error);
        return {};
    }
    return buffer;
}

bool write_file_atomic(std::filesystem::path const &target,
                       std::span<std::uint8_t const> data, std::error_code &ec)
{
    ec.clear();
    auto tmp = target;
    tmp += ".tmp";
    if (auto parent = tmp.parent_path(); !parent.empty())
    {
        if (!ensure_directory(parent, ec))
        {
            return false;
        }
    }
    int fd = open_temp(tmp);
    if (fd < 0)
    {
        ec = last_errno();
        return false;
    }
    auto const *bytes = reinterpret_cast<char const *>(data.data());
    std::size_t remaining = data.size();
    while (remaining > 0)
    {
        auto chunk = ::write(fd, bytes + (data.size() - remaining), remaining);
        if (chunk <= 0)
        {
            ec = last_errno();
            break;
        }
        remaining -= static_cast<std::size_t>(chunk);
    }
    if (!ec && ::fsync(fd) != 0)
    {
        ec = last_errno();
    }
    ::close(fd);
    if (ec)
    {
        std::error_code ignore_ec;
        std::filesystem::remove(tmp, ignore_ec);
        return false;
    }
    std::filesystem::rename(tmp, target, ec);
    if (ec)
    {
        std::error_code ignore_ec;
        std::filesystem::remove(tmp, ignore_ec);
        return false;
    }
    return true;
}

void empty_directory(std::filesystem::path const &root,
                     std::vector<std::filesystem::path> const &keep,
                     std::error_code &ec)
{
    ec.clear();
    if (!std::filesystem::exists(root, ec))
    {
        return;
    }
    for (auto const &entry : std::filesystem::directory_iterator(root, ec))
    {
        auto const &path = entry.path();
        bool kept = std::any_of(keep.begin(), keep.end(),
                                [&](auto const &k) { return same_entry(path, k); });
        if (kept)
        {
            continue;
        }
        std::error_code remove_ec;
        std::filesystem::remove_all(path, remove_ec);
        if (remove_ec && !ec)
        {
            ec = remove_ec;
        }
    }
}

} // namespace ts::utils
