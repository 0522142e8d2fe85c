#include "engine/SeedStore.hpp"

#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace ts::engine
{

namespace
{

constexpr char const kSeedExtension[] = ".torrent";

std::string file_name_for(std::string_view name)
{
    std::string sanitized(name);
    std::replace_if(
        sanitized.begin(), sanitized.end(),
        [](char ch) { return ch == '/' || ch == '\\' || ch == '\0'; }, '_');
    if (sanitized.empty() || sanitized == "." || sanitized == "..")
    {
        sanitized = "_" + sanitized;
    }
    return sanitized + kSeedExtension;
}

} // namespace

SeedStore::SeedStore(std::filesystem::path seed_dir,
                     std::filesystem::path torrent_file_dir,
                     bool keep_torrent_files)
    : seed_dir_(std::move(seed_dir)),
      torrent_file_dir_(std::move(torrent_file_dir)),
      keep_torrent_files_(keep_torrent_files)
{
}

std::filesystem::path SeedStore::path_for(std::string_view name) const
{
    return seed_dir_ / file_name_for(name);
}

bool SeedStore::contains(std::string_view name) const
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path_for(name), ec);
}

bool SeedStore::archive(std::string_view name,
                        std::span<std::uint8_t const> bytes,
                        std::error_code &ec)
{
    ec.clear();
    auto const target = path_for(name);
    if (!contains(name))
    {
        if (!utils::write_file_atomic(target, bytes, ec))
        {
            TS_LOG_WARN("failed to archive seed file {}: {}", target.string(),
                        ec.message());
            return false;
        }
        TS_LOG_DEBUG("archived seed file {}", target.string());
    }
    if (keep_torrent_files_)
    {
        mirror(name, target);
    }
    return true;
}

void SeedStore::mirror(std::string_view name,
                       std::filesystem::path const &source)
{
    if (torrent_file_dir_.empty())
    {
        return;
    }
    auto const copy = torrent_file_dir_ / file_name_for(name);
    std::error_code ec;
    if (std::filesystem::exists(copy, ec))
    {
        return;
    }
    if (!utils::ensure_directory(torrent_file_dir_, ec))
    {
        TS_LOG_WARN("failed to create torrent file directory {}: {}",
                    torrent_file_dir_.string(), ec.message());
        return;
    }
    std::filesystem::copy_file(source, copy,
                               std::filesystem::copy_options::skip_existing,
                               ec);
    if (ec)
    {
        TS_LOG_WARN("failed to keep torrent file {}: {}", copy.string(),
                    ec.message());
    }
}

std::vector<std::uint8_t> SeedStore::load(std::string_view name,
                                          std::error_code &ec) const
{
    return utils::read_file_bytes(path_for(name), ec);
}

bool SeedStore::remove(std::string_view name) noexcept
{
    try
    {
        auto const target = path_for(name);
        std::error_code ec;
        bool const removed = std::filesystem::remove(target, ec);
        if (ec)
        {
            TS_LOG_WARN("Failed to delete seed file {}: {}", target.string(),
                        ec.message());
            return false;
        }
        if (removed)
        {
            TS_LOG_INFO("Deleted seed file: {}", target.filename().string());
        }
        return removed;
    }
    catch (std::exception const &ex)
    {
        TS_LOG_WARN("Failed to delete seed file for {}: {}", name, ex.what());
        return false;
    }
}

std::vector<std::filesystem::path>
SeedStore::list(std::error_code &ec) const
{
    ec.clear();
    std::vector<std::filesystem::path> entries;
    std::filesystem::directory_iterator it(seed_dir_, ec);
    if (ec)
    {
        return entries;
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec))
    {
        if (ec)
        {
            break;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec))
        {
            entries.push_back(it->path());
        }
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

} // namespace ts::engine
