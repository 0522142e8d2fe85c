#include "app/Config.hpp"

#include "utils/FS.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <system_error>
#include <utility>

namespace ts::app
{

namespace
{

std::string trim_whitespace(std::string value)
{
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
    {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::optional<std::string> non_empty(EnvReader const &read_env,
                                     char const *key)
{
    auto value = read_env(key);
    if (!value)
    {
        return std::nullopt;
    }
    auto trimmed = trim_whitespace(std::move(*value));
    if (trimmed.empty())
    {
        return std::nullopt;
    }
    return trimmed;
}

int clamp_to_int(long long value)
{
    if (value > std::numeric_limits<int>::max())
    {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(value);
}

} // namespace

std::optional<long long> parse_int_value(std::optional<std::string> const &value)
{
    if (!value)
    {
        return std::nullopt;
    }
    auto text = trim_whitespace(*value);
    long long parsed = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size())
    {
        return std::nullopt;
    }
    return parsed;
}

bool parse_bool_value(std::optional<std::string> const &value)
{
    if (!value)
    {
        return false;
    }
    auto const content = trim_whitespace(*value);
    return content == "1" || content == "true" || content == "True";
}

EnvReader process_environment()
{
    return [](char const *key) -> std::optional<std::string>
    {
        auto value = std::getenv(key);
        if (value == nullptr)
        {
            return std::nullopt;
        }
        return std::string(value);
    };
}

DaemonConfig load_config(EnvReader const &read_env)
{
    DaemonConfig config;
    auto &core = config.core;

    auto path_or = [&](char const *key, std::filesystem::path fallback)
    {
        if (auto value = non_empty(read_env, key))
        {
            return std::filesystem::path(*value);
        }
        return fallback;
    };
    // Zero and negative numbers are as invalid as garbage.
    auto count_or = [&](char const *key, long long fallback)
    {
        auto parsed = parse_int_value(non_empty(read_env, key));
        return parsed && *parsed > 0 ? *parsed : fallback;
    };

    core.download_dir =
        path_or("DOWNLOAD_DIR", ts::utils::default_download_root());
    core.torrent_file_dir =
        path_or("TORRENT_FILE_DIR", core.download_dir / "torrents");
    core.seed_dir = path_or("SEED_DIR", core.download_dir / "seed");
    core.auto_seed = parse_bool_value(read_env("AUTO_SEED"));
    core.keep_downloaded_files =
        parse_bool_value(read_env("KEEP_DOWNLOADED_FILES"));
    core.keep_torrent_files = parse_bool_value(read_env("KEEP_TORRENT_FILES"));
    core.max_connections_per_torrent = clamp_to_int(
        count_or("MAX_CONNS_PER_TORRENT", core.max_connections_per_torrent));
    core.download_rate_limit = clamp_to_int(
        count_or("DOWNLOAD_SPEED_LIMIT", core.download_rate_limit));
    core.upload_rate_limit =
        clamp_to_int(count_or("UPLOAD_SPEED_LIMIT", core.upload_rate_limit));
    core.seed_time = std::chrono::milliseconds(
        count_or("SEED_TIME", core.seed_time.count()));
    core.metadata_timeout = std::chrono::milliseconds(
        count_or("TORRENT_TIMEOUT", core.metadata_timeout.count()));
    if (auto value = non_empty(read_env, "TS_PEER_INTERFACE"))
    {
        core.listen_interface = *value;
    }

    if (auto value = non_empty(read_env, "TS_HTTP_BIND"))
    {
        config.http_bind = *value;
    }
    if (auto value = non_empty(read_env, "TS_LOG_FILE"))
    {
        config.log_file = *value;
    }
    return config;
}

} // namespace ts::app
