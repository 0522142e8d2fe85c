#include "app/Config.hpp"
#include "utils/FS.hpp"

#include <chrono>
#include <map>
#include <string>

#include <doctest/doctest.h>

using namespace std::chrono_literals;

namespace
{

ts::app::EnvReader env_from(std::map<std::string, std::string> values)
{
    return [values = std::move(values)](
               char const *key) -> std::optional<std::string>
    {
        auto it = values.find(key);
        if (it == values.end())
        {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

TEST_CASE("an empty environment yields the defaults")
{
    auto config = ts::app::load_config(env_from({}));
    auto const root = ts::utils::default_download_root();
    CHECK(config.core.download_dir == root);
    CHECK(config.core.torrent_file_dir == root / "torrents");
    CHECK(config.core.seed_dir == root / "seed");
    CHECK_FALSE(config.core.auto_seed);
    CHECK_FALSE(config.core.keep_downloaded_files);
    CHECK_FALSE(config.core.keep_torrent_files);
    CHECK(config.core.max_connections_per_torrent == 50);
    CHECK(config.core.download_rate_limit == 20 * 1024 * 1024);
    CHECK(config.core.upload_rate_limit == 1024 * 1024);
    CHECK(config.core.seed_time == 60000ms);
    CHECK(config.core.metadata_timeout == 5000ms);
    CHECK(config.http_bind == "http://0.0.0.0:58827");
    CHECK(config.log_file.empty());
}

TEST_CASE("environment values override the defaults")
{
    auto config = ts::app::load_config(env_from({
        {"DOWNLOAD_DIR", "/data/dl"},
        {"SEED_DIR", " /data/seeds "},
        {"AUTO_SEED", "true"},
        {"KEEP_DOWNLOADED_FILES", "1"},
        {"KEEP_TORRENT_FILES", "True"},
        {"MAX_CONNS_PER_TORRENT", "12"},
        {"DOWNLOAD_SPEED_LIMIT", "1000"},
        {"UPLOAD_SPEED_LIMIT", "4096"},
        {"SEED_TIME", "250"},
        {"TORRENT_TIMEOUT", "9000"},
        {"TS_PEER_INTERFACE", "0.0.0.0:7000"},
        {"TS_HTTP_BIND", "http://127.0.0.1:9000"},
        {"TS_LOG_FILE", "/var/log/ts.log"},
    }));
    CHECK(config.core.download_dir == "/data/dl");
    CHECK(config.core.torrent_file_dir ==
          std::filesystem::path("/data/dl") / "torrents");
    CHECK(config.core.seed_dir == "/data/seeds");
    CHECK(config.core.auto_seed);
    CHECK(config.core.keep_downloaded_files);
    CHECK(config.core.keep_torrent_files);
    CHECK(config.core.max_connections_per_torrent == 12);
    CHECK(config.core.download_rate_limit == 1000);
    CHECK(config.core.upload_rate_limit == 4096);
    CHECK(config.core.seed_time == 250ms);
    CHECK(config.core.metadata_timeout == 9000ms);
    CHECK(config.core.listen_interface == "0.0.0.0:7000");
    CHECK(config.http_bind == "http://127.0.0.1:9000");
    CHECK(config.log_file == "/var/log/ts.log");
}

TEST_CASE("invalid numbers keep their defaults")
{
    auto config = ts::app::load_config(env_from({
        {"MAX_CONNS_PER_TORRENT", "-3"},
        {"DOWNLOAD_SPEED_LIMIT", "fast"},
        {"SEED_TIME", "12s"},
        {"TORRENT_TIMEOUT", ""},
        {"UPLOAD_SPEED_LIMIT", "99999999999"},
    }));
    CHECK(config.core.max_connections_per_torrent == 50);
    CHECK(config.core.download_rate_limit == 20 * 1024 * 1024);
    CHECK(config.core.seed_time == 60000ms);
    CHECK(config.core.metadata_timeout == 5000ms);
    CHECK(config.core.upload_rate_limit == 2147483647);
}

TEST_CASE("zero numbers keep their defaults")
{
    auto config = ts::app::load_config(env_from({
        {"MAX_CONNS_PER_TORRENT", "0"},
        {"DOWNLOAD_SPEED_LIMIT", "0"},
        {"UPLOAD_SPEED_LIMIT", " 0 "},
        {"SEED_TIME", "0"},
        {"TORRENT_TIMEOUT", "0"},
    }));
    CHECK(config.core.max_connections_per_torrent == 50);
    CHECK(config.core.download_rate_limit == 20 * 1024 * 1024);
    CHECK(config.core.upload_rate_limit == 1024 * 1024);
    CHECK(config.core.seed_time == 60000ms);
    CHECK(config.core.metadata_timeout == 5000ms);
}

TEST_CASE("boolean and integer parsing")
{
    CHECK(ts::app::parse_bool_value(std::string("1")));
    CHECK(ts::app::parse_bool_value(std::string(" true ")));
    CHECK_FALSE(ts::app::parse_bool_value(std::string("yes")));
    CHECK_FALSE(ts::app::parse_bool_value(std::string("TRUE")));
    CHECK_FALSE(ts::app::parse_bool_value(std::nullopt));

    CHECK(ts::app::parse_int_value(std::string("42")) == 42);
    CHECK(ts::app::parse_int_value(std::string(" 7 ")) == 7);
    CHECK_FALSE(ts::app::parse_int_value(std::string("4x")).has_value());
    CHECK_FALSE(ts::app::parse_int_value(std::string("")).has_value());
    CHECK_FALSE(ts::app::parse_int_value(std::nullopt).has_value());
}
