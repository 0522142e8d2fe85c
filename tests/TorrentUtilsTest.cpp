#include "engine/LibtorrentEngine.hpp"
#include "engine/TorrentUtils.hpp"

#include <libtorrent/error_code.hpp>
#include <libtorrent/settings_pack.hpp>

#include <string>

#include <doctest/doctest.h>

using namespace ts::engine;

TEST_CASE("sha1 hex round trip and case handling")
{
    std::string const hex = "0123456789abcdef0123456789abcdef01234567";
    auto hash = sha1_from_hex(hex);
    REQUIRE(hash.has_value());
    CHECK(info_hash_to_hex(*hash) == hex);

    auto upper = sha1_from_hex("0123456789ABCDEF0123456789ABCDEF01234567");
    REQUIRE(upper.has_value());
    CHECK(*upper == *hash);

    CHECK_FALSE(sha1_from_hex("0123").has_value());
    CHECK_FALSE(
        sha1_from_hex("g123456789abcdef0123456789abcdef01234567").has_value());
    CHECK(is_info_hash_hex(hex));
    CHECK_FALSE(is_info_hash_hex("magnet:?xt=urn:btih:" + hex));
}

TEST_CASE("magnet_for_info_hash lowercases the hash")
{
    CHECK(magnet_for_info_hash("ABCDEF0123456789ABCDEF0123456789ABCDEF01") ==
          "magnet:?xt=urn:btih:abcdef0123456789abcdef0123456789abcdef01");
}

TEST_CASE("duplicate add errors are recognised")
{
    CHECK_FALSE(is_duplicate_add_error(libtorrent::error_code{}));
    CHECK(is_duplicate_add_error(libtorrent::errors::duplicate_torrent));
    CHECK_FALSE(is_duplicate_add_error(libtorrent::errors::invalid_torrent_handle));
}

TEST_CASE("engine settings map onto the libtorrent settings pack")
{
    EngineSettings settings;
    settings.listen_interface = "0.0.0.0:7000";
    settings.download_rate_limit = 2048;
    settings.upload_rate_limit = -5;
    settings.enable_dht = false;

    auto pack = LibtorrentEngine::build_settings_pack(settings);
    CHECK(pack.get_str(libtorrent::settings_pack::listen_interfaces) ==
          "0.0.0.0:7000");
    CHECK(pack.get_int(libtorrent::settings_pack::download_rate_limit) ==
          2048);
    CHECK(pack.get_int(libtorrent::settings_pack::upload_rate_limit) == 0);
    CHECK_FALSE(pack.get_bool(libtorrent::settings_pack::enable_dht));
    CHECK_FALSE(pack.get_str(libtorrent::settings_pack::user_agent).empty());
}
