#pragma once

#include "engine/SwarmEngine.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ts::engine
{

enum class UriKind
{
    Magnet,      // magnet:?xt=urn:btih:...
    InfoHash,    // bare 40-char hex
    TorrentFile, // http(s):// URL of a .torrent file
    Invalid
};

UriKind classify_uri(std::string_view uri);

// Content identifier named by a magnet link or bare info-hash.
std::optional<std::string> magnet_content_id(std::string_view uri);

// SHA-1 over the canonical bencoding of the "info" dictionary, as 40
// lowercase hex chars. nullopt for anything that does not decode or has no
// info dictionary.
std::optional<std::string>
compute_content_id(std::span<std::uint8_t const> metainfo);

// Name, identifier, size and file list straight from torrent-file bytes.
// Single-file torrents list one file whose path is the torrent name.
std::optional<TorrentSummary>
summarize_metainfo(std::span<std::uint8_t const> metainfo);

TorrentSummary summary_from_session(SessionInfo const &session);

} // namespace ts::engine
