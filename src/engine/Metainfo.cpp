#include "engine/Metainfo.hpp"

#include "engine/TorrentUtils.hpp"
#include "utils/Log.hpp"

#include <libtorrent/bdecode.hpp>
#include <libtorrent/bencode.hpp>
#include <libtorrent/entry.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/file_storage.hpp>
#include <libtorrent/hasher.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/span.hpp>
#include <libtorrent/torrent_info.hpp>

#include <iterator>
#include <vector>

namespace ts::engine
{

namespace
{

std::optional<libtorrent::bdecode_node>
decode(std::span<std::uint8_t const> bytes, libtorrent::error_code &ec)
{
    if (bytes.empty())
    {
        return std::nullopt;
    }
    libtorrent::span<char const> span(
        reinterpret_cast<char const *>(bytes.data()),
        static_cast<std::ptrdiff_t>(bytes.size()));
    auto node = libtorrent::bdecode(span, ec);
    if (ec || node.type() != libtorrent::bdecode_node::dict_t)
    {
        return std::nullopt;
    }
    return node;
}

bool starts_with_nocase(std::string_view value, std::string_view prefix)
{
    if (value.size() < prefix.size())
    {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i)
    {
        auto lower = value[i] >= 'A' && value[i] <= 'Z'
                         ? static_cast<char>(value[i] - 'A' + 'a')
                         : value[i];
        if (lower != prefix[i])
        {
            return false;
        }
    }
    return true;
}

} // namespace

UriKind classify_uri(std::string_view uri)
{
    if (starts_with_nocase(uri, "magnet:"))
    {
        return UriKind::Magnet;
    }
    if (is_info_hash_hex(uri))
    {
        return UriKind::InfoHash;
    }
    if (starts_with_nocase(uri, "http://") || starts_with_nocase(uri, "https://"))
    {
        return UriKind::TorrentFile;
    }
    return UriKind::Invalid;
}

std::optional<std::string> magnet_content_id(std::string_view uri)
{
    std::string magnet = is_info_hash_hex(uri) ? magnet_for_info_hash(uri)
                                               : std::string(uri);
    libtorrent::error_code ec;
    auto params = libtorrent::parse_magnet_uri(magnet, ec);
    if (ec)
    {
        return std::nullopt;
    }
    return info_hash_from_params(params);
}

std::optional<std::string>
compute_content_id(std::span<std::uint8_t const> metainfo)
{
    libtorrent::error_code ec;
    auto root = decode(metainfo, ec);
    if (!root)
    {
        TS_LOG_DEBUG("metainfo decode failed: {}",
                     ec ? ec.message() : std::string("not a dictionary"));
        return std::nullopt;
    }
    auto info = root->dict_find_dict("info");
    if (!info)
    {
        return std::nullopt;
    }
    // A v2-only torrent has no SHA-1 identity: the engine would key it by
    // its truncated SHA-256, which never matches the digest below.
    if (!info.dict_find_string("pieces") &&
        info.dict_find_int_value("meta version", 1) >= 2)
    {
        TS_LOG_DEBUG("rejecting v2-only metainfo");
        return std::nullopt;
    }
    // entry keeps dictionaries ordered, so bencode() emits canonical bytes
    // even when the input had its keys out of order.
    libtorrent::entry canonical;
    canonical = info;
    std::vector<char> encoded;
    libtorrent::bencode(std::back_inserter(encoded), canonical);
    libtorrent::hasher hasher;
    hasher.update(encoded);
    return info_hash_to_hex(hasher.final());
}

std::optional<TorrentSummary>
summarize_metainfo(std::span<std::uint8_t const> metainfo)
{
    auto hash = compute_content_id(metainfo);
    if (!hash)
    {
        return std::nullopt;
    }
    libtorrent::error_code ec;
    auto root = decode(metainfo, ec);
    if (!root)
    {
        return std::nullopt;
    }
    libtorrent::torrent_info info(*root, ec);
    if (ec)
    {
        TS_LOG_DEBUG("torrent_info rejected metainfo {}: {}", *hash,
                     ec.message());
        return std::nullopt;
    }
    TorrentSummary summary;
    summary.name = info.name();
    summary.hash = *hash;
    auto const &files = info.files();
    for (auto index : files.file_range())
    {
        if (files.pad_file_at(index))
        {
            continue;
        }
        SummaryFile file;
        file.name = std::string(files.file_name(index));
        file.path = files.file_path(index);
        file.size = static_cast<std::uint64_t>(files.file_size(index));
        summary.size += file.size;
        summary.files.push_back(std::move(file));
    }
    return summary;
}

TorrentSummary summary_from_session(SessionInfo const &session)
{
    TorrentSummary summary;
    summary.name = session.name;
    summary.hash = session.hash;
    summary.size = session.total_size;
    summary.files.reserve(session.files.size());
    for (auto const &file : session.files)
    {
        summary.files.push_back({file.name, file.path, file.length});
    }
    return summary;
}

} // namespace ts::engine
