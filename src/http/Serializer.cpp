#include "http/Serializer.hpp"

#include "http/HttpUtils.hpp"
#include "utils/Json.hpp"

#include <cstdint>
#include <yyjson.h>

namespace ts::http
{

namespace
{

yyjson_mut_val *session_files(ts::json::MutableDocument &json,
                              engine::SessionInfo const &session)
{
    auto *doc = json.doc();
    auto *files = yyjson_mut_arr(doc);
    for (auto const &file : session.files)
    {
        auto *entry = yyjson_mut_obj(doc);
        json.add_string(entry, "name", file.name);
        json.add_string(entry, "path", file.path);
        yyjson_mut_obj_add_uint(doc, entry, "size", file.length);
        yyjson_mut_obj_add_real(doc, entry, "progress", file.progress);
        yyjson_mut_obj_add_uint(doc, entry, "downloaded", file.downloaded);
        yyjson_mut_arr_append(files, entry);
    }
    return files;
}

} // namespace

std::string stream_url(std::string_view stream_base, std::string_view uri,
                       std::string_view path)
{
    std::string url(stream_base);
    url.append("/stream?uri=");
    url.append(url_encode(uri));
    url.append("&path=");
    url.append(url_encode(path));
    return url;
}

std::string serialize_stats(engine::StreamStats const &stats)
{
    ts::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = doc.root_object();
    doc.add_string(root, "uptime", stats.uptime);
    yyjson_mut_obj_add_int(native, root, "openStreams", stats.open_streams);
    yyjson_mut_obj_add_uint(native, root, "downloadSpeed",
                            stats.download_rate);
    yyjson_mut_obj_add_uint(native, root, "uploadSpeed", stats.upload_rate);

    auto *torrents = yyjson_mut_arr(native);
    yyjson_mut_obj_add_val(native, root, "activeTorrents", torrents);
    for (auto const &torrent : stats.torrents)
    {
        auto const &session = torrent.session;
        auto *entry = yyjson_mut_obj(native);
        doc.add_string(entry, "name", session.name);
        doc.add_string(entry, "infoHash", session.hash);
        yyjson_mut_obj_add_uint(native, entry, "size", session.total_size);
        yyjson_mut_obj_add_real(native, entry, "progress", session.progress);
        yyjson_mut_obj_add_uint(native, entry, "downloaded",
                                session.downloaded);
        yyjson_mut_obj_add_uint(native, entry, "uploaded", session.uploaded);
        yyjson_mut_obj_add_uint(native, entry, "downloadSpeed",
                                session.download_rate);
        yyjson_mut_obj_add_uint(native, entry, "uploadSpeed",
                                session.upload_rate);
        yyjson_mut_obj_add_int(native, entry, "peers", session.peers);
        yyjson_mut_obj_add_int(native, entry, "openStreams",
                               torrent.open_streams);
        yyjson_mut_obj_add_val(native, entry, "files",
                               session_files(doc, session));
        yyjson_mut_arr_append(torrents, entry);
    }
    return doc.write();
}

std::string serialize_summary(engine::TorrentSummary const &summary,
                              std::string_view source_uri,
                              std::string_view stream_base)
{
    ts::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }

    auto *native = doc.doc();
    auto *root = doc.root_object();
    doc.add_string(root, "name", summary.name);
    doc.add_string(root, "infoHash", summary.hash);
    yyjson_mut_obj_add_uint(native, root, "size", summary.size);

    auto *files = yyjson_mut_arr(native);
    yyjson_mut_obj_add_val(native, root, "files", files);
    for (auto const &file : summary.files)
    {
        auto *entry = yyjson_mut_obj(native);
        doc.add_string(entry, "name", file.name);
        doc.add_string(entry, "path", file.path);
        yyjson_mut_obj_add_uint(native, entry, "size", file.size);
        if (!stream_base.empty())
        {
            doc.add_string(entry, "url",
                           stream_url(stream_base, source_uri, file.path));
        }
        yyjson_mut_arr_append(files, entry);
    }
    return doc.write();
}

std::string serialize_error(std::string_view message)
{
    ts::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "{}";
    }
    doc.add_string(doc.root_object(), "error", message);
    return doc.write();
}

} // namespace ts::http
