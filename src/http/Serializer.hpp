#pragma once

#include "engine/StatsAggregator.hpp"
#include "engine/SwarmEngine.hpp"

#include <string>
#include <string_view>

namespace ts::http
{

std::string serialize_stats(engine::StreamStats const &stats);

// `stream_base` ("http://host:port") adds a ready-to-play url to every
// file; leave it empty to omit the urls.
std::string serialize_summary(engine::TorrentSummary const &summary,
                              std::string_view source_uri,
                              std::string_view stream_base);

std::string serialize_error(std::string_view message);

std::string stream_url(std::string_view stream_base, std::string_view uri,
                       std::string_view path);

} // namespace ts::http
