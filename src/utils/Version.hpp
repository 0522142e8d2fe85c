#pragma once

#ifndef TS_BUILD_VERSION
#define TS_BUILD_VERSION "0.0.0-dev"
#endif

namespace ts::version
{

// Derived from TS_BUILD_VERSION (set by the build) so the peer user agent
// and the startup banner agree.
inline constexpr char const kSemanticVersion[] = TS_BUILD_VERSION;
inline constexpr char const kDisplayVersion[] =
    "TorrentStream " TS_BUILD_VERSION;
inline constexpr char const kUserAgentVersion[] =
    "TorrentStream/" TS_BUILD_VERSION;

} // namespace ts::version
