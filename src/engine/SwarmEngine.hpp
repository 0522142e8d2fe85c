#pragma once

#include "engine/Cancellation.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ts::engine
{

struct SummaryFile
{
    std::string name;
    std::string path; // "<torrent name>/<segments...>"
    std::uint64_t size = 0;
};

// What a client learns about a torrent before streaming from it.
struct TorrentSummary
{
    std::string name;
    std::string hash;
    std::uint64_t size = 0;
    std::vector<SummaryFile> files;
};

struct SessionFileInfo
{
    int index = 0;
    std::string name;
    std::string path;
    std::uint64_t length = 0;
    std::uint64_t downloaded = 0;
    double progress = 0.0;
};

// Read-only view of one engine session. Copies are detached from the
// engine; refresh through SwarmEngine::get.
struct SessionInfo
{
    std::string hash;
    std::string name;
    std::uint64_t total_size = 0;
    double progress = 0.0;
    std::uint64_t downloaded = 0;
    std::uint64_t uploaded = 0;
    std::uint64_t download_rate = 0;
    std::uint64_t upload_rate = 0;
    int peers = 0;
    bool has_metadata = false;
    std::filesystem::path save_path;
    std::vector<SessionFileInfo> files;
};

struct AddSource
{
    enum class Kind
    {
        Magnet,
        Metainfo
    };

    static AddSource magnet(std::string uri)
    {
        AddSource source;
        source.kind = Kind::Magnet;
        source.uri = std::move(uri);
        return source;
    }

    static AddSource metainfo(std::vector<std::uint8_t> bytes)
    {
        AddSource source;
        source.kind = Kind::Metainfo;
        source.bytes = std::move(bytes);
        return source;
    }

    Kind kind = Kind::Magnet;
    std::string uri;
    std::vector<std::uint8_t> bytes;
};

struct AddOptions
{
    std::filesystem::path save_path;
    // Start with every file at priority 0; streams select what they read.
    bool deselect_all = false;
    // Never request pieces beyond metadata (metadata-only engine).
    bool upload_only = false;
};

enum class AddStatus
{
    Ok,
    Duplicate,
    InvalidSource,
    Failed
};

struct AddResult
{
    AddStatus status = AddStatus::Failed;
    std::optional<SessionInfo> session;
    std::string error;

    bool has_session() const noexcept
    {
        return session.has_value();
    }
};

struct EngineTotals
{
    std::uint64_t download_rate = 0;
    std::uint64_t upload_rate = 0;
};

enum class ReadStatus
{
    Ok,
    Pending,
    Gone
};

struct ReadResult
{
    ReadStatus status = ReadStatus::Gone;
    std::vector<char> data;
};

using AddCompletion = std::function<void(AddResult)>;
using DestroyCompletion = std::function<void(bool removed)>;

// The swarm protocol engine as the lifecycle core sees it. Every call and
// every completion happens on the engine thread.
class SwarmEngine
{
  public:
    virtual ~SwarmEngine() = default;

    // Completes once metadata is known or the add fails. A cancelled token
    // drops the completion and the engine removes whatever it added.
    virtual void add(AddSource source, AddOptions options,
                     CancellationToken token, AddCompletion completion) = 0;

    virtual std::optional<SessionInfo> get(std::string const &hash) const = 0;
    virtual std::vector<SessionInfo> list() const = 0;

    // Completion reports whether a session was actually removed. Destroying
    // an unknown hash completes with false.
    virtual void destroy(std::string const &hash, bool delete_data,
                         DestroyCompletion completion) = 0;

    virtual EngineTotals totals() const = 0;

    virtual bool select_file(std::string const &hash, int file_index) = 0;
    virtual ReadResult read(std::string const &hash, int file_index,
                            std::uint64_t offset, std::size_t max_bytes) = 0;
};

} // namespace ts::engine
