#pragma once

#include "engine/SchedulerService.hpp"
#include "engine/SwarmEngine.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ts::engine
{

class LifecycleManager;

enum class OpenStreamStatus
{
    Ok,
    InvalidUri,
    NoMetadata,
    FileNotFound,
    FetchFailed
};

char const *to_string(OpenStreamStatus status) noexcept;

// Handle for one open stream. Closing it releases exactly one reference on
// the torrent, however many times close is called.
struct StreamTicket
{
    std::uint64_t id = 0;
    std::string hash;
    int file_index = -1;
    std::string file_name;
    std::string file_path;
    std::uint64_t length = 0;
};

struct OpenStreamResult
{
    OpenStreamStatus status = OpenStreamStatus::NoMetadata;
    std::optional<StreamTicket> ticket;
    std::string error;
};

using OpenStreamCallback = std::function<void(OpenStreamResult)>;
using ReadCallback = std::function<void(ReadResult)>;

struct StreamBrokerSettings
{
    std::filesystem::path download_dir;
    std::chrono::milliseconds metadata_timeout{5000};
};

// Finds or adds the session behind a stream request, counts the stream and
// hands out tickets. Engine thread only.
class StreamBroker
{
  public:
    StreamBroker(SwarmEngine &engine, SchedulerService &scheduler,
                 LifecycleManager &lifecycle, StreamBrokerSettings settings);
    StreamBroker(StreamBroker const &) = delete;
    StreamBroker &operator=(StreamBroker const &) = delete;

    // `hash` is the content identifier of `source`; `path` is the
    // synthesized "<torrent name>/<segments...>" path, a leading '/' allowed.
    void open(AddSource source, std::string hash, std::string path,
              OpenStreamCallback callback);

    void close(std::uint64_t ticket_id);

    // Pending reads are parked and retried by retry_pending_reads(); the
    // callback only ever sees Ok or Gone.
    void read(std::uint64_t ticket_id, std::uint64_t offset,
              std::size_t max_bytes, ReadCallback callback);
    void retry_pending_reads();

    std::size_t open_tickets() const noexcept
    {
        return tickets_.size();
    }
    std::size_t pending_reads() const noexcept
    {
        return pending_reads_.size();
    }

  private:
    struct PendingRead
    {
        std::uint64_t ticket_id = 0;
        std::uint64_t offset = 0;
        std::size_t max_bytes = 0;
        ReadCallback callback;
    };

    void attach(AddSource source, SessionInfo const &session,
                std::string path, OpenStreamCallback callback);

    SwarmEngine &engine_;
    SchedulerService &scheduler_;
    LifecycleManager &lifecycle_;
    StreamBrokerSettings settings_;
    std::unordered_map<std::uint64_t, StreamTicket> tickets_;
    std::vector<PendingRead> pending_reads_;
    std::uint64_t next_ticket_id_ = 1;
};

// The file of `session` whose path equals `path` (leading '/' ignored).
std::optional<SessionFileInfo> find_file(SessionInfo const &session,
                                         std::string_view path);

} // namespace ts::engine
