#pragma once

#include "engine/StatsAggregator.hpp"
#include "engine/StreamBroker.hpp"
#include "engine/SwarmEngine.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ts::engine
{

struct CoreSettings
{
    std::filesystem::path download_dir{"downloads"};
    std::filesystem::path torrent_file_dir;
    std::filesystem::path seed_dir;
    bool auto_seed = false;
    bool keep_downloaded_files = false;
    bool keep_torrent_files = false;
    int max_connections_per_torrent = 50;
    // bytes per second
    int download_rate_limit = 20 * 1024 * 1024;
    int upload_rate_limit = 1024 * 1024;
    std::chrono::milliseconds seed_time{60000};
    std::chrono::milliseconds metadata_timeout{5000};
    std::chrono::milliseconds fetch_timeout{15000};
    std::string listen_interface{"0.0.0.0:6881"};
    unsigned idle_sleep_ms = 500;
    int read_ahead_pieces = 8;
    bool enable_dht = true;
};

struct StreamRequest
{
    std::string uri;
    std::string path;
};

enum class ResolveStatus
{
    Ok,
    InvalidUri,
    NoMetadata,
    FetchFailed
};

struct ResolveResult
{
    ResolveStatus status = ResolveStatus::NoMetadata;
    std::optional<TorrentSummary> summary;
    std::string error;
};

// The streaming engine. run() owns the engine thread; every other method
// is safe to call from any thread and reports back through a callback that
// runs on the engine thread or the fetch worker.
class Core
{
  public:
    using ResolveCallback = std::function<void(ResolveResult)>;

    explicit Core(CoreSettings settings);
    ~Core();
    Core(Core const &) = delete;
    Core &operator=(Core const &) = delete;
    static std::unique_ptr<Core> create(CoreSettings settings);

    void run();
    void stop() noexcept;
    bool is_running() const noexcept;

    void resolve_torrent(std::string uri, ResolveCallback callback);
    void open_stream(StreamRequest request, OpenStreamCallback callback);
    void close_stream(StreamTicket const &ticket);
    void read_chunk(StreamTicket const &ticket, std::uint64_t offset,
                    std::size_t max_bytes, ReadCallback callback);

    // Republished about once a second by the engine thread.
    std::shared_ptr<StreamStats const> stats() const noexcept;
    CoreSettings const &settings() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ts::engine
