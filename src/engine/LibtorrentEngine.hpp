#pragma once

#include "engine/SwarmEngine.hpp"

#include <libtorrent/alert.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_handle.hpp>

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ts::engine
{

struct EngineSettings
{
    std::string label{"stream"};
    std::string listen_interface{"0.0.0.0:6881"};
    int max_connections_per_torrent = 50;
    // bytes per second; 0 = unlimited
    int download_rate_limit = 0;
    int upload_rate_limit = 0;
    int read_ahead_pieces = 8;
    bool enable_dht = true;
};

// SwarmEngine over one libtorrent session. Not thread-safe: the owner pumps
// process_alerts() from the same thread that calls the SwarmEngine methods.
class LibtorrentEngine final : public SwarmEngine
{
  public:
    explicit LibtorrentEngine(EngineSettings settings);
    LibtorrentEngine(LibtorrentEngine const &) = delete;
    LibtorrentEngine &operator=(LibtorrentEngine const &) = delete;
    ~LibtorrentEngine() override;

    static libtorrent::settings_pack
    build_settings_pack(EngineSettings const &settings);

    // `notify` runs on a libtorrent thread whenever alerts are waiting; it
    // must only wake the owning loop.
    void start(std::function<void()> notify);
    bool is_started() const noexcept
    {
        return session_ != nullptr;
    }

    // Dispatches pending alerts (add/metadata/remove/read completions) and
    // drops adds whose every waiter was cancelled.
    void process_alerts();

    void add(AddSource source, AddOptions options, CancellationToken token,
             AddCompletion completion) override;
    std::optional<SessionInfo> get(std::string const &hash) const override;
    std::vector<SessionInfo> list() const override;
    void destroy(std::string const &hash, bool delete_data,
                 DestroyCompletion completion) override;
    EngineTotals totals() const override;
    bool select_file(std::string const &hash, int file_index) override;
    ReadResult read(std::string const &hash, int file_index,
                    std::uint64_t offset, std::size_t max_bytes) override;

  private:
    struct Waiter
    {
        CancellationToken token;
        AddCompletion completion;
    };

    struct PendingAdd
    {
        std::vector<Waiter> waiters;
        bool deselect_all = false;
    };

    struct CachedPiece
    {
        std::string hash;
        int piece = 0;
        std::vector<char> data;
    };

    std::optional<libtorrent::torrent_handle>
    handle_for(std::string const &hash) const;
    SessionInfo describe(libtorrent::torrent_handle const &handle) const;

    void handle_add_alert(libtorrent::add_torrent_alert const &alert);
    void handle_metadata_alert(libtorrent::metadata_received_alert const &alert);
    void handle_removed_alert(libtorrent::torrent_removed_alert const &alert);
    void handle_read_piece_alert(libtorrent::read_piece_alert const &alert);

    void complete_waiters(std::string const &hash, AddStatus status,
                          std::optional<SessionInfo> session,
                          std::string const &error);
    void reap_cancelled_adds();
    void remove_session(std::string const &hash,
                        libtorrent::torrent_handle const &handle,
                        bool delete_data);
    CachedPiece const *cached_piece(std::string const &hash, int piece) const;
    void drop_cached_pieces(std::string const &hash);

    EngineSettings settings_;
    std::unique_ptr<libtorrent::session> session_;

    std::unordered_map<std::string, PendingAdd> pending_adds_;
    std::unordered_map<std::string, std::vector<DestroyCompletion>> removing_;
    std::unordered_map<std::string, std::vector<std::function<void()>>>
        deferred_adds_;

    std::deque<CachedPiece> piece_cache_;
    std::set<std::pair<std::string, int>> piece_requests_;

    static constexpr std::size_t kPieceCacheCapacity = 32;
    static constexpr int kDeadlineStepMs = 200;
    static constexpr std::size_t kAlertBufferCapacity = 4096;
    std::vector<libtorrent::alert *> alert_buffer_;
};

} // namespace ts::engine
