#include "engine/LibtorrentEngine.hpp"

#include "engine/TorrentUtils.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <libtorrent/bdecode.hpp>
#include <libtorrent/download_priority.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/file_storage.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/span.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/torrent_status.hpp>

#include <algorithm>
#include <iterator>
#include <system_error>

namespace ts::engine
{

namespace
{

void set_user_agent(libtorrent::settings_pack &pack)
{
    static std::string const user_agent = ts::version::kUserAgentVersion;
    pack.set_str(libtorrent::settings_pack::user_agent, user_agent);
}

std::uint64_t non_negative(std::int64_t value)
{
    return value > 0 ? static_cast<std::uint64_t>(value) : 0;
}

} // namespace

LibtorrentEngine::LibtorrentEngine(EngineSettings settings)
    : settings_(std::move(settings))
{
    alert_buffer_.reserve(kAlertBufferCapacity);
}

LibtorrentEngine::~LibtorrentEngine()
{
    // Pending completions reference objects owned by the caller; none of
    // them may run once the engine goes away.
    pending_adds_.clear();
    removing_.clear();
    deferred_adds_.clear();
    if (session_)
    {
        session_->set_alert_notify([] {});
        session_->pause();
        session_.reset();
    }
}

libtorrent::settings_pack
LibtorrentEngine::build_settings_pack(EngineSettings const &s)
{
    libtorrent::settings_pack pack;
    pack.set_int(libtorrent::settings_pack::alert_mask,
                 libtorrent::alert_category::status |
                     libtorrent::alert_category::error |
                     libtorrent::alert_category::storage |
                     libtorrent::alert_category::piece_progress);
    set_user_agent(pack);
    pack.set_str(libtorrent::settings_pack::listen_interfaces,
                 s.listen_interface);
    pack.set_int(libtorrent::settings_pack::download_rate_limit,
                 std::max(0, s.download_rate_limit));
    pack.set_int(libtorrent::settings_pack::upload_rate_limit,
                 std::max(0, s.upload_rate_limit));
    pack.set_bool(libtorrent::settings_pack::enable_dht, s.enable_dht);
    pack.set_int(libtorrent::settings_pack::alert_queue_size, 8192);
    return pack;
}

void LibtorrentEngine::start(std::function<void()> notify)
{
    if (session_)
    {
        return;
    }
    libtorrent::session_params params(build_settings_pack(settings_));
    session_ = std::make_unique<libtorrent::session>(std::move(params));
    if (notify)
    {
        session_->set_alert_notify(std::move(notify));
    }
    TS_LOG_INFO("{} engine listening on {}", settings_.label,
                settings_.listen_interface);
}

std::optional<libtorrent::torrent_handle>
LibtorrentEngine::handle_for(std::string const &hash) const
{
    if (!session_)
    {
        return std::nullopt;
    }
    auto sha = sha1_from_hex(hash);
    if (!sha)
    {
        return std::nullopt;
    }
    auto handle = session_->find_torrent(*sha);
    if (!handle.is_valid())
    {
        return std::nullopt;
    }
    return handle;
}

SessionInfo
LibtorrentEngine::describe(libtorrent::torrent_handle const &handle) const
{
    auto const status = handle.status();
    SessionInfo info;
    info.hash = info_hash_to_hex(status.info_hashes);
    info.name = status.name;
    info.progress = status.progress;
    info.downloaded = non_negative(status.total_done);
    info.uploaded = non_negative(status.all_time_upload);
    info.download_rate = non_negative(status.download_payload_rate);
    info.upload_rate = non_negative(status.upload_payload_rate);
    info.peers = status.num_peers;
    info.has_metadata = status.has_metadata;
    info.save_path = status.save_path;

    auto ti = handle.torrent_file();
    if (!ti)
    {
        return info;
    }
    auto const &files = ti->files();
    info.total_size = non_negative(ti->total_size());
    auto const bytes_done =
        handle.file_progress(libtorrent::torrent_handle::piece_granularity);
    for (auto index : files.file_range())
    {
        if (files.pad_file_at(index))
        {
            continue;
        }
        SessionFileInfo file;
        file.index = static_cast<int>(index);
        file.name = std::string(files.file_name(index));
        file.path = files.file_path(index);
        file.length = non_negative(files.file_size(index));
        auto const position = static_cast<std::size_t>(file.index);
        if (position < bytes_done.size())
        {
            file.downloaded = non_negative(bytes_done[position]);
        }
        file.progress =
            file.length == 0
                ? 1.0
                : static_cast<double>(file.downloaded) /
                      static_cast<double>(file.length);
        info.files.push_back(std::move(file));
    }
    return info;
}

void LibtorrentEngine::add(AddSource source, AddOptions options,
                           CancellationToken token, AddCompletion completion)
{
    if (!session_)
    {
        completion({AddStatus::Failed, std::nullopt, "engine not started"});
        return;
    }

    libtorrent::add_torrent_params params;
    libtorrent::error_code ec;
    if (source.kind == AddSource::Kind::Metainfo)
    {
        libtorrent::span<char const> span(
            reinterpret_cast<char const *>(source.bytes.data()),
            static_cast<std::ptrdiff_t>(source.bytes.size()));
        auto node = libtorrent::bdecode(span, ec);
        if (!ec)
        {
            auto ti = std::make_shared<libtorrent::torrent_info>(node, ec);
            if (!ec)
            {
                params.ti = std::move(ti);
            }
        }
    }
    else
    {
        libtorrent::parse_magnet_uri(source.uri, params, ec);
    }
    if (ec)
    {
        completion({AddStatus::InvalidSource, std::nullopt, ec.message()});
        return;
    }
    auto hash = info_hash_from_params(params);
    if (!hash)
    {
        completion(
            {AddStatus::InvalidSource, std::nullopt, "no info-hash in source"});
        return;
    }

    // A removal in flight would hand back a half-destroyed handle; retry
    // once libtorrent confirms the torrent is gone.
    if (removing_.contains(*hash))
    {
        TS_LOG_DEBUG("{} add of {} deferred until removal completes",
                     settings_.label, *hash);
        deferred_adds_[*hash].push_back(
            [this, source = std::move(source), options = std::move(options),
             token, completion = std::move(completion)]() mutable
            {
                add(std::move(source), std::move(options), token,
                    std::move(completion));
            });
        return;
    }

    if (auto pending = pending_adds_.find(*hash);
        pending != pending_adds_.end())
    {
        pending->second.waiters.push_back({token, std::move(completion)});
        return;
    }

    if (auto existing = handle_for(*hash))
    {
        if (existing->torrent_file())
        {
            completion({AddStatus::Duplicate, describe(*existing), {}});
            return;
        }
        PendingAdd pending;
        pending.deselect_all = options.deselect_all;
        pending.waiters.push_back({token, std::move(completion)});
        pending_adds_.emplace(*hash, std::move(pending));
        return;
    }

    std::error_code mkdir_ec;
    if (!utils::ensure_directory(options.save_path, mkdir_ec))
    {
        TS_LOG_ERROR("failed to ensure save path {}: {}",
                     options.save_path.string(), mkdir_ec.message());
    }
    params.save_path = options.save_path.string();
    params.flags &= ~libtorrent::torrent_flags::auto_managed;
    params.flags &= ~libtorrent::torrent_flags::paused;
    if (options.upload_only)
    {
        params.flags |= libtorrent::torrent_flags::upload_mode;
    }
    params.max_connections = settings_.max_connections_per_torrent;
    if (options.deselect_all && params.ti)
    {
        params.file_priorities.assign(
            static_cast<std::size_t>(params.ti->num_files()),
            libtorrent::dont_download);
    }

    PendingAdd pending;
    pending.deselect_all = options.deselect_all;
    pending.waiters.push_back({token, std::move(completion)});
    pending_adds_.emplace(*hash, std::move(pending));
    session_->async_add_torrent(std::move(params));
}

std::optional<SessionInfo>
LibtorrentEngine::get(std::string const &hash) const
{
    if (removing_.contains(hash))
    {
        return std::nullopt;
    }
    auto handle = handle_for(hash);
    if (!handle)
    {
        return std::nullopt;
    }
    return describe(*handle);
}

std::vector<SessionInfo> LibtorrentEngine::list() const
{
    std::vector<SessionInfo> sessions;
    if (!session_)
    {
        return sessions;
    }
    for (auto const &handle : session_->get_torrents())
    {
        if (!handle.is_valid())
        {
            continue;
        }
        auto info = describe(handle);
        if (removing_.contains(info.hash))
        {
            continue;
        }
        sessions.push_back(std::move(info));
    }
    return sessions;
}

void LibtorrentEngine::destroy(std::string const &hash, bool delete_data,
                               DestroyCompletion completion)
{
    if (auto it = removing_.find(hash); it != removing_.end())
    {
        it->second.push_back(std::move(completion));
        return;
    }
    auto handle = handle_for(hash);
    if (!handle)
    {
        if (completion)
        {
            completion(false);
        }
        return;
    }
    complete_waiters(hash, AddStatus::Failed, std::nullopt,
                     "session destroyed");
    removing_[hash].push_back(std::move(completion));
    remove_session(hash, *handle, delete_data);
}

void LibtorrentEngine::remove_session(std::string const &hash,
                                      libtorrent::torrent_handle const &handle,
                                      bool delete_data)
{
    removing_.try_emplace(hash);
    drop_cached_pieces(hash);
    auto flags = libtorrent::remove_flags_t{};
    if (delete_data)
    {
        flags = libtorrent::session::delete_files;
    }
    session_->remove_torrent(handle, flags);
}

EngineTotals LibtorrentEngine::totals() const
{
    EngineTotals totals;
    if (!session_)
    {
        return totals;
    }
    for (auto const &handle : session_->get_torrents())
    {
        if (!handle.is_valid())
        {
            continue;
        }
        auto const status = handle.status(libtorrent::status_flags_t{});
        totals.download_rate += non_negative(status.download_payload_rate);
        totals.upload_rate += non_negative(status.upload_payload_rate);
    }
    return totals;
}

bool LibtorrentEngine::select_file(std::string const &hash, int file_index)
{
    auto handle = handle_for(hash);
    if (!handle)
    {
        return false;
    }
    auto ti = handle->torrent_file();
    if (!ti || file_index < 0 || file_index >= ti->num_files())
    {
        return false;
    }
    handle->file_priority(libtorrent::file_index_t{file_index},
                          libtorrent::default_priority);
    handle->set_flags(libtorrent::torrent_flags::sequential_download);
    return true;
}

ReadResult LibtorrentEngine::read(std::string const &hash, int file_index,
                                  std::uint64_t offset, std::size_t max_bytes)
{
    ReadResult result;
    if (removing_.contains(hash))
    {
        return result;
    }
    auto handle = handle_for(hash);
    if (!handle)
    {
        return result;
    }
    auto ti = handle->torrent_file();
    if (!ti)
    {
        result.status = ReadStatus::Pending;
        return result;
    }
    if (file_index < 0 || file_index >= ti->num_files())
    {
        return result;
    }
    libtorrent::file_index_t const index{file_index};
    auto const size = non_negative(ti->files().file_size(index));
    if (offset >= size || max_bytes == 0)
    {
        result.status = ReadStatus::Ok;
        return result;
    }

    auto const request =
        ti->map_file(index, static_cast<std::int64_t>(offset), 1);
    auto const last_piece =
        static_cast<int>(ti->map_file(index, static_cast<std::int64_t>(size - 1), 1).piece);
    auto const first_piece = static_cast<int>(request.piece);

    // Read-ahead window: earlier pieces get earlier deadlines.
    auto const window_end =
        std::min(last_piece, first_piece + settings_.read_ahead_pieces - 1);
    for (int piece = first_piece; piece <= window_end; ++piece)
    {
        libtorrent::piece_index_t const p{piece};
        if (!handle->have_piece(p))
        {
            handle->set_piece_deadline(p, (piece - first_piece) *
                                              kDeadlineStepMs);
        }
    }

    result.status = ReadStatus::Pending;
    if (!handle->have_piece(request.piece))
    {
        return result;
    }
    if (auto const *cached = cached_piece(hash, first_piece))
    {
        auto const start = static_cast<std::size_t>(request.start);
        if (start >= cached->data.size())
        {
            return result;
        }
        auto length = std::min<std::uint64_t>(
            {static_cast<std::uint64_t>(max_bytes),
             static_cast<std::uint64_t>(cached->data.size() - start),
             size - offset});
        result.data.assign(cached->data.begin() + start,
                           cached->data.begin() + start + length);
        result.status = ReadStatus::Ok;
        return result;
    }
    if (piece_requests_.emplace(hash, first_piece).second)
    {
        handle->read_piece(request.piece);
    }
    return result;
}

LibtorrentEngine::CachedPiece const *
LibtorrentEngine::cached_piece(std::string const &hash, int piece) const
{
    for (auto const &entry : piece_cache_)
    {
        if (entry.piece == piece && entry.hash == hash)
        {
            return &entry;
        }
    }
    return nullptr;
}

void LibtorrentEngine::drop_cached_pieces(std::string const &hash)
{
    piece_cache_.erase(std::remove_if(piece_cache_.begin(), piece_cache_.end(),
                                      [&](CachedPiece const &entry)
                                      { return entry.hash == hash; }),
                       piece_cache_.end());
    for (auto it = piece_requests_.begin(); it != piece_requests_.end();)
    {
        it = it->first == hash ? piece_requests_.erase(it) : std::next(it);
    }
}

void LibtorrentEngine::process_alerts()
{
    if (!session_)
    {
        return;
    }
    alert_buffer_.clear();
    session_->pop_alerts(&alert_buffer_);
    for (auto const *alert : alert_buffer_)
    {
        if (auto *added =
                libtorrent::alert_cast<libtorrent::add_torrent_alert>(alert))
        {
            handle_add_alert(*added);
        }
        else if (auto *metadata = libtorrent::alert_cast<
                     libtorrent::metadata_received_alert>(alert))
        {
            handle_metadata_alert(*metadata);
        }
        else if (auto *removed =
                     libtorrent::alert_cast<libtorrent::torrent_removed_alert>(
                         alert))
        {
            handle_removed_alert(*removed);
        }
        else if (auto *piece =
                     libtorrent::alert_cast<libtorrent::read_piece_alert>(
                         alert))
        {
            handle_read_piece_alert(*piece);
        }
        else if (auto *metadata_failed =
                     libtorrent::alert_cast<libtorrent::metadata_failed_alert>(
                         alert))
        {
            TS_LOG_WARN("{} metadata rejected: {}", settings_.label,
                        metadata_failed->error.message());
        }
        else if (auto *file_error =
                     libtorrent::alert_cast<libtorrent::file_error_alert>(
                         alert))
        {
            TS_LOG_WARN("{} file error on {}: {}", settings_.label,
                        file_error->filename(), file_error->error.message());
        }
        else if (auto *delete_failed = libtorrent::alert_cast<
                     libtorrent::torrent_delete_failed_alert>(alert))
        {
            TS_LOG_WARN("{} failed to delete data: {}", settings_.label,
                        delete_failed->error.message());
        }
        else if (auto *listen_failed =
                     libtorrent::alert_cast<libtorrent::listen_failed_alert>(
                         alert))
        {
            TS_LOG_ERROR("{} listen failed on {}: {}", settings_.label,
                         listen_failed->address.to_string(),
                         listen_failed->error.message());
        }
    }
    reap_cancelled_adds();
}

void LibtorrentEngine::handle_add_alert(
    libtorrent::add_torrent_alert const &alert)
{
    auto hash = info_hash_from_params(alert.params);
    if (!hash)
    {
        hash = hash_from_handle(alert.handle);
    }
    if (!hash)
    {
        return;
    }
    if (alert.error)
    {
        if (is_duplicate_add_error(alert.error))
        {
            auto existing = handle_for(*hash);
            if (existing && existing->torrent_file())
            {
                complete_waiters(*hash, AddStatus::Duplicate,
                                 describe(*existing), {});
            }
            // Otherwise the first add's metadata alert completes us.
            return;
        }
        TS_LOG_WARN("{} add of {} failed: {}", settings_.label, *hash,
                    alert.error.message());
        complete_waiters(*hash, AddStatus::Failed, std::nullopt,
                         alert.error.message());
        return;
    }
    // Every waiter gave up before libtorrent confirmed the add.
    if (!pending_adds_.contains(*hash))
    {
        if (alert.handle.is_valid() && !removing_.contains(*hash))
        {
            TS_LOG_DEBUG("{} add of {} landed after cancellation; removing",
                         settings_.label, *hash);
            remove_session(*hash, alert.handle, true);
        }
        return;
    }
    TS_LOG_INFO("Added torrent: {}", alert.params.ti ? alert.params.ti->name()
                                                     : alert.params.name);
    if (alert.handle.is_valid() && alert.handle.torrent_file())
    {
        complete_waiters(*hash, AddStatus::Ok, describe(alert.handle), {});
    }
}

void LibtorrentEngine::handle_metadata_alert(
    libtorrent::metadata_received_alert const &alert)
{
    auto hash = hash_from_handle(alert.handle);
    if (!hash)
    {
        return;
    }
    auto pending = pending_adds_.find(*hash);
    if (pending == pending_adds_.end())
    {
        return;
    }
    if (pending->second.deselect_all)
    {
        if (auto ti = alert.handle.torrent_file())
        {
            alert.handle.prioritize_files(
                std::vector<libtorrent::download_priority_t>(
                    static_cast<std::size_t>(ti->num_files()),
                    libtorrent::dont_download));
        }
    }
    complete_waiters(*hash, AddStatus::Ok, describe(alert.handle), {});
}

void LibtorrentEngine::handle_removed_alert(
    libtorrent::torrent_removed_alert const &alert)
{
    auto const hash = info_hash_to_hex(alert.info_hashes);
    std::vector<DestroyCompletion> completions;
    if (auto it = removing_.find(hash); it != removing_.end())
    {
        completions = std::move(it->second);
        removing_.erase(it);
    }
    std::vector<std::function<void()>> deferred;
    if (auto it = deferred_adds_.find(hash); it != deferred_adds_.end())
    {
        deferred = std::move(it->second);
        deferred_adds_.erase(it);
    }
    for (auto &completion : completions)
    {
        if (completion)
        {
            completion(true);
        }
    }
    for (auto &retry : deferred)
    {
        retry();
    }
}

void LibtorrentEngine::handle_read_piece_alert(
    libtorrent::read_piece_alert const &alert)
{
    auto hash = hash_from_handle(alert.handle);
    if (!hash)
    {
        return;
    }
    auto const piece = static_cast<int>(alert.piece);
    piece_requests_.erase({*hash, piece});
    if (alert.error)
    {
        TS_LOG_WARN("{} read of piece {} in {} failed: {}", settings_.label,
                    piece, *hash, alert.error.message());
        return;
    }
    if (removing_.contains(*hash) || cached_piece(*hash, piece) != nullptr)
    {
        return;
    }
    CachedPiece entry;
    entry.hash = *hash;
    entry.piece = piece;
    entry.data.assign(alert.buffer.get(), alert.buffer.get() + alert.size);
    piece_cache_.push_back(std::move(entry));
    while (piece_cache_.size() > kPieceCacheCapacity)
    {
        piece_cache_.pop_front();
    }
}

void LibtorrentEngine::complete_waiters(std::string const &hash,
                                        AddStatus status,
                                        std::optional<SessionInfo> session,
                                        std::string const &error)
{
    auto it = pending_adds_.find(hash);
    if (it == pending_adds_.end())
    {
        return;
    }
    auto waiters = std::move(it->second.waiters);
    pending_adds_.erase(it);

    bool delivered = false;
    for (auto &waiter : waiters)
    {
        if (waiter.token.is_cancelled() || !waiter.completion)
        {
            continue;
        }
        delivered = true;
        waiter.completion({status, session, error});
    }
    // Everybody gave up before the outcome arrived: nobody will ever
    // stream from this session, so it must not linger.
    if (!delivered && session && !removing_.contains(hash))
    {
        if (auto handle = handle_for(hash))
        {
            TS_LOG_DEBUG("{} dropping {}; every add was cancelled",
                         settings_.label, hash);
            remove_session(hash, *handle, true);
        }
    }
}

void LibtorrentEngine::reap_cancelled_adds()
{
    std::vector<std::string> abandoned;
    for (auto &[hash, pending] : pending_adds_)
    {
        auto &waiters = pending.waiters;
        waiters.erase(std::remove_if(waiters.begin(), waiters.end(),
                                     [](Waiter const &waiter)
                                     { return waiter.token.is_cancelled(); }),
                      waiters.end());
        if (waiters.empty())
        {
            abandoned.push_back(hash);
        }
    }
    for (auto const &hash : abandoned)
    {
        pending_adds_.erase(hash);
        if (auto handle = handle_for(hash); handle && !removing_.contains(hash))
        {
            TS_LOG_DEBUG("{} add of {} cancelled; removing", settings_.label,
                         hash);
            remove_session(hash, *handle, true);
        }
    }
}

} // namespace ts::engine
