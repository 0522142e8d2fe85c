#include "engine/StreamBroker.hpp"

#include "engine/AddRace.hpp"
#include "engine/LifecycleManager.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <utility>

namespace ts::engine
{

char const *to_string(OpenStreamStatus status) noexcept
{
    switch (status)
    {
    case OpenStreamStatus::Ok:
        return "ok";
    case OpenStreamStatus::InvalidUri:
        return "invalid uri";
    case OpenStreamStatus::NoMetadata:
        return "no metadata";
    case OpenStreamStatus::FileNotFound:
        return "file not found";
    case OpenStreamStatus::FetchFailed:
        return "fetch failed";
    }
    return "unknown";
}

std::optional<SessionFileInfo> find_file(SessionInfo const &session,
                                         std::string_view path)
{
    while (!path.empty() && path.front() == '/')
    {
        path.remove_prefix(1);
    }
    auto it = std::find_if(session.files.begin(), session.files.end(),
                           [path](SessionFileInfo const &file)
                           { return file.path == path; });
    if (it == session.files.end())
    {
        return std::nullopt;
    }
    return *it;
}

StreamBroker::StreamBroker(SwarmEngine &engine, SchedulerService &scheduler,
                           LifecycleManager &lifecycle,
                           StreamBrokerSettings settings)
    : engine_(engine), scheduler_(scheduler), lifecycle_(lifecycle),
      settings_(std::move(settings))
{
}

void StreamBroker::open(AddSource source, std::string hash, std::string path,
                        OpenStreamCallback callback)
{
    // The old session is on its way out; start over on a fresh one.
    if (lifecycle_.after_teardown(
            hash, [this, source, hash, path, callback]() mutable
            {
                open(std::move(source), std::move(hash), std::move(path),
                     std::move(callback));
            }))
    {
        TS_LOG_DEBUG("stream for {} waits for teardown", hash);
        return;
    }

    AddOptions options;
    options.save_path = settings_.download_dir;
    options.deselect_all = true;
    race_add(engine_, scheduler_, source, std::move(options),
             settings_.metadata_timeout,
             [this, source, hash, path = std::move(path),
              callback = std::move(callback)](
                 std::optional<AddResult> result) mutable
             {
                 if (!result)
                 {
                     TS_LOG_INFO("No metadata for {} within {} ms", hash,
                                 settings_.metadata_timeout.count());
                     callback({OpenStreamStatus::NoMetadata, std::nullopt,
                               "no metadata"});
                     return;
                 }
                 if (!result->has_session())
                 {
                     auto status = result->status == AddStatus::InvalidSource
                                       ? OpenStreamStatus::InvalidUri
                                       : OpenStreamStatus::NoMetadata;
                     callback({status, std::nullopt, result->error});
                     return;
                 }
                 attach(std::move(source), *result->session, std::move(path),
                        std::move(callback));
             });
}

void StreamBroker::attach(AddSource source, SessionInfo const &session,
                          std::string path, OpenStreamCallback callback)
{
    auto file = find_file(session, path);
    if (!file)
    {
        // Nobody streams from it yet; let it age out like a restored seed.
        lifecycle_.admit_seed(session.hash, session.name);
        callback({OpenStreamStatus::FileNotFound, std::nullopt,
                  "file not found: " + path});
        return;
    }
    if (!lifecycle_.stream_opened(session.hash, file->name))
    {
        open(std::move(source), session.hash, std::move(path),
             std::move(callback));
        return;
    }
    if (!engine_.select_file(session.hash, file->index))
    {
        TS_LOG_WARN("could not select {} in {}", file->path, session.hash);
    }

    StreamTicket ticket;
    ticket.id = next_ticket_id_++;
    ticket.hash = session.hash;
    ticket.file_index = file->index;
    ticket.file_name = file->name;
    ticket.file_path = file->path;
    ticket.length = file->length;
    tickets_.emplace(ticket.id, ticket);
    callback({OpenStreamStatus::Ok, std::move(ticket), {}});
}

void StreamBroker::close(std::uint64_t ticket_id)
{
    auto it = tickets_.find(ticket_id);
    if (it == tickets_.end())
    {
        return;
    }
    auto ticket = std::move(it->second);
    tickets_.erase(it);
    std::erase_if(pending_reads_, [ticket_id](PendingRead const &read)
                  { return read.ticket_id == ticket_id; });
    lifecycle_.stream_closed(ticket.hash, ticket.file_name);
}

void StreamBroker::read(std::uint64_t ticket_id, std::uint64_t offset,
                        std::size_t max_bytes, ReadCallback callback)
{
    auto it = tickets_.find(ticket_id);
    if (it == tickets_.end())
    {
        callback(ReadResult{});
        return;
    }
    auto result = engine_.read(it->second.hash, it->second.file_index, offset,
                               max_bytes);
    if (result.status == ReadStatus::Pending)
    {
        pending_reads_.push_back(
            {ticket_id, offset, max_bytes, std::move(callback)});
        return;
    }
    callback(std::move(result));
}

void StreamBroker::retry_pending_reads()
{
    if (pending_reads_.empty())
    {
        return;
    }
    auto waiting = std::move(pending_reads_);
    pending_reads_.clear();
    for (auto &pending : waiting)
    {
        read(pending.ticket_id, pending.offset, pending.max_bytes,
             std::move(pending.callback));
    }
}

} // namespace ts::engine
