#include "http/Server.hpp"

#include "engine/Core.hpp"
#include "http/HttpUtils.hpp"
#include "http/Serializer.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"

#include <algorithm>
#include <exception>
#include <string_view>
#include <utility>

#if defined(_WIN32)
#include <winsock2.h>
#else
#include <arpa/inet.h>
#endif

namespace ts::http
{

namespace
{

constexpr std::size_t kChunkBytes = 256 * 1024;
constexpr std::size_t kSendLowWater = 1024 * 1024;
constexpr char const *kJsonHeaders =
    "Content-Type: application/json\r\n"
    "Access-Control-Allow-Origin: *\r\n";

std::optional<std::string> header_value(struct mg_http_message *hm,
                                        char const *name)
{
    auto *header = mg_http_get_header(hm, name);
    if (header == nullptr)
    {
        return std::nullopt;
    }
    return std::string(header->buf, header->len);
}

// Decoded query parameter; empty when absent.
std::string query_value(struct mg_http_message *hm, char const *name)
{
    std::string buffer(hm->query.len + 1, '\0');
    auto len = mg_http_get_var(&hm->query, name, buffer.data(), buffer.size());
    if (len <= 0)
    {
        return {};
    }
    buffer.resize(static_cast<std::size_t>(len));
    return buffer;
}

void reply_json(struct mg_connection *conn, int status,
                std::string const &body)
{
    mg_http_reply(conn, status, kJsonHeaders, "%s", body.c_str());
}

void reply_error(struct mg_connection *conn, int status,
                 std::string_view message)
{
    reply_json(conn, status, serialize_error(message));
}

int status_for(engine::OpenStreamStatus status)
{
    switch (status)
    {
    case engine::OpenStreamStatus::Ok:
        return 200;
    case engine::OpenStreamStatus::InvalidUri:
        return 400;
    case engine::OpenStreamStatus::NoMetadata:
    case engine::OpenStreamStatus::FileNotFound:
        return 404;
    case engine::OpenStreamStatus::FetchFailed:
        return 502;
    }
    return 500;
}

int status_for(engine::ResolveStatus status)
{
    switch (status)
    {
    case engine::ResolveStatus::Ok:
        return 200;
    case engine::ResolveStatus::InvalidUri:
        return 400;
    case engine::ResolveStatus::NoMetadata:
        return 404;
    case engine::ResolveStatus::FetchFailed:
        return 502;
    }
    return 500;
}

} // namespace

Server::Server(engine::Core *core, std::string bind_url)
    : core_(core), bind_url_(std::move(bind_url))
{
    mg_mgr_init(&mgr_);
    mgr_.userdata = this;
}

Server::~Server()
{
    // Callbacks fired by mg_mgr_free must not touch member state.
    destroying_.store(true, std::memory_order_release);
    stop();
    mg_mgr_free(&mgr_);
}

bool Server::start()
{
    if (running_.exchange(true))
    {
        return true;
    }
    mg_wakeup_init(&mgr_);
    listener_ =
        mg_http_listen(&mgr_, bind_url_.c_str(), &Server::handle_event, this);
    if (listener_ == nullptr)
    {
        TS_LOG_ERROR("Failed to bind HTTP listener to {}", bind_url_);
        running_.store(false);
        return false;
    }
    port_ = static_cast<std::uint16_t>(ntohs(listener_->loc.port));
    TS_LOG_INFO("HTTP listener bound to {} (port {})", bind_url_, port_);
    worker_ = std::thread(&Server::run_loop, this);
    return true;
}

void Server::stop()
{
    running_.store(false);
    if (worker_.joinable())
    {
        TS_LOG_INFO("Stopping HTTP worker thread");
        worker_.join();
    }
    if (listener_ != nullptr)
    {
        listener_->is_closing = 1;
        listener_ = nullptr;
    }
}

void Server::run_loop()
{
    try
    {
        while (running_.load(std::memory_order_relaxed) &&
               !ts::runtime::should_shutdown())
        {
            mg_mgr_poll(&mgr_, 50);
            process_pending_tasks();
        }
    }
    catch (std::exception const &ex)
    {
        TS_LOG_ERROR("HTTP worker exception: {}", ex.what());
        ts::runtime::request_shutdown();
    }
    running_.store(false, std::memory_order_relaxed);
}

void Server::handle_event(struct mg_connection *conn, int ev, void *ev_data)
{
    if (conn == nullptr)
    {
        return;
    }
    auto *self = static_cast<Server *>(conn->fn_data);
    if (self == nullptr || self->destroying_.load(std::memory_order_acquire))
    {
        return;
    }

    switch (ev)
    {
    case MG_EV_HTTP_MSG:
        self->handle_http_message(
            conn, static_cast<struct mg_http_message *>(ev_data));
        break;
    case MG_EV_POLL:
        self->handle_poll(conn);
        break;
    case MG_EV_CLOSE:
        self->handle_connection_closed(conn);
        break;
    default:
        break;
    }
}

void Server::handle_http_message(struct mg_connection *conn,
                                 struct mg_http_message *hm)
{
    if (hm == nullptr)
    {
        return;
    }
    std::string_view uri(hm->uri.buf, hm->uri.len);
    std::string_view method(hm->method.buf, hm->method.len);
    TS_LOG_DEBUG("HTTP request {} {}", method, uri);

    if (method != "GET" && method != "HEAD")
    {
        reply_error(conn, 405, "method not allowed");
        return;
    }
    // A connection carries one asynchronous request at a time. A request
    // pipelined behind it is dropped: a second stream would take a ticket
    // the connection can never close.
    if (resolving_.contains(conn->id) || streams_.contains(conn->id))
    {
        TS_LOG_DEBUG("ignoring pipelined request {} on busy connection {}",
                     uri, conn->id);
        return;
    }
    if (uri == "/stats")
    {
        handle_stats(conn);
    }
    else if (uri == "/torrent")
    {
        handle_torrent(conn, hm);
    }
    else if (uri == "/stream")
    {
        handle_stream(conn, hm);
    }
    else
    {
        reply_error(conn, 404, "not found");
    }
}

void Server::handle_stats(struct mg_connection *conn)
{
    auto stats = core_->stats();
    reply_json(conn, 200,
               stats ? serialize_stats(*stats)
                     : serialize_stats(engine::StreamStats{}));
}

void Server::handle_torrent(struct mg_connection *conn,
                            struct mg_http_message *hm)
{
    auto uri = query_value(hm, "uri");
    if (uri.empty())
    {
        reply_error(conn, 400, "missing uri");
        return;
    }
    std::string stream_base;
    if (auto host = header_value(hm, "Host"))
    {
        stream_base = "http://" + *host;
    }
    auto id = conn->id;
    resolving_[id] = conn;
    core_->resolve_torrent(
        uri,
        [this, id, uri, stream_base](engine::ResolveResult result)
        {
            enqueue_task(
                id,
                [this, id, uri, stream_base,
                 result = std::move(result)]() mutable
                { on_resolved(id, uri, stream_base, std::move(result)); });
        });
}

void Server::on_resolved(unsigned long conn_id, std::string const &uri,
                         std::string const &stream_base,
                         engine::ResolveResult result)
{
    auto it = resolving_.find(conn_id);
    if (it == resolving_.end())
    {
        return;
    }
    auto *conn = it->second;
    resolving_.erase(it);
    if (result.status != engine::ResolveStatus::Ok || !result.summary)
    {
        reply_error(conn, status_for(result.status), result.error);
        return;
    }
    reply_json(conn, 200,
               serialize_summary(*result.summary, uri, stream_base));
}

void Server::handle_stream(struct mg_connection *conn,
                           struct mg_http_message *hm)
{
    engine::StreamRequest request;
    request.uri = query_value(hm, "uri");
    request.path = query_value(hm, "path");
    if (request.uri.empty() || request.path.empty())
    {
        reply_error(conn, 400, "missing uri or path");
        return;
    }

    auto id = conn->id;
    StreamExchange exchange;
    exchange.conn = conn;
    exchange.range_header = header_value(hm, "Range").value_or("");
    exchange.head_only =
        std::string_view(hm->method.buf, hm->method.len) == "HEAD";
    streams_[id] = std::move(exchange);

    core_->open_stream(std::move(request),
                       [this, id](engine::OpenStreamResult result)
                       {
                           enqueue_task(
                               id,
                               [this, id, result = std::move(result)]() mutable
                               { on_stream_opened(id, std::move(result)); });
                       });
}

void Server::on_stream_opened(unsigned long conn_id,
                              engine::OpenStreamResult result)
{
    auto it = streams_.find(conn_id);
    if (it == streams_.end())
    {
        // The client went away while the torrent was being prepared.
        if (result.ticket)
        {
            core_->close_stream(*result.ticket);
        }
        return;
    }
    auto &exchange = it->second;
    if (result.status != engine::OpenStreamStatus::Ok || !result.ticket)
    {
        auto *conn = exchange.conn;
        streams_.erase(it);
        reply_error(conn, status_for(result.status),
                    result.error.empty() ? engine::to_string(result.status)
                                         : result.error);
        return;
    }

    if (exchange.ticket)
    {
        TS_LOG_WARN("connection {} already streams {}; closing extra ticket",
                    conn_id, exchange.ticket->file_path);
        core_->close_stream(*result.ticket);
        return;
    }
    exchange.ticket = std::move(result.ticket);
    auto const &ticket = *exchange.ticket;
    auto *conn = exchange.conn;
    auto range = parse_range(exchange.range_header, ticket.length);
    if (range.kind == ByteRange::Kind::Unsatisfiable)
    {
        mg_printf(conn,
                  "HTTP/1.1 416 Range Not Satisfiable\r\n"
                  "Content-Range: bytes */%llu\r\n"
                  "Content-Length: 0\r\n"
                  "Connection: close\r\n\r\n",
                  static_cast<unsigned long long>(ticket.length));
        conn->is_draining = 1;
        return;
    }

    auto const partial = range.kind == ByteRange::Kind::Partial;
    std::string content_range;
    if (partial)
    {
        content_range = "Content-Range: bytes " +
                        std::to_string(range.start) + "-" +
                        std::to_string(range.last()) + "/" +
                        std::to_string(ticket.length) + "\r\n";
    }
    auto mime = mime_type_for(ticket.file_name);
    mg_printf(conn,
              "HTTP/1.1 %d %s\r\n"
              "Content-Type: %s\r\n"
              "Content-Length: %llu\r\n"
              "Accept-Ranges: bytes\r\n"
              "Access-Control-Allow-Origin: *\r\n"
              "%s"
              "Connection: close\r\n\r\n",
              partial ? 206 : 200, partial ? "Partial Content" : "OK",
              mime.c_str(), static_cast<unsigned long long>(range.count),
              content_range.c_str());
    TS_LOG_DEBUG("streaming {} bytes {}-{} of {}", ticket.file_path,
                 range.start, range.last(), ticket.length);

    exchange.next = range.start;
    exchange.end = range.start + range.count;
    if (exchange.head_only || range.count == 0)
    {
        conn->is_draining = 1;
        return;
    }
    pump(exchange);
}

void Server::pump(StreamExchange &exchange)
{
    if (!exchange.ticket || exchange.read_in_flight ||
        exchange.next >= exchange.end ||
        exchange.conn->send.len >= kSendLowWater)
    {
        return;
    }
    auto want = static_cast<std::size_t>(
        std::min<std::uint64_t>(kChunkBytes, exchange.end - exchange.next));
    exchange.read_in_flight = true;
    auto id = exchange.conn->id;
    core_->read_chunk(*exchange.ticket, exchange.next, want,
                      [this, id](engine::ReadResult result)
                      {
                          enqueue_task(
                              id,
                              [this, id, result = std::move(result)]() mutable
                              { on_chunk(id, std::move(result)); });
                      });
}

void Server::on_chunk(unsigned long conn_id, engine::ReadResult result)
{
    auto it = streams_.find(conn_id);
    if (it == streams_.end())
    {
        return;
    }
    auto &exchange = it->second;
    exchange.read_in_flight = false;
    if (result.status != engine::ReadStatus::Ok || result.data.empty())
    {
        TS_LOG_WARN("stream of {} ended early at byte {}",
                    exchange.ticket ? exchange.ticket->file_path : "?",
                    exchange.next);
        exchange.conn->is_closing = 1;
        return;
    }
    auto size = static_cast<std::size_t>(std::min<std::uint64_t>(
        result.data.size(), exchange.end - exchange.next));
    mg_send(exchange.conn, result.data.data(), size);
    exchange.next += size;
    if (exchange.next >= exchange.end)
    {
        exchange.conn->is_draining = 1;
        return;
    }
    pump(exchange);
}

void Server::handle_poll(struct mg_connection *conn)
{
    auto it = streams_.find(conn->id);
    if (it != streams_.end())
    {
        pump(it->second);
    }
}

void Server::handle_connection_closed(struct mg_connection *conn)
{
    resolving_.erase(conn->id);
    auto it = streams_.find(conn->id);
    if (it == streams_.end())
    {
        return;
    }
    if (it->second.ticket)
    {
        core_->close_stream(*it->second.ticket);
    }
    streams_.erase(it);
}

void Server::enqueue_task(unsigned long conn_id,
                          std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock(tasks_mtx_);
        pending_tasks_.push_back(std::move(task));
    }
    // Interrupts mg_mgr_poll; the task itself runs right after the poll.
    mg_wakeup(&mgr_, conn_id, nullptr, 0);
}

void Server::process_pending_tasks()
{
    std::vector<std::function<void()>> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_mtx_);
        tasks.swap(pending_tasks_);
    }
    for (auto &task : tasks)
    {
        task();
    }
}

} // namespace ts::http
