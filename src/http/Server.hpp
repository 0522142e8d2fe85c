#pragma once

#include "engine/StreamBroker.hpp"

#include <mongoose.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ts::engine
{
class Core;
struct ResolveResult;
}

namespace ts::http
{

// mongoose front end: /stats, /torrent and /stream. Runs its own poll
// thread; Core callbacks are marshalled back onto it with enqueue_task().
class Server
{
  public:
    explicit Server(engine::Core *core,
                    std::string bind_url = "http://0.0.0.0:58827");
    ~Server();

    Server(Server const &) = delete;
    Server &operator=(Server const &) = delete;

    // Returns false when the listener could not be bound.
    bool start();
    void stop();

    std::uint16_t port() const noexcept
    {
        return port_;
    }

  private:
    struct StreamExchange
    {
        struct mg_connection *conn = nullptr;
        std::string range_header;
        bool head_only = false;
        std::optional<engine::StreamTicket> ticket;
        std::uint64_t next = 0;
        std::uint64_t end = 0;
        bool read_in_flight = false;
    };

    static void handle_event(struct mg_connection *conn, int ev, void *ev_data);
    void run_loop();
    void handle_http_message(struct mg_connection *conn,
                             struct mg_http_message *hm);
    void handle_stats(struct mg_connection *conn);
    void handle_torrent(struct mg_connection *conn, struct mg_http_message *hm);
    void handle_stream(struct mg_connection *conn, struct mg_http_message *hm);
    void handle_poll(struct mg_connection *conn);
    void handle_connection_closed(struct mg_connection *conn);

    void on_resolved(unsigned long conn_id, std::string const &uri,
                     std::string const &stream_base,
                     engine::ResolveResult result);
    void on_stream_opened(unsigned long conn_id,
                          engine::OpenStreamResult result);
    void on_chunk(unsigned long conn_id, engine::ReadResult result);
    void pump(StreamExchange &exchange);

    void enqueue_task(unsigned long conn_id, std::function<void()> task);
    void process_pending_tasks();

    engine::Core *core_;
    std::string bind_url_;
    mg_mgr mgr_;
    struct mg_connection *listener_ = nullptr;
    std::uint16_t port_ = 0;
    std::atomic_bool running_{false};
    std::atomic_bool destroying_{false};
    std::thread worker_;

    std::unordered_map<unsigned long, struct mg_connection *> resolving_;
    std::unordered_map<unsigned long, StreamExchange> streams_;

    std::vector<std::function<void()>> pending_tasks_;
    std::mutex tasks_mtx_;
};

} // namespace ts::http
