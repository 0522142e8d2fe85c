#include "utils/HttpFetch.hpp"

#include "utils/Log.hpp"

#include <chrono>
#include <string>
#include <utility>

#include <mongoose.h>

namespace ts::utils
{

namespace
{

struct FetchContext
{
    std::string url;
    bool request_sent = false;
    bool done = false;
    int status = 0;
    std::string location;
    std::vector<std::uint8_t> body;
    std::string error;
};

void fetch_handler(struct mg_connection *conn, int ev, void *ev_data)
{
    auto *ctx = static_cast<FetchContext *>(conn->fn_data);
    if (ctx == nullptr)
    {
        return;
    }
    if (ev == MG_EV_CONNECT && !ctx->request_sent)
    {
        auto host = mg_url_host(ctx->url.c_str());
        if (mg_url_is_ssl(ctx->url.c_str()))
        {
            struct mg_tls_opts opts = {};
            opts.name = host;
            mg_tls_init(conn, &opts);
        }
        auto uri = mg_url_uri(ctx->url.c_str());
        mg_printf(conn,
                  "GET %s HTTP/1.1\r\n"
                  "Host: %.*s\r\n"
                  "Accept: */*\r\n"
                  "Connection: close\r\n"
                  "\r\n",
                  uri, static_cast<int>(host.len), host.buf);
        ctx->request_sent = true;
    }
    else if (ev == MG_EV_HTTP_MSG)
    {
        auto *hm = static_cast<struct mg_http_message *>(ev_data);
        ctx->status = mg_http_status(hm);
        ctx->body.assign(reinterpret_cast<std::uint8_t const *>(hm->body.buf),
                         reinterpret_cast<std::uint8_t const *>(hm->body.buf) +
                             hm->body.len);
        if (auto *location = mg_http_get_header(hm, "Location"))
        {
            ctx->location.assign(location->buf, location->len);
        }
        ctx->done = true;
        conn->is_draining = 1;
    }
    else if (ev == MG_EV_ERROR)
    {
        ctx->error = ev_data ? static_cast<char const *>(ev_data)
                             : "connection error";
        // The whole response is buffered in conn->recv, which mongoose
        // caps at MG_MAX_RECV_SIZE.
        if (conn->recv.len >= MG_MAX_RECV_SIZE)
        {
            ctx->error = "response exceeds the " +
                         std::to_string(MG_MAX_RECV_SIZE) +
                         "-byte receive limit";
        }
        ctx->done = true;
    }
    else if (ev == MG_EV_CLOSE && !ctx->done)
    {
        ctx->error = "connection closed before response";
        ctx->done = true;
    }
}

FetchResult fetch_once(std::string const &url,
                       std::chrono::steady_clock::time_point deadline,
                       std::string &redirect)
{
    FetchContext ctx;
    ctx.url = url;
    struct mg_mgr mgr;
    mg_mgr_init(&mgr);
    auto *conn = mg_http_connect(&mgr, url.c_str(), fetch_handler, &ctx);
    if (conn == nullptr)
    {
        mg_mgr_free(&mgr);
        return FetchResult{0, {}, "unable to connect to " + url};
    }
    while (!ctx.done && std::chrono::steady_clock::now() < deadline)
    {
        mg_mgr_poll(&mgr, 50);
    }
    // Detach the context before mg_mgr_free fires MG_EV_CLOSE.
    for (auto *c = mgr.conns; c != nullptr; c = c->next)
    {
        c->fn_data = nullptr;
    }
    mg_mgr_free(&mgr);

    FetchResult result;
    if (!ctx.done)
    {
        result.error = "timed out fetching " + url;
        return result;
    }
    result.status = ctx.status;
    result.body = std::move(ctx.body);
    result.error = std::move(ctx.error);
    redirect = std::move(ctx.location);
    return result;
}

} // namespace

FetchResult http_get(std::string const &url, std::chrono::milliseconds timeout,
                     int max_redirects)
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    std::string current = url;
    for (int hop = 0; hop <= max_redirects; ++hop)
    {
        std::string redirect;
        auto result = fetch_once(current, deadline, redirect);
        bool const is_redirect = result.error.empty() &&
                                 result.status >= 300 && result.status < 400 &&
                                 !redirect.empty();
        if (!is_redirect)
        {
            if (!result.ok())
            {
                TS_LOG_WARN("GET {} failed: status={} {}", current,
                            result.status, result.error);
            }
            return result;
        }
        TS_LOG_DEBUG("GET {} redirected to {}", current, redirect);
        current = std::move(redirect);
    }
    return FetchResult{0, {}, "too many redirects fetching " + url};
}

} // namespace ts::utils
