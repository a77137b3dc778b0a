#include "http/Client.hpp"

#include "utils/Endpoint.hpp"

#include <mongoose.h>

#include <atomic>
#include <cstring>
#include <exception>
#include <future>
#include <stdexcept>
#include <thread>

namespace tbl::http
{
namespace
{

struct ClientContext
{
    explicit ClientContext(std::string request_payload, std::string host_name,
                           bool secure)
        : request(std::move(request_payload)), host(std::move(host_name)),
          tls(secure), future(ready.get_future())
    {
    }

    std::string request;
    std::string host;
    bool tls = false;
    ClientResponse response;
    bool request_sent = false;
    std::promise<void> ready;
    std::future<void> future;
    std::atomic<bool> completed{false};

    void signal_success()
    {
        bool expected = false;
        if (completed.compare_exchange_strong(expected, true))
        {
            ready.set_value();
        }
    }

    void signal_failure(std::exception_ptr ep)
    {
        bool expected = false;
        if (completed.compare_exchange_strong(expected, true))
        {
            ready.set_exception(ep);
        }
    }
};

void client_handler(struct mg_connection *conn, int ev, void *ev_data)
{
    if (conn == nullptr)
    {
        return;
    }
    auto *ctx = static_cast<ClientContext *>(conn->fn_data);
    if (ctx == nullptr)
    {
        return;
    }

    if (ev == MG_EV_CONNECT && !ctx->request_sent)
    {
        if (ctx->tls)
        {
            struct mg_tls_opts opts;
            std::memset(&opts, 0, sizeof(opts));
            opts.name = mg_str_n(ctx->host.data(), ctx->host.size());
            mg_tls_init(conn, &opts);
        }
        mg_send(conn, ctx->request.c_str(), ctx->request.size());
        ctx->request_sent = true;
    }
    else if (ev == MG_EV_HTTP_MSG)
    {
        auto *hm = static_cast<struct mg_http_message *>(ev_data);
        ctx->response.status = mg_http_status(hm);
        ctx->response.body.assign(hm->body.buf, hm->body.len);
        for (std::size_t i = 0; i < MG_MAX_HTTP_HEADERS; ++i)
        {
            auto const &entry = hm->headers[i];
            if (entry.name.len == 0)
            {
                break;
            }
            ctx->response.headers.emplace_back(
                std::string(entry.name.buf, entry.name.len),
                std::string(entry.value.buf, entry.value.len));
        }
        ctx->signal_success();
        conn->is_closing = 1;
    }
    else if (ev == MG_EV_ERROR)
    {
        auto *message = static_cast<char const *>(ev_data);
        ctx->signal_failure(std::make_exception_ptr(std::runtime_error(
            std::string("HTTP connection error: ") +
            (message ? message : "unknown"))));
    }
    else if (ev == MG_EV_CLOSE)
    {
        if (ctx->completed.load(std::memory_order_acquire))
        {
            return;
        }
        ctx->signal_failure(std::make_exception_ptr(
            std::runtime_error("HTTP request aborted before response")));
    }
}

std::string build_request(ClientRequest const &request,
                          std::string_view host_header)
{
    auto path = mg_url_uri(request.url.c_str());
    std::string payload;
    payload.reserve(256 + request.body.size());
    payload += request.method;
    payload += ' ';
    payload += (path && *path) ? path : "/";
    payload += " HTTP/1.1\r\nHost: ";
    payload += host_header;
    for (auto const &line : request.headers)
    {
        payload += "\r\n";
        payload += line;
    }
    if (!request.content_type.empty())
    {
        payload += "\r\nContent-Type: ";
        payload += request.content_type;
    }
    payload += "\r\nContent-Length: ";
    payload += std::to_string(request.body.size());
    payload += "\r\nConnection: close\r\n\r\n";
    payload += request.body;
    return payload;
}

} // namespace

std::optional<std::string> ClientResponse::header(std::string const &name) const
{
    auto wanted = net::lowercase(name);
    for (auto const &[key, value] : headers)
    {
        if (net::lowercase(key) == wanted)
        {
            return value;
        }
    }
    return std::nullopt;
}

ClientResponse send_request(ClientRequest const &request)
{
    auto host = mg_url_host(request.url.c_str());
    std::string host_name(host.buf, host.len);
    auto port = mg_url_port(request.url.c_str());
    bool secure = mg_url_is_ssl(request.url.c_str()) != 0;

    auto host_header = request.host_header.empty()
                           ? net::format_host_port(host_name, port)
                           : request.host_header;
    ClientContext context(build_request(request, host_header),
                          net::strip_brackets(host_name), secure);

    mg_mgr mgr;
    mg_mgr_init(&mgr);
    struct mg_connection *conn =
        mg_http_connect(&mgr, request.url.c_str(), client_handler, &context);
    if (conn == nullptr)
    {
        mg_mgr_free(&mgr);
        throw std::runtime_error("failed to connect to " + request.url);
    }

    auto deadline = std::chrono::steady_clock::now() + request.timeout;
    while (context.future.wait_for(std::chrono::milliseconds(0)) ==
               std::future_status::timeout &&
           std::chrono::steady_clock::now() < deadline)
    {
        mg_mgr_poll(&mgr, 50);
    }

    if (!context.completed.load(std::memory_order_acquire))
    {
        context.signal_failure(std::make_exception_ptr(
            std::runtime_error("HTTP response timed out")));
    }

    mg_mgr_free(&mgr);
    context.future.get();
    return std::move(context.response);
}

} // namespace tbl::http
