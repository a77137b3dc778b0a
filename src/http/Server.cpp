#include "http/Server.hpp"

#include "http/Pages.hpp"
#include "http/Serializer.hpp"
#include "utils/Endpoint.hpp"
#include "utils/Errors.hpp"
#include "utils/Log.hpp"

#include <mongoose.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <exception>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace
{

constexpr std::string_view kPingPath = "/api/v1/ping";
constexpr std::string_view kShutdownPath = "/api/v1/shutdown";
constexpr std::string_view kSetupPath = "/setup";
constexpr std::string_view kScriptPath = "/tbl.js";
constexpr std::string_view kWebPrefix = "/web";
constexpr std::size_t kMaxFormFieldSize = 2048;
constexpr auto kLoopPollMs = 50;
constexpr auto kDrainTick = std::chrono::milliseconds(20);

std::optional<std::string_view> header_view(struct mg_http_message *hm,
                                            char const *name)
{
    if (hm == nullptr)
    {
        return std::nullopt;
    }
    auto *header = mg_http_get_header(hm, name);
    if (header == nullptr)
    {
        return std::nullopt;
    }
    return std::string_view(header->buf, header->len);
}

std::string canonicalize_host(std::string_view host)
{
    auto start = host.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos)
    {
        return {};
    }
    auto end = host.find_last_not_of(" \t\r\n");
    host = host.substr(start, end - start + 1);
    if (host.front() == '[')
    {
        auto closing = host.find(']');
        if (closing != std::string_view::npos)
        {
            return tbl::net::lowercase(std::string(host.substr(0, closing + 1)));
        }
        return tbl::net::lowercase(std::string(host));
    }
    auto colon = host.rfind(':');
    if (colon != std::string_view::npos && host.find(':') == colon)
    {
        host = host.substr(0, colon);
    }
    return tbl::net::lowercase(std::string(host));
}

bool path_is_safe(std::string_view path)
{
    if (path.empty() || path.front() != '/')
    {
        return false;
    }
    return path.find("..") == std::string_view::npos;
}

std::string trim_copy(std::string_view value)
{
    auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos)
    {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(start, end - start + 1));
}

void reply_text(struct mg_connection *conn, int code, std::string_view body,
                std::string const &extra_headers = {})
{
    std::string headers = "Content-Type: text/plain; charset=utf-8\r\n"
                          "Cache-Control: no-store\r\n" +
                          extra_headers;
    mg_http_reply(conn, code, headers.c_str(), "%.*s",
                  static_cast<int>(body.size()), body.data());
}

void reply_json(struct mg_connection *conn, int code, std::string const &body)
{
    mg_http_reply(conn, code,
                  "Content-Type: application/json\r\n"
                  "Cache-Control: no-store\r\n",
                  "%s", body.c_str());
}

void reply_html(struct mg_connection *conn, int code, std::string const &body,
                std::string const &extra_headers = {})
{
    std::string headers = "Content-Type: text/html; charset=utf-8\r\n"
                          "Cache-Control: no-store\r\n" +
                          extra_headers;
    mg_http_reply(conn, code, headers.c_str(), "%s", body.c_str());
}

void reply_method_not_allowed(struct mg_connection *conn, char const *allow)
{
    reply_text(conn, 405, "method not allowed",
               std::string("Allow: ") + allow + "\r\n");
}

} // namespace

namespace tbl::http
{

Server::Server(std::shared_ptr<auth::SessionGate const> gate,
               runtime::ShutdownSignal &shutdown, ServerOptions options)
    : gate_(std::move(gate)), shutdown_(shutdown),
      options_(std::move(options)), web_root_(options_.web_root.string())
{
    mg_mgr_init(&mgr_);
    mgr_.userdata = this;
}

Server::~Server()
{
    shutdown();
    mg_mgr_free(&mgr_);
}

std::uint16_t Server::bind()
{
    if (listener_ != nullptr)
    {
        return port_;
    }
    port_ = net::allocate_port(
        options_.base_port, options_.max_port_attempts,
        [this](std::uint16_t candidate)
        {
            auto url = net::format_url(secure(), options_.bind_host, candidate);
            listener_ =
                mg_http_listen(&mgr_, url.c_str(), &Server::handle_event, this);
            return listener_ != nullptr;
        });
    TBL_LOG_INFO("HTTP listener bound to {}",
                 net::format_url(secure(), options_.bind_host, port_));
    return port_;
}

void Server::start()
{
    if (listener_ == nullptr)
    {
        throw LaunchError("HTTP server started before a port was bound");
    }
    if (running_.exchange(true))
    {
        return;
    }
    worker_ = std::thread(&Server::run_loop, this);
    TBL_LOG_INFO("HTTP worker thread started");
}

void Server::shutdown()
{
    if (stopped_.exchange(true))
    {
        return;
    }
    auto const deadline =
        std::chrono::steady_clock::now() + options_.grace_period;
    if (running_.load())
    {
        enqueue_task(
            [this]
            {
                if (listener_ != nullptr)
                {
                    listener_->is_closing = 1;
                    listener_ = nullptr;
                }
                listener_closing_.store(true);
            });
        TBL_LOG_INFO("HTTP listener closing; grace period {} ms",
                     options_.grace_period.count());
        while (std::chrono::steady_clock::now() < deadline && running_.load())
        {
            if (listener_closing_.load() && open_connections_.load() == 0)
            {
                break;
            }
            std::this_thread::sleep_for(kDrainTick);
        }
        if (auto remaining = open_connections_.load(); remaining > 0)
        {
            TBL_LOG_WARN("dropping {} connection(s) after grace period",
                         remaining);
        }
        running_.store(false);
    }
    if (worker_.joinable())
    {
        worker_.join();
    }
    std::size_t abandoned = 0;
    for (auto &task : background_)
    {
        if (task.valid() &&
            task.wait_until(deadline) != std::future_status::ready)
        {
            ++abandoned;
        }
    }
    if (abandoned > 0)
    {
        TBL_LOG_WARN("abandoning {} setup fetch(es) still in progress",
                     abandoned);
    }
    background_.clear();
    TBL_LOG_INFO("HTTP server stopped");
}

void Server::run_loop()
{
    try
    {
        while (running_.load(std::memory_order_relaxed))
        {
            mg_mgr_poll(&mgr_, kLoopPollMs);
            process_pending_tasks();
            count_open_connections();
        }
    }
    catch (std::exception const &ex)
    {
        TBL_LOG_ERROR("HTTP worker exception: {}", ex.what());
        shutdown_.request();
    }
    running_.store(false, std::memory_order_relaxed);
}

void Server::count_open_connections()
{
    std::size_t count = 0;
    for (auto *conn = mgr_.conns; conn != nullptr; conn = conn->next)
    {
        if (conn->is_accepted)
        {
            ++count;
        }
    }
    open_connections_.store(count);
}

void Server::enqueue_task(std::function<void()> task)
{
    std::lock_guard<std::mutex> lock(tasks_->mtx);
    tasks_->tasks.push_back(std::move(task));
}

void Server::process_pending_tasks()
{
    std::vector<std::function<void()>> tasks;
    {
        std::lock_guard<std::mutex> lock(tasks_->mtx);
        tasks.swap(tasks_->tasks);
    }
    for (auto &task : tasks)
    {
        task();
    }
    prune_background();
}

void Server::prune_background()
{
    std::erase_if(background_,
                  [](std::future<void> const &task)
                  {
                      return !task.valid() ||
                             task.wait_for(std::chrono::seconds(0)) ==
                                 std::future_status::ready;
                  });
}

void Server::handle_event(struct mg_connection *conn, int ev, void *ev_data)
{
    if (conn == nullptr)
    {
        return;
    }
    auto *self = static_cast<Server *>(conn->fn_data);
    if (self == nullptr)
    {
        return;
    }
    switch (ev)
    {
    case MG_EV_ACCEPT:
        self->handle_accept(conn);
        break;
    case MG_EV_HTTP_MSG:
        self->handle_http_message(
            conn, static_cast<struct mg_http_message *>(ev_data));
        break;
    case MG_EV_CLOSE:
        self->handle_connection_closed(conn);
        break;
    default:
        break;
    }
}

void Server::handle_accept(struct mg_connection *conn)
{
    if (!options_.tls)
    {
        return;
    }
    struct mg_tls_opts opts;
    std::memset(&opts, 0, sizeof(opts));
    opts.cert = mg_str_n(options_.tls->cert_pem.data(),
                         options_.tls->cert_pem.size());
    opts.key =
        mg_str_n(options_.tls->key_pem.data(), options_.tls->key_pem.size());
    mg_tls_init(conn, &opts);
}

void Server::handle_connection_closed(struct mg_connection *conn)
{
    for (auto it = active_requests_.begin(); it != active_requests_.end();)
    {
        if (it->second.conn == conn)
        {
            it = active_requests_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

bool Server::host_allowed(struct mg_http_message *hm) const
{
    // Loopback binds only answer to loopback Host headers, which keeps DNS
    // rebinding pages from reaching the API.
    if (!net::is_loopback_host(options_.bind_host))
    {
        return true;
    }
    auto host = header_view(hm, "Host");
    if (!host)
    {
        return false;
    }
    auto canonical = canonicalize_host(*host);
    return !canonical.empty() && net::is_loopback_host(canonical);
}

void Server::handle_http_message(struct mg_connection *conn,
                                 struct mg_http_message *hm)
{
    if (conn == nullptr || hm == nullptr)
    {
        return;
    }
    std::string_view uri(hm->uri.buf, hm->uri.len);
    std::string_view method(hm->method.buf, hm->method.len);
    TBL_LOG_DEBUG("HTTP request {} {}", method, uri);

    if (!host_allowed(hm))
    {
        auto host = header_view(hm, "Host");
        TBL_LOG_INFO("HTTP request rejected; unsupported host header {}",
                     host ? std::string(*host) : std::string("<missing>"));
        reply_text(conn, 403, "forbidden");
        return;
    }

    bool const is_get = method == "GET" || method == "HEAD";
    if (uri == "/")
    {
        if (!is_get)
        {
            reply_method_not_allowed(conn, "GET, HEAD");
            return;
        }
        serve_index(conn);
        return;
    }
    if (uri == auth::kBootstrapPath)
    {
        if (!is_get)
        {
            reply_method_not_allowed(conn, "GET, HEAD");
            return;
        }
        serve_bootstrap(conn, hm);
        return;
    }
    if (uri == kSetupPath)
    {
        if (method != "POST")
        {
            reply_method_not_allowed(conn, "POST");
            return;
        }
        serve_setup(conn, hm);
        return;
    }
    if (uri == kPingPath)
    {
        if (!is_get)
        {
            reply_method_not_allowed(conn, "GET, HEAD");
            return;
        }
        if (authorize(conn, hm))
        {
            reply_json(conn, 200, serialize_status("ok"));
        }
        return;
    }
    if (uri == kShutdownPath)
    {
        if (method != "POST")
        {
            reply_method_not_allowed(conn, "POST");
            return;
        }
        if (authorize(conn, hm))
        {
            serve_shutdown(conn);
        }
        return;
    }
    if (uri == kScriptPath)
    {
        if (!is_get)
        {
            reply_method_not_allowed(conn, "GET, HEAD");
            return;
        }
        auto script = pages::client_script();
        mg_http_reply(conn, 200,
                      "Content-Type: application/javascript; charset=utf-8\r\n",
                      "%.*s", static_cast<int>(script.size()), script.data());
        return;
    }
    if (uri == kWebPrefix ||
        (uri.starts_with(kWebPrefix) && uri[kWebPrefix.size()] == '/'))
    {
        if (!is_get)
        {
            reply_method_not_allowed(conn, "GET, HEAD");
            return;
        }
        serve_web(conn, hm, uri);
        return;
    }
    reply_text(conn, 404, "not found");
}

bool Server::authorize(struct mg_connection *conn, struct mg_http_message *hm)
{
    auto failure =
        gate_->authorize(header_view(hm, "Cookie"),
                         header_view(hm, "Authorization"));
    if (!failure)
    {
        return true;
    }
    TBL_LOG_INFO("protected request rejected: {}", auth::describe(*failure));
    if (*failure == auth::AuthFailure::BasicAuthRequired)
    {
        reply_text(conn, 401, "basic auth required",
                   std::string("WWW-Authenticate: Basic realm=\"") +
                       auth::kBasicRealm + "\"\r\n");
        return false;
    }
    reply_text(conn, 401, "missing or invalid auth cookie");
    return false;
}

void Server::serve_index(struct mg_connection *conn)
{
    std::error_code ec;
    if (!web_root_.empty() &&
        std::filesystem::exists(options_.web_root / "index.html", ec))
    {
        mg_http_reply(conn, 307, "Location: /web/\r\nCache-Control: no-store\r\n",
                      "");
        return;
    }
    reply_html(conn, 200, pages::setup_page());
}

void Server::serve_bootstrap(struct mg_connection *conn,
                             struct mg_http_message *hm)
{
    // Only an absent parameter is missing; empty, oversized or badly encoded
    // values are presented and fail the comparison.
    std::optional<std::string> presented;
    auto raw = mg_http_var(hm->query, mg_str("token"));
    if (raw.buf != nullptr)
    {
        std::string decoded(raw.len + 1, '\0');
        int len = mg_url_decode(raw.buf, raw.len, decoded.data(), decoded.size(),
                                1);
        if (len >= 0)
        {
            decoded.resize(static_cast<std::size_t>(len));
            presented = std::move(decoded);
        }
        else
        {
            presented = std::string(raw.buf, raw.len);
        }
    }
    auto failure = gate_->redeem(presented);
    if (failure == auth::AuthFailure::MissingCredential)
    {
        reply_text(conn, 400, "missing token in query");
        return;
    }
    if (failure)
    {
        TBL_LOG_INFO("bootstrap rejected: {}", auth::describe(*failure));
        reply_text(conn, 403, "invalid bootstrap token");
        return;
    }
    TBL_LOG_INFO("bootstrap link redeemed; issuing session cookie");
    reply_html(conn, 200, pages::bootstrap_page(gate_->token()),
               "Set-Cookie: " + auth::session_cookie(gate_->token()) + "\r\n");
}

void Server::serve_setup(struct mg_connection *conn,
                         struct mg_http_message *hm)
{
    char buffer[kMaxFormFieldSize] = {};
    int len = mg_http_get_var(&hm->body, "git_url", buffer, sizeof(buffer));
    std::string url = len > 0 ? trim_copy(std::string_view(
                                    buffer, static_cast<std::size_t>(len)))
                              : std::string();
    if (url.empty())
    {
        reply_html(conn, 400, "<h1>Missing git URL</h1>");
        return;
    }
    if (!options_.setup)
    {
        reply_html(conn, 503,
                   pages::setup_error_page("Setup unavailable",
                                           "no content fetcher configured"));
        return;
    }

    // Fetching content can take a while; keep the event loop responsive and
    // answer from the loop thread once the fetch finishes.
    auto req_id = next_request_id_++;
    active_requests_[req_id] = {conn};
    // The worker only touches the shared queue, so it may outlive the server
    // when shutdown gives up on it.
    std::packaged_task<void()> job(
        [queue = tasks_, self = this, req_id, url = std::move(url),
         handler = options_.setup]
        {
            SetupOutcome outcome;
            try
            {
                outcome = handler(url);
            }
            catch (std::exception const &ex)
            {
                outcome.ok = false;
                outcome.error = ex.what();
            }
            std::lock_guard<std::mutex> lock(queue->mtx);
            queue->tasks.push_back(
                [self, req_id, outcome = std::move(outcome)]
                { self->finish_setup(req_id, outcome); });
        });
    background_.push_back(job.get_future());
    std::thread(std::move(job)).detach();
}

void Server::finish_setup(RequestId req_id, SetupOutcome const &outcome)
{
    auto it = active_requests_.find(req_id);
    if (it == active_requests_.end())
    {
        return;
    }
    auto *conn = it->second.conn;
    active_requests_.erase(it);
    if (outcome.ok)
    {
        mg_http_reply(conn, 303, "Location: /\r\nCache-Control: no-store\r\n",
                      "");
        return;
    }
    TBL_LOG_WARN("setup failed: {}", outcome.error);
    reply_html(conn, 500,
               pages::setup_error_page("Failed to fetch content",
                                       outcome.error));
}

void Server::serve_web(struct mg_connection *conn, struct mg_http_message *hm,
                       std::string_view uri)
{
    if (uri == kWebPrefix)
    {
        mg_http_reply(conn, 301, "Location: /web/\r\n", "");
        return;
    }
    auto relative = uri.substr(kWebPrefix.size());
    if (!path_is_safe(relative))
    {
        reply_text(conn, 400, "bad request");
        return;
    }
    std::error_code ec;
    if (web_root_.empty() || !std::filesystem::is_directory(options_.web_root, ec))
    {
        reply_text(conn, 404, "not found");
        return;
    }
    struct mg_http_message local = *hm;
    local.uri = mg_str_n(relative.data(), relative.size());
    struct mg_http_serve_opts opts;
    std::memset(&opts, 0, sizeof(opts));
    opts.root_dir = web_root_.c_str();
    opts.extra_headers = "Cache-Control: no-cache\r\n";
    mg_http_serve_dir(conn, &local, &opts);
}

void Server::serve_shutdown(struct mg_connection *conn)
{
    reply_json(conn, 200, serialize_status("shutting_down"));
    // Close once the acknowledgment is flushed.
    conn->is_draining = 1;
    if (shutdown_.request())
    {
        TBL_LOG_INFO("shutdown requested over HTTP");
    }
    else
    {
        TBL_LOG_DEBUG("shutdown already in progress");
    }
}

} // namespace tbl::http
