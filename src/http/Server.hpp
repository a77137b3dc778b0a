#pragma once

#include "auth/Session.hpp"
#include "net/PortAllocator.hpp"
#include "utils/Shutdown.hpp"

#include <mongoose.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace tbl::http
{

struct TlsMaterial
{
    std::string cert_pem;
    std::string key_pem;
};

// Result of the /setup content fetch.
struct SetupOutcome
{
    bool ok = false;
    std::string error;
};
using SetupHandler = std::function<SetupOutcome(std::string const &git_url)>;

struct ServerOptions
{
    std::string bind_host = "127.0.0.1";
    std::uint16_t base_port = 1234;
    int max_port_attempts = net::kDefaultPortAttempts;
    std::optional<TlsMaterial> tls;
    std::filesystem::path web_root;
    std::chrono::milliseconds grace_period{3000};
    SetupHandler setup;
};

class Server
{
  public:
    Server(std::shared_ptr<auth::SessionGate const> gate,
           runtime::ShutdownSignal &shutdown, ServerOptions options);
    ~Server();

    Server(Server const &) = delete;
    Server &operator=(Server const &) = delete;

    // Binds the first free port from base_port and keeps the listener open.
    // Throws PortsExhausted. Must run before start().
    std::uint16_t bind();
    // Starts accepting connections on the worker thread.
    void start();
    // Stops accepting, lets open connections and /setup fetches finish for
    // the grace period, then drops whatever is left. Idempotent.
    void shutdown();

    std::uint16_t port() const noexcept { return port_; }
    bool secure() const noexcept { return options_.tls.has_value(); }
    bool running() const noexcept { return running_.load(); }

  private:
    using RequestId = std::uint64_t;

    void run_loop();
    static void handle_event(struct mg_connection *conn, int ev, void *ev_data);
    void handle_accept(struct mg_connection *conn);
    void handle_http_message(struct mg_connection *conn,
                             struct mg_http_message *hm);
    void handle_connection_closed(struct mg_connection *conn);

    void serve_index(struct mg_connection *conn);
    void serve_bootstrap(struct mg_connection *conn,
                         struct mg_http_message *hm);
    void serve_setup(struct mg_connection *conn, struct mg_http_message *hm);
    void serve_web(struct mg_connection *conn, struct mg_http_message *hm,
                   std::string_view uri);
    void serve_shutdown(struct mg_connection *conn);
    void finish_setup(RequestId req_id, SetupOutcome const &outcome);
    bool authorize(struct mg_connection *conn, struct mg_http_message *hm);
    bool host_allowed(struct mg_http_message *hm) const;

    void enqueue_task(std::function<void()> task);
    void process_pending_tasks();
    void prune_background();
    void count_open_connections();

    std::shared_ptr<auth::SessionGate const> gate_;
    runtime::ShutdownSignal &shutdown_;
    ServerOptions options_;
    std::string web_root_;
    mg_mgr mgr_;
    struct mg_connection *listener_ = nullptr;
    std::uint16_t port_ = 0;
    std::atomic_bool running_{false};
    std::atomic_bool stopped_{false};
    std::atomic_bool listener_closing_{false};
    std::atomic<std::size_t> open_connections_{0};
    std::thread worker_;

    struct ActiveRequest
    {
        struct mg_connection *conn = nullptr;
    };
    RequestId next_request_id_ = 1;
    std::unordered_map<RequestId, ActiveRequest> active_requests_;

    // Shared with /setup workers, which may finish after the server is gone.
    struct TaskQueue
    {
        std::mutex mtx;
        std::vector<std::function<void()>> tasks;
    };
    std::shared_ptr<TaskQueue> tasks_ = std::make_shared<TaskQueue>();
    std::vector<std::future<void>> background_;
};

} // namespace tbl::http
