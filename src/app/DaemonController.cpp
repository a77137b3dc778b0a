#include "app/DaemonController.hpp"

#include "app/Console.hpp"
#include "app/Content.hpp"
#include "app/Process.hpp"
#include "auth/Session.hpp"
#include "auth/Token.hpp"
#include "http/Server.hpp"
#include "net/Probe.hpp"
#include "state/RunState.hpp"
#include "state/SettingsStore.hpp"
#include "utils/Endpoint.hpp"
#include "utils/Errors.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <unistd.h>

namespace tbl::app
{
namespace
{

constexpr auto kWaitSlice = std::chrono::milliseconds(500);
constexpr char kSettingsFile[] = "settings.db";
constexpr char kProbeHost[] = "127.0.0.1";

void fetch_with_git(std::filesystem::path const &web_dir,
                    std::string const &url)
{
    ensure_git_available();
    ensure_content(web_dir, url);
}

// The live instance may have been started with a different --addr than this
// invocation, so loopback is always tried first. The configured host is only
// tried for instances bound to one specific non-loopback address.
std::optional<std::string> find_live_host(LaunchHooks const &hooks,
                                          std::string const &bind_host,
                                          std::uint16_t port)
{
    if (hooks.probe(kProbeHost, port))
    {
        return std::string(kProbeHost);
    }
    auto configured = net::link_host(bind_host);
    if (configured != kProbeHost && hooks.probe(configured, port))
    {
        return configured;
    }
    return std::nullopt;
}

} // namespace

char const *to_string(LaunchState state) noexcept
{
    switch (state)
    {
    case LaunchState::Probing:
        return "probing";
    case LaunchState::Attached:
        return "attached";
    case LaunchState::Daemonizing:
        return "daemonizing";
    case LaunchState::Serving:
        return "serving";
    case LaunchState::ShuttingDown:
        return "shutting-down";
    case LaunchState::Stopped:
        return "stopped";
    }
    return "unknown";
}

DaemonController::DaemonController(LaunchOptions options, LaunchHooks hooks)
    : options_(std::move(options)), hooks_(std::move(hooks))
{
    if (!hooks_.probe)
    {
        hooks_.probe = [](std::string const &host, std::uint16_t port)
        { return net::port_is_open(host, port); };
    }
    if (!hooks_.spawn)
    {
        hooks_.spawn = &spawn_detached;
    }
    if (!hooks_.surface_link)
    {
        hooks_.surface_link = &console::surface_link;
    }
    if (!hooks_.fetch_content)
    {
        hooks_.fetch_content = &fetch_with_git;
    }
}

void DaemonController::transition(LaunchState next)
{
    auto previous = state_.exchange(next);
    TBL_LOG_DEBUG("launch state {} -> {}", to_string(previous),
                  to_string(next));
}

int DaemonController::run()
{
    transition(LaunchState::Probing);
    if (attach_to_live_instance())
    {
        return 0;
    }
    transition(LaunchState::Daemonizing);
    if (!options_.daemonized)
    {
        return daemonize();
    }
    return serve();
}

bool DaemonController::attach_to_live_instance()
{
    state::RunStateStore store(utils::run_dir(options_.config_dir));
    auto record = store.read();
    if (!record)
    {
        return false;
    }
    auto const host =
        find_live_host(hooks_, options_.settings.bind_host, record->port);
    if (!host)
    {
        TBL_LOG_DEBUG("run record for pid {} on port {} is stale; clearing",
                      record->pid, record->port);
        if (!store.clear())
        {
            TBL_LOG_WARN("stale run record left at {}", store.file().string());
        }
        return false;
    }

    transition(LaunchState::Attached);
    TBL_LOG_INFO("attaching to running instance pid={} port={}", record->pid,
                 record->port);
    auto url = auth::bootstrap_link(record->tls, *host, record->port,
                                    record->auth_token);
    console::print_instance({"tbl is already running", {}, record->pid,
                             record->port, record->tls},
                            url);
    hooks_.surface_link(url, options_.settings.auto_open_browser);
    return true;
}

int DaemonController::daemonize()
{
    console::print_banner();
    auto pid = hooks_.spawn(options_.args);
    TBL_LOG_INFO("daemon launched as pid {}", pid);
    return 0;
}

int DaemonController::serve()
{
    auto const &config_dir = options_.config_dir;
    auto const run_dir = utils::run_dir(config_dir);
    auto const web_dir = utils::web_root(config_dir);
    if (!utils::ensure_directory(config_dir))
    {
        throw LaunchError("failed to create config dir " + config_dir.string());
    }

    auto settings = options_.settings;
    if (settings.git_url)
    {
        hooks_.fetch_content(web_dir, *settings.git_url);
    }

    auto token = auth::generate_token();
    auto gate = std::make_shared<auth::SessionGate const>(
        token, settings.static_credential());

    http::ServerOptions server_options;
    server_options.bind_host = settings.bind_host;
    server_options.base_port = settings.base_port;
    server_options.tls = load_tls_material(settings);
    server_options.web_root = web_dir;
    server_options.grace_period = options_.grace_period;
    server_options.setup =
        [web_dir, db_path = config_dir / kSettingsFile,
         fetch = hooks_.fetch_content](std::string const &url)
    {
        http::SetupOutcome outcome;
        fetch(web_dir, url);
        storage::Database db(db_path);
        if (!db.set_setting("git_url", url))
        {
            TBL_LOG_WARN("failed to save git_url to {}", db_path.string());
        }
        outcome.ok = true;
        return outcome;
    };

    runtime::install_signal_handlers();
    http::Server server(gate, shutdown_, std::move(server_options));
    auto const port = server.bind();

    settings.base_port = port;
    {
        storage::Database db(config_dir / kSettingsFile);
        if (!save_settings(db, settings))
        {
            TBL_LOG_WARN("failed to save settings to {}", db.path().string());
        }
    }

    state::RunStateStore store(run_dir);
    state::RunRecord record;
    record.pid = static_cast<std::int64_t>(::getpid());
    record.port = port;
    record.auth_token = token;
    record.tls = server.secure();
    store.write(record);

    server.start();
    transition(LaunchState::Serving);

    auto const link_host = net::link_host(settings.bind_host);
    auto url = auth::bootstrap_link(record.tls, link_host, port, token);
    console::print_instance(
        {"Starting tbl server...",
         net::format_url(record.tls, settings.bind_host, port), record.pid,
         port, record.tls},
        url);
    hooks_.surface_link(url, settings.auto_open_browser);
    if (hooks_.on_serving)
    {
        hooks_.on_serving(record);
    }

    while (!shutdown_.wait_for(kWaitSlice))
    {
    }
    log::print_status("  Shutdown signal received, stopping server...");
    transition(LaunchState::ShuttingDown);
    server.shutdown();
    if (!store.clear_if_owned(record.pid))
    {
        TBL_LOG_WARN("run record left at {}; the next launch will probe it",
                     store.file().string());
    }
    transition(LaunchState::Stopped);
    log::print_status("  tbl server stopped.");
    TBL_LOG_INFO("tbl server stopped");
    return 0;
}

} // namespace tbl::app
