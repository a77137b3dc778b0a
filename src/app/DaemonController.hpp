#pragma once

#include "app/Config.hpp"
#include "utils/Shutdown.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace tbl::state
{
struct RunRecord;
}

namespace tbl::app
{

enum class LaunchState
{
    Probing,
    Attached,
    Daemonizing,
    Serving,
    ShuttingDown,
    Stopped,
};

char const *to_string(LaunchState state) noexcept;

// Side effects the controller delegates. Empty members fall back to the
// real implementations (TCP probe, posix_spawn, console/browser, git).
struct LaunchHooks
{
    std::function<bool(std::string const &host, std::uint16_t port)> probe;
    std::function<long(std::vector<std::string> const &args)> spawn;
    std::function<void(std::string const &url, bool open_browser)>
        surface_link;
    std::function<void(std::filesystem::path const &web_dir,
                       std::string const &url)>
        fetch_content;
    // Called once the server accepts connections.
    std::function<void(state::RunRecord const &record)> on_serving;
};

struct LaunchOptions
{
    std::filesystem::path config_dir;
    Settings settings;
    // Arguments forwarded to the detached child, without argv[0].
    std::vector<std::string> args;
    bool daemonized = false;
    std::chrono::milliseconds grace_period{3000};
};

// Attach-or-spawn orchestration for one invocation. Owns the RunRecord and
// the session token for the lifetime of its server.
class DaemonController
{
  public:
    explicit DaemonController(LaunchOptions options, LaunchHooks hooks = {});

    DaemonController(DaemonController const &) = delete;
    DaemonController &operator=(DaemonController const &) = delete;

    // Runs to completion and returns the process exit code. Startup failures
    // propagate as LaunchError.
    int run();

    LaunchState state() const noexcept { return state_.load(); }
    // Same signal the stop endpoint raises.
    runtime::ShutdownSignal &shutdown_signal() noexcept { return shutdown_; }

  private:
    bool attach_to_live_instance();
    int daemonize();
    int serve();
    void transition(LaunchState next);

    LaunchOptions options_;
    LaunchHooks hooks_;
    runtime::ShutdownSignal shutdown_;
    std::atomic<LaunchState> state_{LaunchState::Probing};
};

} // namespace tbl::app
