#include "app/StopCommand.hpp"

#include "auth/Session.hpp"
#include "http/Client.hpp"
#include "net/Probe.hpp"
#include "state/RunState.hpp"
#include "utils/Endpoint.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <cerrno>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include <signal.h>
#include <sys/types.h>

namespace tbl::app
{
namespace
{

constexpr char kStopHost[] = "127.0.0.1";
constexpr char kShutdownPath[] = "/api/v1/shutdown";

bool process_exists(std::int64_t pid)
{
    if (::kill(static_cast<pid_t>(pid), 0) == 0)
    {
        return true;
    }
    return errno == EPERM;
}

// The daemon clears its record as the last step of shutdown; until then a
// relaunch could race with its cleanup.
bool record_released(state::RunStateStore const &store, std::int64_t pid)
{
    auto current = store.read();
    return !current || current->pid != pid;
}

} // namespace

void send_shutdown_request(state::RunRecord const &record)
{
    http::ClientRequest request;
    request.method = "POST";
    request.url = net::format_url(record.tls, kStopHost, record.port) +
                  kShutdownPath;
    request.headers.push_back(std::string("Cookie: ") + auth::kCookieName +
                              "=" + record.auth_token);
    auto response = http::send_request(request);
    if (response.status == 200 ||
        response.body.find("shutting_down") != std::string::npos)
    {
        return;
    }
    throw std::runtime_error("unexpected response: HTTP " +
                             std::to_string(response.status));
}

StopReport stop_running_instance(StopOptions options)
{
    if (!options.probe)
    {
        options.probe = [](std::uint16_t port)
        { return net::port_is_open(kStopHost, port); };
    }
    if (!options.send_stop)
    {
        options.send_stop = &send_shutdown_request;
    }
    if (!options.process_alive)
    {
        options.process_alive = &process_exists;
    }

    StopReport report;
    state::RunStateStore store(utils::run_dir(options.config_dir));
    auto record = store.read();
    if (!record)
    {
        report.result = StopResult::NotRunning;
        return report;
    }
    report.pid = record->pid;
    report.port = record->port;

    if (!options.probe(record->port))
    {
        if (!store.clear())
        {
            TBL_LOG_WARN("stale run record left at {}", store.file().string());
        }
        report.result = StopResult::StaleCleaned;
        return report;
    }

    log::print_status("");
    log::print_status("  Stopping tbl server...");
    log::print_status("  ───────────────────────────────────────");
    log::print_status("  PID:  {}", record->pid);
    log::print_status("  Port: {}", record->port);
    log::print_status("");

    try
    {
        options.send_stop(*record);
    }
    catch (std::exception const &ex)
    {
        TBL_LOG_WARN("shutdown request to port {} failed: {}", record->port,
                     ex.what());
        report.result = StopResult::SendFailed;
        report.error = ex.what();
        return report;
    }

    for (int attempt = 0; attempt < options.max_polls; ++attempt)
    {
        std::this_thread::sleep_for(options.poll_interval);
        if (options.probe(record->port))
        {
            continue;
        }
        if (!options.process_alive(record->pid) ||
            record_released(store, record->pid))
        {
            report.result = StopResult::Stopped;
            return report;
        }
    }
    report.result = StopResult::TimedOut;
    return report;
}

int report_stop_result(StopReport const &report)
{
    switch (report.result)
    {
    case StopResult::NotRunning:
        log::print_status("\n  No tbl server is currently running.\n");
        return 0;
    case StopResult::StaleCleaned:
        log::print_status("\n  No tbl server is currently running (stale pid "
                          "file cleaned up).\n");
        return 0;
    case StopResult::Stopped:
        log::print_status("  Server stopped successfully.\n");
        return 0;
    case StopResult::TimedOut:
        log::print_status("  Server may still be shutting down.\n");
        return 0;
    case StopResult::SendFailed:
        log::print_error("  Failed to send shutdown request: {}", report.error);
        log::print_error("  You may need to kill the process manually (PID: "
                         "{}).",
                         report.pid);
        return 1;
    }
    return 1;
}

} // namespace tbl::app
