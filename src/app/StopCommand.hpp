#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace tbl::state
{
struct RunRecord;
}

namespace tbl::app
{

enum class StopResult
{
    NotRunning,
    StaleCleaned,
    Stopped,
    TimedOut,
    SendFailed,
};

struct StopReport
{
    StopResult result = StopResult::NotRunning;
    std::int64_t pid = 0;
    std::uint16_t port = 0;
    std::string error;
};

struct StopOptions
{
    std::filesystem::path config_dir;
    std::chrono::milliseconds poll_interval{100};
    int max_polls = 50;
    // Defaults to the TCP liveness probe against 127.0.0.1.
    std::function<bool(std::uint16_t port)> probe;
    // Defaults to kill(pid, 0).
    std::function<bool(std::int64_t pid)> process_alive;
    // Defaults to send_shutdown_request(). Throws when the request was not
    // acknowledged.
    std::function<void(state::RunRecord const &record)> send_stop;
};

// Authenticated POST /api/v1/shutdown against 127.0.0.1, http or https per
// the record. Throws std::runtime_error on transport failure or an
// unexpected reply.
void send_shutdown_request(state::RunRecord const &record);

// Client side of the stop protocol: read the RunRecord, confirm the port is
// live, send the stop request, then wait for the port to close and for the
// daemon to exit or release its RunRecord.
StopReport stop_running_instance(StopOptions options);

// Prints the operator message for the report; returns the exit code.
int report_stop_result(StopReport const &report);

} // namespace tbl::app
