#include "HttpTestUtils.hpp"
#include "app/StopCommand.hpp"
#include "auth/Token.hpp"
#include "state/RunState.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include <doctest/doctest.h>

using tbl::app::StopResult;

namespace
{

tbl::state::RunRecord live_record()
{
    tbl::state::RunRecord record;
    record.pid = 31337;
    record.port = 1234;
    record.auth_token = tbl::auth::generate_token();
    return record;
}

tbl::app::StopOptions fast_options(std::filesystem::path const &dir)
{
    tbl::app::StopOptions options;
    options.config_dir = dir;
    options.poll_interval = std::chrono::milliseconds(1);
    options.max_polls = 5;
    options.process_alive = [](std::int64_t) { return false; };
    return options;
}

} // namespace

TEST_CASE("stop reports when nothing is running")
{
    tbl::tests::TempDir dir("stop-none");
    auto options = fast_options(dir.path());
    bool sent = false;
    options.send_stop = [&](tbl::state::RunRecord const &) { sent = true; };
    auto report = tbl::app::stop_running_instance(options);
    CHECK(report.result == StopResult::NotRunning);
    CHECK_FALSE(sent);
    CHECK(tbl::app::report_stop_result(report) == 0);
}

TEST_CASE("stop cleans up a stale record without sending anything")
{
    tbl::tests::TempDir dir("stop-stale");
    tbl::state::RunStateStore store(dir.path() / "run");
    store.write(live_record());

    auto options = fast_options(dir.path());
    bool sent = false;
    options.probe = [](std::uint16_t) { return false; };
    options.send_stop = [&](tbl::state::RunRecord const &) { sent = true; };
    auto report = tbl::app::stop_running_instance(options);
    CHECK(report.result == StopResult::StaleCleaned);
    CHECK_FALSE(sent);
    CHECK_FALSE(store.read());
}

TEST_CASE("stop sends the token from the record and waits for the port")
{
    tbl::tests::TempDir dir("stop-ok");
    tbl::state::RunStateStore store(dir.path() / "run");
    auto record = live_record();
    store.write(record);

    auto options = fast_options(dir.path());
    bool stopped = false;
    int probes_after_stop = 0;
    options.probe = [&](std::uint16_t port)
    {
        CHECK(port == record.port);
        if (!stopped)
        {
            return true;
        }
        return ++probes_after_stop < 3;
    };
    options.send_stop = [&](tbl::state::RunRecord const &sent)
    {
        CHECK(sent.auth_token == record.auth_token);
        stopped = true;
    };
    auto report = tbl::app::stop_running_instance(options);
    CHECK(report.result == StopResult::Stopped);
    CHECK(report.pid == record.pid);
    CHECK(probes_after_stop == 3);
}

TEST_CASE("stop reports a timeout when the port stays open")
{
    tbl::tests::TempDir dir("stop-timeout");
    tbl::state::RunStateStore store(dir.path() / "run");
    store.write(live_record());

    auto options = fast_options(dir.path());
    int probes = 0;
    options.probe = [&](std::uint16_t)
    {
        ++probes;
        return true;
    };
    options.send_stop = [](tbl::state::RunRecord const &) {};
    auto report = tbl::app::stop_running_instance(options);
    CHECK(report.result == StopResult::TimedOut);
    CHECK(probes == 1 + options.max_polls);
    CHECK(tbl::app::report_stop_result(report) == 0);
    // A timeout is not treated as a crash; the record stays for the daemon.
    CHECK(store.read());
}

TEST_CASE("stop surfaces a failed request with the pid")
{
    tbl::tests::TempDir dir("stop-failed");
    tbl::state::RunStateStore store(dir.path() / "run");
    auto record = live_record();
    store.write(record);

    auto options = fast_options(dir.path());
    options.probe = [](std::uint16_t) { return true; };
    options.send_stop = [](tbl::state::RunRecord const &)
    { throw std::runtime_error("unexpected response: HTTP 401"); };
    auto report = tbl::app::stop_running_instance(options);
    CHECK(report.result == StopResult::SendFailed);
    CHECK(report.pid == record.pid);
    CHECK(report.error.find("401") != std::string::npos);
    CHECK(tbl::app::report_stop_result(report) == 1);
}

TEST_CASE("stop waits for the daemon to release its record")
{
    tbl::tests::TempDir dir("stop-release");
    tbl::state::RunStateStore store(dir.path() / "run");
    auto record = live_record();
    store.write(record);

    auto options = fast_options(dir.path());
    bool sent = false;
    int polls_after_stop = 0;
    options.probe = [&](std::uint16_t) { return !sent; };
    options.process_alive = [&](std::int64_t pid)
    {
        CHECK(pid == record.pid);
        // The listener is gone but the daemon is still draining; it clears
        // the record on the third poll.
        if (++polls_after_stop == 3)
        {
            CHECK(store.clear());
        }
        return true;
    };
    options.send_stop = [&](tbl::state::RunRecord const &) { sent = true; };

    auto report = tbl::app::stop_running_instance(options);
    CHECK(report.result == StopResult::Stopped);
    CHECK(polls_after_stop == 3);
}

TEST_CASE("stop times out while a live daemon still owns the record")
{
    tbl::tests::TempDir dir("stop-draining");
    tbl::state::RunStateStore store(dir.path() / "run");
    store.write(live_record());

    auto options = fast_options(dir.path());
    bool sent = false;
    options.probe = [&](std::uint16_t) { return !sent; };
    options.process_alive = [](std::int64_t) { return true; };
    options.send_stop = [&](tbl::state::RunRecord const &) { sent = true; };

    auto report = tbl::app::stop_running_instance(options);
    CHECK(report.result == StopResult::TimedOut);
    CHECK(store.read());
}
