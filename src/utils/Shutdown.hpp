#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tbl::runtime
{

// Async-signal-safe flag for SIGINT/SIGTERM handlers.
void request_shutdown() noexcept;
bool should_shutdown() noexcept;
void install_signal_handlers();

// One-shot shutdown signal shared by the stop endpoint and the daemon's
// main loop. request() is idempotent; only the first call returns true.
class ShutdownSignal
{
  public:
    ShutdownSignal() = default;
    ShutdownSignal(ShutdownSignal const &) = delete;
    ShutdownSignal &operator=(ShutdownSignal const &) = delete;

    bool request() noexcept;
    bool requested() const noexcept;

    // Returns true when the signal (or a process signal) fired before the
    // timeout elapsed.
    bool wait_for(std::chrono::milliseconds timeout);

  private:
    std::atomic_bool requested_{false};
    mutable std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace tbl::runtime
