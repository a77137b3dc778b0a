#include "utils/Shutdown.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>

namespace tbl::runtime {

namespace {
std::atomic_bool g_shutdown_requested{false};
} // namespace

void request_shutdown() noexcept {
  g_shutdown_requested.store(true, std::memory_order_relaxed);
}

bool should_shutdown() noexcept {
  return g_shutdown_requested.load(std::memory_order_relaxed);
}

void install_signal_handlers() {
  std::signal(SIGINT, [](int) { request_shutdown(); });
  std::signal(SIGTERM, [](int) { request_shutdown(); });
}

bool ShutdownSignal::request() noexcept {
  bool first = false;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    first = !requested_.exchange(true, std::memory_order_acq_rel);
  }
  cv_.notify_all();
  return first;
}

bool ShutdownSignal::requested() const noexcept {
  return requested_.load(std::memory_order_acquire);
}

bool ShutdownSignal::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mtx_);
  // Process signals cannot notify the condition variable, so they are
  // observed on a coarse tick instead.
  constexpr auto kSignalTick = std::chrono::milliseconds(200);
  auto const deadline = std::chrono::steady_clock::now() + timeout;
  while (!requested_.load(std::memory_order_acquire) && !should_shutdown()) {
    auto const now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    auto const slice = std::min<std::chrono::steady_clock::duration>(
        deadline - now, kSignalTick);
    cv_.wait_for(lock, slice);
  }
  return true;
}

} // namespace tbl::runtime
