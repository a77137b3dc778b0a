#pragma once

#include <cstdint>
#include <functional>

namespace tbl::net
{

inline constexpr int kDefaultPortAttempts = 100;

// Tries to bind `port`; returns true when the caller now holds a bound
// listener on it. The allocator never releases what the attempt bound.
using BindAttempt = std::function<bool(std::uint16_t port)>;

// Walks base_port, base_port + 1, ... until `try_bind` succeeds, for at most
// max_attempts ports and never past 65535. Throws PortsExhausted.
std::uint16_t allocate_port(std::uint16_t base_port, int max_attempts,
                            BindAttempt const &try_bind);

} // namespace tbl::net
