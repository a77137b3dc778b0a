#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tbl::net
{

inline constexpr std::chrono::milliseconds kLivenessProbeTimeout{1000};

// TCP connect within `timeout`. Success means something accepts on the
// port; it does not prove the listener is a tbl instance.
bool port_is_open(std::string const &host, std::uint16_t port,
                  std::chrono::milliseconds timeout = kLivenessProbeTimeout);

} // namespace tbl::net
