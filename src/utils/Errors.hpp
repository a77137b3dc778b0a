#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tbl
{

// Startup failures. main() reports what() and exits non-zero.
class LaunchError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// Runtime state file could not be written.
class PersistenceError : public LaunchError
{
  public:
    using LaunchError::LaunchError;
};

class PortsExhausted : public LaunchError
{
  public:
    PortsExhausted(std::uint16_t base_port, int attempts)
        : LaunchError("no bindable port in " + std::to_string(base_port) +
                      ".." +
                      std::to_string(static_cast<int>(base_port) + attempts -
                                     1) +
                      "; free a port or choose another base with --addr"),
          base_port_(base_port), attempts_(attempts)
    {
    }

    std::uint16_t base_port() const noexcept { return base_port_; }
    int attempts() const noexcept { return attempts_; }

  private:
    std::uint16_t base_port_;
    int attempts_;
};

class SpawnError : public LaunchError
{
  public:
    using LaunchError::LaunchError;
};

class ConfigError : public LaunchError
{
  public:
    using LaunchError::LaunchError;
};

class ContentError : public LaunchError
{
  public:
    using LaunchError::LaunchError;
};

} // namespace tbl
