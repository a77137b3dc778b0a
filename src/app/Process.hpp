#pragma once

#include <string>
#include <vector>

namespace tbl::app
{

inline constexpr char kDaemonMarkerEnv[] = "TBL_DAEMONIZED";

// True when this process was started by spawn_detached().
bool is_daemonized();

// Re-launches the current executable with `args` in a new session, carrying
// the daemon marker. stdin reads /dev/null; stdout/stderr are inherited.
// Returns the child's pid. Throws SpawnError.
long spawn_detached(std::vector<std::string> const &args);

std::string escape_shell_argument(std::string const &value);
bool run_external_command(std::string const &command);
// Hands a URL or path to the desktop's default handler.
bool open_with_default_app(std::string const &target);

} // namespace tbl::app
