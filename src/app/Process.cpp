#include "app/Process.hpp"

#include "utils/Errors.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <cstdlib>
#include <cstring>
#include <string_view>

#include <fcntl.h>
#include <spawn.h>
#include <sys/types.h>
#include <unistd.h>

extern char **environ;

namespace tbl::app
{
namespace
{

// posix_spawn attributes and file actions with guaranteed cleanup.
class SpawnSetup
{
  public:
    SpawnSetup()
    {
        if (posix_spawnattr_init(&attr_) != 0)
        {
            throw SpawnError("posix_spawnattr_init failed");
        }
        if (posix_spawn_file_actions_init(&actions_) != 0)
        {
            posix_spawnattr_destroy(&attr_);
            throw SpawnError("posix_spawn_file_actions_init failed");
        }
    }
    ~SpawnSetup()
    {
        posix_spawn_file_actions_destroy(&actions_);
        posix_spawnattr_destroy(&attr_);
    }
    SpawnSetup(SpawnSetup const &) = delete;
    SpawnSetup &operator=(SpawnSetup const &) = delete;

    posix_spawnattr_t *attr() { return &attr_; }
    posix_spawn_file_actions_t *actions() { return &actions_; }

  private:
    posix_spawnattr_t attr_;
    posix_spawn_file_actions_t actions_;
};

std::vector<std::string> child_environment()
{
    std::vector<std::string> env;
    std::string const prefix = std::string(kDaemonMarkerEnv) + "=";
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry)
    {
        if (std::string_view(*entry).starts_with(prefix))
        {
            continue;
        }
        env.emplace_back(*entry);
    }
    env.push_back(prefix + "1");
    return env;
}

std::vector<char *> to_argv(std::vector<std::string> &storage)
{
    std::vector<char *> out;
    out.reserve(storage.size() + 1);
    for (auto &item : storage)
    {
        out.push_back(item.data());
    }
    out.push_back(nullptr);
    return out;
}

} // namespace

bool is_daemonized()
{
    auto *value = std::getenv(kDaemonMarkerEnv);
    return value != nullptr && std::string_view(value) == "1";
}

long spawn_detached(std::vector<std::string> const &args)
{
    auto exe = utils::executable_path();
    if (!exe)
    {
        throw SpawnError("cannot locate the running executable");
    }

    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(exe->string());
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    auto env_storage = child_environment();
    auto argv = to_argv(argv_storage);
    auto envp = to_argv(env_storage);

    SpawnSetup setup;
    short flags = 0;
#ifdef POSIX_SPAWN_SETSID
    flags |= POSIX_SPAWN_SETSID;
#endif
    if (posix_spawnattr_setflags(setup.attr(), flags) != 0)
    {
        throw SpawnError("posix_spawnattr_setflags failed");
    }
    if (posix_spawn_file_actions_addopen(setup.actions(), STDIN_FILENO,
                                         "/dev/null", O_RDONLY, 0) != 0)
    {
        throw SpawnError("cannot redirect child stdin");
    }

    pid_t pid = 0;
    int rc = posix_spawn(&pid, argv_storage.front().c_str(), setup.actions(),
                         setup.attr(), argv.data(), envp.data());
    if (rc != 0)
    {
        throw SpawnError("failed to launch background process: " +
                         std::string(std::strerror(rc)));
    }
    TBL_LOG_INFO("spawned background process pid={}", static_cast<long>(pid));
    return static_cast<long>(pid);
}

std::string escape_shell_argument(std::string const &value)
{
    std::string result;
    result.reserve(value.size() + 4);
    result.push_back('\'');
    for (char ch : value)
    {
        if (ch == '\'')
        {
            result += "'\\''";
            continue;
        }
        result.push_back(ch);
    }
    result.push_back('\'');
    return result;
}

bool run_external_command(std::string const &command)
{
    if (command.empty())
    {
        return false;
    }
    TBL_LOG_DEBUG("running: {}", command);
    int status = std::system(command.c_str());
    return status == 0;
}

bool open_with_default_app(std::string const &target)
{
    if (target.empty())
    {
        return false;
    }
#if defined(__APPLE__)
    return run_external_command("open " + escape_shell_argument(target));
#else
    return run_external_command("xdg-open " + escape_shell_argument(target) +
                                " >/dev/null 2>&1");
#endif
}

} // namespace tbl::app
