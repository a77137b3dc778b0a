#include "app/Content.hpp"

#include "app/Process.hpp"
#include "utils/Errors.hpp"
#include "utils/Log.hpp"

#include <system_error>

namespace tbl::app
{

bool git_available()
{
    return run_external_command("git --version >/dev/null 2>&1");
}

void print_git_install_hints()
{
    log::print_error("`git` was not found or is not working.");
#if defined(__APPLE__)
    log::print_error("Install git on macOS:\n  xcode-select --install\n"
                     "or using Homebrew:\n  brew install git");
#elif defined(__linux__)
    log::print_error("Install git on Linux:\n"
                     "  Debian/Ubuntu: sudo apt-get install git\n"
                     "  Fedora:        sudo dnf install git\n"
                     "  Arch Linux:    sudo pacman -S git");
#else
    log::print_error("Please install git from https://git-scm.com/downloads");
#endif
}

void ensure_git_available()
{
    if (git_available())
    {
        return;
    }
    print_git_install_hints();
    throw ContentError("git not available on PATH");
}

void ensure_content(std::filesystem::path const &web_dir,
                    std::string const &url)
{
    auto const dir = escape_shell_argument(web_dir.string());
    std::error_code ec;
    if (std::filesystem::exists(web_dir / ".git", ec))
    {
        TBL_LOG_INFO("refreshing content in {}", web_dir.string());
        if (!run_external_command("git -C " + dir + " fetch --depth 1 origin"))
        {
            TBL_LOG_WARN("git fetch failed, keeping existing checkout");
            return;
        }
        if (!run_external_command("git -C " + dir +
                                  " reset --hard origin/HEAD"))
        {
            TBL_LOG_WARN("git reset failed, keeping existing checkout");
        }
        return;
    }

    if (std::filesystem::exists(web_dir, ec))
    {
        std::filesystem::remove_all(web_dir, ec);
        if (ec)
        {
            throw ContentError("cannot remove " + web_dir.string() + ": " +
                               ec.message());
        }
    }
    TBL_LOG_INFO("cloning {} into {}", url, web_dir.string());
    if (!run_external_command("git clone --depth 1 " +
                              escape_shell_argument(url) + " " + dir))
    {
        throw ContentError("git clone failed for " + url);
    }
}

} // namespace tbl::app
