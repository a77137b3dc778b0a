#include "utils/FS.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#else
#include <unistd.h>
#endif

namespace tbl::utils
{

namespace
{
std::optional<std::filesystem::path> env_path(char const *key)
{
    auto value = std::getenv(key);
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::filesystem::path(value);
}
} // namespace

std::optional<std::filesystem::path> config_root()
{
    if (auto explicit_dir = env_path("TBL_CONFIG_DIR"))
    {
        return explicit_dir;
    }
    if (auto xdg = env_path("XDG_CONFIG_HOME"))
    {
        return *xdg / "tbl";
    }
    if (auto home = env_path("HOME"))
    {
        return *home / ".config" / "tbl";
    }
    return std::nullopt;
}

std::filesystem::path run_dir(std::filesystem::path const &root)
{
    return root / "run";
}

std::filesystem::path web_root(std::filesystem::path const &root)
{
    return root / "web";
}

bool ensure_directory(std::filesystem::path const &path)
{
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (!ec)
    {
        return true;
    }
    return std::filesystem::is_directory(path, ec);
}

std::optional<std::filesystem::path> executable_path()
{
#if defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    if (size == 0)
    {
        return std::nullopt;
    }
    std::vector<char> buffer(size);
    if (_NSGetExecutablePath(buffer.data(), &size) != 0)
    {
        return std::nullopt;
    }
    return std::filesystem::path(buffer.data());
#else
    std::vector<char> buffer(4096);
    while (true)
    {
        ssize_t length =
            readlink("/proc/self/exe", buffer.data(), buffer.size());
        if (length == -1)
        {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(length) < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        buffer.resize(buffer.size() * 2);
    }
#endif
}

bool secure_file_permissions(std::filesystem::path const &path)
{
    std::error_code ec;
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    return !ec;
}

} // namespace tbl::utils
