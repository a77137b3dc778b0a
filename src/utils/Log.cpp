#include "utils/Log.hpp"
#include "utils/FS.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>

namespace tbl::log
{

bool append_log_line_to_file(std::string const &line) noexcept
{
    static std::mutex s_mutex;
    static std::ofstream s_ofs;
    static std::optional<std::filesystem::path> s_path;

    std::lock_guard<std::mutex> lk(s_mutex);
    if (!s_path)
    {
        auto root = tbl::utils::config_root();
        if (!root || !tbl::utils::ensure_directory(*root))
        {
            return false;
        }
        s_path = *root / "tbl.log";
    }
    if (!s_ofs.is_open())
    {
        s_ofs.open(s_path->string(), std::ios::app | std::ios::out);
    }
    if (!s_ofs.is_open())
    {
        return false;
    }
    s_ofs << line << '\n';
    s_ofs.flush();
    return static_cast<bool>(s_ofs);
}

} // namespace tbl::log
