#pragma once

#include <filesystem>
#include <optional>

namespace tbl::utils
{

// $TBL_CONFIG_DIR, else $XDG_CONFIG_HOME/tbl, else $HOME/.config/tbl.
// Does not create the directory.
std::optional<std::filesystem::path> config_root();

std::filesystem::path run_dir(std::filesystem::path const &root);
std::filesystem::path web_root(std::filesystem::path const &root);

bool ensure_directory(std::filesystem::path const &path);
std::optional<std::filesystem::path> executable_path();

// Restricts a file to owner read/write.
bool secure_file_permissions(std::filesystem::path const &path);

} // namespace tbl::utils
