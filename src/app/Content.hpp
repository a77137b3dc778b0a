#pragma once

#include <filesystem>
#include <string>

namespace tbl::app
{

// `git --version` succeeds.
bool git_available();
// Prints per-platform install instructions to stderr.
void print_git_install_hints();
// Throws ContentError (after printing hints) when git is unusable.
void ensure_git_available();

// Makes `web_dir` a shallow checkout of `url`. An existing checkout is
// refreshed; refresh failures keep the old content. A failed fresh clone
// throws ContentError.
void ensure_content(std::filesystem::path const &web_dir,
                    std::string const &url);

} // namespace tbl::app
