#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace foreman::core::paths {

// Best-effort directory of the current executable; empty if unavailable.
std::filesystem::path executable_dir();

// Directories searched for a .env file, nearest first, without duplicates.
std::vector<std::filesystem::path> config_search_paths();

// Sibling folder holding worker worktrees: <parent>/<project>-worktrees.
std::filesystem::path worktrees_base_path(const std::filesystem::path& main_workspace);

// Directory holding persisted iteration state for a workspace.
std::filesystem::path iterations_dir(const std::filesystem::path& workspace);

} // namespace foreman::core::paths
