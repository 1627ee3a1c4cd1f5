#include "core/paths.hpp"
#include <algorithm>
#include <unistd.h>
#include <limits.h>

namespace fs = std::filesystem;

namespace foreman::core::paths {

fs::path executable_dir() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return fs::path(buf).parent_path();
}

std::vector<fs::path> config_search_paths() {
    std::vector<fs::path> roots;

    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (!ec) {
        roots.push_back(cwd);
        roots.push_back(cwd.parent_path());
    }

    auto exe_dir = executable_dir();
    if (!exe_dir.empty()) {
        roots.push_back(exe_dir);
        roots.push_back(exe_dir.parent_path());
    }

    std::vector<fs::path> unique;
    for (const auto& p : roots) {
        if (p.empty()) continue;
        if (std::find(unique.begin(), unique.end(), p) == unique.end()) {
            unique.push_back(p);
        }
    }
    return unique;
}

fs::path worktrees_base_path(const fs::path& main_workspace) {
    fs::path normalized = main_workspace.lexically_normal();
    if (!normalized.has_filename()) {
        normalized = normalized.parent_path();
    }
    std::string project = normalized.filename().string();
    return normalized.parent_path() / (project + "-worktrees");
}

fs::path iterations_dir(const fs::path& workspace) {
    return workspace / ".foreman" / "iterations";
}

} // namespace foreman::core::paths
