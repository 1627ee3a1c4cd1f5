#include "workspace/worktree_manager.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace foreman::workspace {

namespace {

std::string join_args(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) joined += ' ';
        joined += arg;
    }
    return joined;
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

// git reports worktree paths absolute with symlinks resolved
fs::path resolve(const fs::path& path) {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(fs::absolute(path, ec), ec);
    return ec ? path : resolved;
}

} // namespace

bool GitWorktreeManager::is_safe_name(const std::string& worker_name, const std::string& task_id) {
    if (worker_name.empty() || worker_name == "." || worker_name == ".." ||
        worker_name.find('/') != std::string::npos) {
        return false;
    }
    if (task_id.empty() || task_id.front() == '/') {
        return false;
    }

    // Task ids may nest with '/', but no segment may be empty or a dot entry
    std::istringstream stream(task_id + "/");
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        if (segment.empty() || segment == "." || segment == "..") {
            return false;
        }
    }
    return true;
}

void GitWorktreeManager::check_names(const std::string& worker_name, const std::string& task_id) {
    if (!is_safe_name(worker_name, task_id)) {
        throw std::invalid_argument("Invalid worktree name: worker '" + worker_name +
                                    "', task '" + task_id + "'");
    }
}

GitWorktreeManager::GitWorktreeManager(fs::path main_workspace, std::string branch_prefix)
    : main_workspace_(resolve(main_workspace)),
      worktrees_base_(core::paths::worktrees_base_path(main_workspace_)),
      branch_prefix_(std::move(branch_prefix)) {}

fs::path GitWorktreeManager::worktree_path(const std::string& worker_name,
                                           const std::string& task_id) const {
    return worktrees_base_ / worker_name / task_id;
}

std::string GitWorktreeManager::branch_name(const std::string& worker_name,
                                            const std::string& task_id) const {
    return branch_prefix_ + worker_name + "/" + task_id;
}

runtime::CommandResult GitWorktreeManager::git(const std::vector<std::string>& args) const {
    std::vector<std::string> argv = {"git"};
    argv.insert(argv.end(), args.begin(), args.end());
    auto result = runtime::run_command(argv, main_workspace_);
    if (!result.ok()) {
        spdlog::debug("git {} failed (code={}): {}", join_args(args), result.exit_code,
                      result.combined_output());
    }
    return result;
}

std::string GitWorktreeManager::git_or_throw(const std::vector<std::string>& args) const {
    auto result = git(args);
    if (!result.ok()) {
        throw std::runtime_error("git " + join_args(args) + " failed: " + result.combined_output());
    }
    return result.out;
}

void GitWorktreeManager::pull_latest() {
    std::lock_guard<std::recursive_mutex> lock(trunk_mutex_);

    auto remotes = git({"remote"});
    if (!remotes.ok() || remotes.combined_output().empty()) {
        return;
    }

    auto pull = git({"pull", "--ff-only"});
    if (!pull.ok()) {
        spdlog::warn("Pull of {} skipped: {}", main_workspace_.string(), pull.combined_output());
    }
}

WorktreeInfo GitWorktreeManager::create(const CreateWorktreeOptions& options) {
    check_names(options.worker_name, options.task_id);

    WorktreeInfo info;
    info.path = worktree_path(options.worker_name, options.task_id);
    info.branch = branch_name(options.worker_name, options.task_id);
    info.worker_name = options.worker_name;
    info.task_id = options.task_id;

    std::error_code ec;
    fs::create_directories(worktrees_base_ / options.worker_name, ec);
    if (ec) {
        throw std::runtime_error("Failed to create worktrees directory: " + ec.message());
    }

    std::lock_guard<std::recursive_mutex> lock(trunk_mutex_);
    git_or_throw({"worktree", "add", info.path.string(), "-b", info.branch});

    spdlog::info("Created worktree {} on branch {}", info.path.string(), info.branch);
    return info;
}

MergeResult GitWorktreeManager::merge(const std::string& worker_name, const std::string& task_id) {
    check_names(worker_name, task_id);
    std::string branch = branch_name(worker_name, task_id);
    MergeResult result;

    std::lock_guard<std::recursive_mutex> lock(trunk_mutex_);
    std::string trunk = main_branch();

    auto checkout = git({"checkout", trunk});
    if (!checkout.ok()) {
        result.message = "Merge failed: " + checkout.combined_output();
        return result;
    }

    auto merged = git({"merge", branch, "--no-ff", "-m", "Merge " + branch});
    if (merged.ok()) {
        result.success = true;
        result.message = "Successfully merged " + branch + " to " + trunk;
        spdlog::info("{}", result.message);
        return result;
    }

    std::string output = merged.combined_output();
    if (contains(output, "CONFLICT") || contains(output, "Automatic merge failed")) {
        result.had_conflicts = true;
        result.message = "Merge conflicts detected in " + branch;
        spdlog::warn("{}", result.message);
        return result;
    }

    result.message = "Merge failed: " + output;
    return result;
}

std::vector<std::string> GitWorktreeManager::conflicting_files_locked() const {
    std::vector<std::string> files;
    auto result = git({"diff", "--name-only", "--diff-filter=U"});
    if (!result.ok()) {
        return files;
    }

    std::istringstream stream(result.out);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty()) files.push_back(line);
    }
    return files;
}

std::vector<std::string> GitWorktreeManager::conflicting_files() {
    std::lock_guard<std::recursive_mutex> lock(trunk_mutex_);
    return conflicting_files_locked();
}

bool GitWorktreeManager::is_merge_in_progress() {
    std::lock_guard<std::recursive_mutex> lock(trunk_mutex_);
    return git({"rev-parse", "--verify", "--quiet", "MERGE_HEAD"}).ok();
}

void GitWorktreeManager::abort_merge() {
    std::lock_guard<std::recursive_mutex> lock(trunk_mutex_);
    git_or_throw({"merge", "--abort"});
}

TrunkLease GitWorktreeManager::lock_trunk() {
    return TrunkLease(trunk_mutex_);
}

MergeResult GitWorktreeManager::complete_merge(const std::string& worker_name,
                                               const std::string& task_id) {
    check_names(worker_name, task_id);
    std::string branch = branch_name(worker_name, task_id);
    MergeResult result;

    std::lock_guard<std::recursive_mutex> lock(trunk_mutex_);
    auto conflicts = conflicting_files_locked();
    if (!conflicts.empty()) {
        result.had_conflicts = true;
        result.message = "Cannot complete merge: " + std::to_string(conflicts.size()) +
                         " file(s) still have conflicts";
        return result;
    }

    auto commit = git({"commit", "--no-edit"});
    if (!commit.ok()) {
        result.message = "Failed to complete merge: " + commit.combined_output();
        return result;
    }

    result.success = true;
    result.message = "Successfully completed merge of " + branch;
    return result;
}

void GitWorktreeManager::remove(const std::string& worker_name, const std::string& task_id) {
    check_names(worker_name, task_id);
    fs::path path = worktree_path(worker_name, task_id);
    std::string branch = branch_name(worker_name, task_id);

    std::lock_guard<std::recursive_mutex> lock(trunk_mutex_);

    auto removed = git({"worktree", "remove", path.string(), "--force"});
    if (!removed.ok() && !contains(removed.combined_output(), "is not a working tree")) {
        throw std::runtime_error("git worktree remove failed: " + removed.combined_output());
    }

    auto deleted = git({"branch", "-D", branch});
    if (!deleted.ok() && !contains(deleted.combined_output(), "not found")) {
        throw std::runtime_error("git branch -D failed: " + deleted.combined_output());
    }

    spdlog::info("Removed worktree {}", path.string());
}

bool GitWorktreeManager::exists(const std::string& worker_name, const std::string& task_id) const {
    if (!is_safe_name(worker_name, task_id)) {
        return false;
    }
    std::error_code ec;
    return fs::is_directory(worktree_path(worker_name, task_id), ec);
}

std::vector<WorktreeInfo> GitWorktreeManager::list(const std::optional<std::string>& worker_name) {
    std::string output;
    {
        std::lock_guard<std::recursive_mutex> lock(trunk_mutex_);
        output = git_or_throw({"worktree", "list", "--porcelain"});
    }

    std::vector<WorktreeInfo> worktrees;
    std::string current_path;
    std::string current_branch;

    auto add_current = [&]() {
        if (auto info = parse_worktree(current_path, current_branch, worker_name)) {
            worktrees.push_back(std::move(*info));
        }
    };

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (starts_with(line, "worktree ")) {
            add_current();
            current_path = line.substr(9);
            current_branch.clear();
        } else if (starts_with(line, "branch refs/heads/")) {
            current_branch = line.substr(18);
        }
    }
    add_current();

    return worktrees;
}

std::optional<WorktreeInfo> GitWorktreeManager::parse_worktree(
    const std::string& path, const std::string& branch,
    const std::optional<std::string>& worker_filter) const {

    if (path.empty() || branch.empty() || !starts_with(branch, branch_prefix_) ||
        !starts_with(path, worktrees_base_.string())) {
        return std::nullopt;
    }

    // <prefix><worker>/<task>, where the task id may itself contain slashes
    std::string rest = branch.substr(branch_prefix_.size());
    size_t slash = rest.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= rest.size()) {
        return std::nullopt;
    }

    WorktreeInfo info;
    info.path = path;
    info.branch = branch;
    info.worker_name = rest.substr(0, slash);
    info.task_id = rest.substr(slash + 1);

    if (worker_filter && info.worker_name != *worker_filter) {
        return std::nullopt;
    }
    return info;
}

void GitWorktreeManager::prune() {
    std::lock_guard<std::recursive_mutex> lock(trunk_mutex_);
    git_or_throw({"worktree", "prune"});
}

std::string GitWorktreeManager::main_branch() const {
    if (git({"show-ref", "--verify", "--quiet", "refs/heads/main"}).ok()) {
        return "main";
    }
    if (git({"show-ref", "--verify", "--quiet", "refs/heads/master"}).ok()) {
        return "master";
    }
    return "main";
}

} // namespace foreman::workspace
