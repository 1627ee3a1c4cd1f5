/**
 * Foreman Git Worktree Manager
 *
 * Each worker gets its own git worktree in a sibling folder:
 *
 *   project/                 main worktree (trunk)
 *   project-worktrees/
 *     homer/
 *       bd-abc123/           branch foreman/homer/bd-abc123
 */
#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "runtime/subprocess.hpp"
#include "workspace/workspace_manager.hpp"

namespace foreman::workspace {

class GitWorktreeManager : public WorkspaceManager {
public:
    explicit GitWorktreeManager(std::filesystem::path main_workspace,
                                std::string branch_prefix = "foreman/");

    std::filesystem::path worktrees_base_path() const { return worktrees_base_; }
    std::filesystem::path worktree_path(const std::string& worker_name, const std::string& task_id) const;
    std::string branch_name(const std::string& worker_name, const std::string& task_id) const;

    // Fast-forward only; skipped without a remote, failures are logged
    void pull_latest() override;

    WorktreeInfo create(const CreateWorktreeOptions& options) override;
    MergeResult merge(const std::string& worker_name, const std::string& task_id) override;
    std::vector<std::string> conflicting_files() override;
    void abort_merge() override;
    TrunkLease lock_trunk() override;
    void remove(const std::string& worker_name, const std::string& task_id) override;

    bool is_merge_in_progress();

    // Commit a merge whose conflicts were resolved and staged
    MergeResult complete_merge(const std::string& worker_name, const std::string& task_id);

    // False for names check_names() would reject
    bool exists(const std::string& worker_name, const std::string& task_id) const;

    // Worktrees on our branch prefix, optionally for one worker
    std::vector<WorktreeInfo> list(const std::optional<std::string>& worker_name = std::nullopt);

    void prune();

private:
    std::filesystem::path main_workspace_;
    std::filesystem::path worktrees_base_;
    std::string branch_prefix_;

    // Serializes every git operation on the main workspace
    std::recursive_mutex trunk_mutex_;

    runtime::CommandResult git(const std::vector<std::string>& args) const;
    std::string git_or_throw(const std::vector<std::string>& args) const;
    std::vector<std::string> conflicting_files_locked() const;
    std::string main_branch() const;

    // Throws std::invalid_argument for names that would leave the worktrees folder
    static void check_names(const std::string& worker_name, const std::string& task_id);
    static bool is_safe_name(const std::string& worker_name, const std::string& task_id);
    std::optional<WorktreeInfo> parse_worktree(const std::string& path, const std::string& branch,
                                               const std::optional<std::string>& worker_filter) const;
};

} // namespace foreman::workspace
