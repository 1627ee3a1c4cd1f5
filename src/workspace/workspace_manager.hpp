#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace foreman::workspace {

struct CreateWorktreeOptions {
    std::string worker_name;
    std::string task_id;
};

// An isolated checkout for one worker's task
struct WorktreeInfo {
    std::filesystem::path path;
    std::string branch;
    std::string worker_name;
    std::string task_id;
};

struct MergeResult {
    bool success = false;
    bool had_conflicts = false;
    std::string message;
};

// Exclusive hold on the trunk. Re-entrant for the holding thread, so the
// manager's own operations can run while it is held.
using TrunkLease = std::unique_lock<std::recursive_mutex>;

// Materializes per-task workspaces and integrates them into the trunk.
// Failures other than merge outcomes are thrown as std::runtime_error.
class WorkspaceManager {
public:
    virtual ~WorkspaceManager() = default;

    // Bring the trunk up to date with shared history
    virtual void pull_latest() = 0;

    virtual WorktreeInfo create(const CreateWorktreeOptions& options) = 0;

    // Merge the task branch into the trunk
    virtual MergeResult merge(const std::string& worker_name, const std::string& task_id) = 0;

    // Paths with unresolved conflicts in the trunk
    virtual std::vector<std::string> conflicting_files() = 0;

    virtual void abort_merge() = 0;

    // Block other workers from touching the trunk until the lease is released.
    // Held from merge through conflict handling, tests and cleanup.
    virtual TrunkLease lock_trunk() = 0;

    // Remove the workspace and its branch; absent ones are ignored
    virtual void remove(const std::string& worker_name, const std::string& task_id) = 0;
};

} // namespace foreman::workspace
