#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace foreman::worker {

// Snapshot of a claimable task
struct ReadyTask {
    std::string id;
    std::string title;
};

// Task tracker boundary. Claiming must be atomic across workers.
// Failures are thrown.
class TaskSource {
public:
    virtual ~TaskSource() = default;

    virtual std::optional<ReadyTask> get_ready_task() = 0;
    virtual void claim_task(const std::string& task_id) = 0;
    virtual void close_task(const std::string& task_id) = 0;
};

struct RunAgentResult {
    int exit_code = 0;
    std::string session_id;
};

// Runs one agent session to completion in a workspace
class AgentRunner {
public:
    virtual ~AgentRunner() = default;

    virtual RunAgentResult run(const std::filesystem::path& cwd, const ReadyTask& task) = 0;

    // Terminate the in-flight session, if any
    virtual void cancel() = 0;
};

struct TestResult {
    bool success = false;
    std::string output;
};

class TestRunner {
public:
    virtual ~TestRunner() = default;
    virtual TestResult run_tests() = 0;
};

struct MergeConflictContext {
    std::string task_id;
    std::string worker_name;
    std::filesystem::path workspace_path;
    std::vector<std::string> conflicting_files;
};

enum class ConflictResolution {
    RESOLVED,   // retry the agent run
    ABORT       // give up on the task
};

using ConflictHandler = std::function<ConflictResolution(const MergeConflictContext&)>;

enum class WorkerState {
    IDLE,
    RUNNING,
    PAUSED
};

const char* worker_state_to_string(WorkerState state);

enum class WorkerEventType {
    IDLE,
    TASK_STARTED,
    WORKTREE_CREATED,
    AGENT_STARTED,
    AGENT_COMPLETED,
    MERGE_CONFLICT,
    MERGE_COMPLETED,
    TESTS_FAILED,
    TASK_COMPLETED,
    PAUSED,
    RESUMED,
    ERROR
};

const char* worker_event_type_to_string(WorkerEventType type);

struct WorkerEvent {
    WorkerEventType type;
    std::string worker_name;
    nlohmann::json data;
};

using WorkerEventCallback = std::function<void(const WorkerEvent&)>;

} // namespace foreman::worker
