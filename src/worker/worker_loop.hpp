#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "worker/types.hpp"
#include "workspace/workspace_manager.hpp"

namespace foreman::worker {

struct WorkerLoopOptions {
    std::string worker_name;
    std::shared_ptr<TaskSource> task_source;
    std::shared_ptr<workspace::WorkspaceManager> workspace;
    std::shared_ptr<AgentRunner> agent_runner;
    std::shared_ptr<TestRunner> test_runner;   // optional
    ConflictHandler on_merge_conflict;          // optional, default retries
    uint32_t max_attempts = 0;                  // agent runs per task, 0 = unlimited
    std::chrono::milliseconds pause_poll_interval{100};
};

// One worker's claim -> worktree -> agent -> merge -> test -> cleanup cycle.
// A claimed task is retried until it integrates cleanly, unless a conflict
// handler aborts it or max_attempts is reached. Control methods are
// thread-safe; run_once()/run_loop() block the calling thread.
class WorkerLoop {
public:
    // Throws std::invalid_argument when a required collaborator is missing
    explicit WorkerLoop(WorkerLoopOptions options);

    // Non-copyable
    WorkerLoop(const WorkerLoop&) = delete;
    WorkerLoop& operator=(const WorkerLoop&) = delete;

    // Process at most one task; false when no task was available
    bool run_once();

    // Run until stopped or the task source runs dry. Returns at once on a
    // stopped loop.
    void run_loop();

    void pause();
    void resume();

    // Stop at the next boundary. Permanent: later run_loop() calls return at once.
    void stop();

    // Stop and kill the in-flight agent
    void force_stop();

    bool is_paused() const;
    bool is_stopped() const { return stopped_; }
    WorkerState state() const;
    std::optional<std::string> current_task_id() const;
    const std::string& worker_name() const { return options_.worker_name; }

    void set_event_callback(WorkerEventCallback callback);

private:
    WorkerLoopOptions options_;

    std::atomic<bool> stopped_{false};
    std::atomic<bool> force_stopped_{false};

    mutable std::mutex mutex_;
    std::condition_variable pause_cv_;
    bool paused_ = false;
    WorkerState state_ = WorkerState::IDLE;
    std::optional<std::string> current_task_id_;

    std::mutex callback_mutex_;
    WorkerEventCallback event_callback_;

    // Retry until merged, tested and cleaned up; false if stopped first
    bool integrate_task(const ReadyTask& task, const workspace::WorktreeInfo& worktree);

    void wait_while_paused();
    void set_current_task(std::optional<std::string> task_id);
    void emit(WorkerEventType type, nlohmann::json data = nlohmann::json::object());
    void emit_error(const std::string& task_id, const std::string& message);
};

} // namespace foreman::worker
