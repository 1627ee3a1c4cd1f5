#include "worker/worker_loop.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace foreman::worker {

WorkerLoop::WorkerLoop(WorkerLoopOptions options)
    : options_(std::move(options)) {
    if (options_.worker_name.empty()) {
        throw std::invalid_argument("WorkerLoop requires a worker name");
    }
    if (!options_.task_source || !options_.workspace || !options_.agent_runner) {
        throw std::invalid_argument("WorkerLoop '" + options_.worker_name +
                                    "' requires a task source, workspace manager and agent runner");
    }
    if (options_.pause_poll_interval.count() <= 0) {
        options_.pause_poll_interval = std::chrono::milliseconds(100);
    }
}

void WorkerLoop::run_loop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = paused_ ? WorkerState::PAUSED : WorkerState::RUNNING;
    }
    spdlog::info("Worker {} started", options_.worker_name);

    while (!stopped_) {
        wait_while_paused();
        if (stopped_) break;

        if (!run_once()) {
            break;
        }

        wait_while_paused();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = WorkerState::IDLE;
    }
    spdlog::info("Worker {} finished", options_.worker_name);
}

bool WorkerLoop::run_once() {
    std::optional<ReadyTask> task;
    try {
        task = options_.task_source->get_ready_task();
    } catch (const std::exception& e) {
        spdlog::error("Worker {} could not query ready tasks: {}", options_.worker_name, e.what());
        emit(WorkerEventType::ERROR, {{"message", e.what()}});
        return false;
    }

    if (!task) {
        emit(WorkerEventType::IDLE);
        return false;
    }

    set_current_task(task->id);
    emit(WorkerEventType::TASK_STARTED, {{"taskId", task->id}, {"taskTitle", task->title}});

    try {
        options_.task_source->claim_task(task->id);

        options_.workspace->pull_latest();
        auto worktree = options_.workspace->create({options_.worker_name, task->id});
        emit(WorkerEventType::WORKTREE_CREATED, {
            {"taskId", task->id},
            {"worktreePath", worktree.path.string()},
            {"branch", worktree.branch}
        });

        if (integrate_task(*task, worktree)) {
            options_.task_source->close_task(task->id);
            emit(WorkerEventType::TASK_COMPLETED, {{"taskId", task->id}});
        } else {
            spdlog::info("Worker {} stopped before task {} was integrated",
                         options_.worker_name, task->id);
        }
    } catch (const std::exception& e) {
        emit_error(task->id, e.what());
    }

    set_current_task(std::nullopt);
    return true;
}

bool WorkerLoop::integrate_task(const ReadyTask& task, const workspace::WorktreeInfo& worktree) {
    uint32_t attempt = 0;

    while (!stopped_) {
        wait_while_paused();
        if (stopped_) break;

        if (options_.max_attempts > 0 && attempt >= options_.max_attempts) {
            throw std::runtime_error("Task " + task.id + " was not integrated after " +
                                     std::to_string(attempt) + " attempts");
        }
        attempt++;

        emit(WorkerEventType::AGENT_STARTED, {{"taskId", task.id}, {"attempt", attempt}});
        auto result = options_.agent_runner->run(worktree.path, task);
        emit(WorkerEventType::AGENT_COMPLETED, {
            {"taskId", task.id},
            {"exitCode", result.exit_code},
            {"sessionId", result.session_id}
        });

        if (force_stopped_) break;

        if (result.exit_code != 0) {
            // Merge anyway: the agent may have committed useful work
            emit_error(task.id, "Agent exited with code " + std::to_string(result.exit_code));
        }

        wait_while_paused();
        if (force_stopped_) break;

        // Other workers stay off the trunk until this merge is settled
        workspace::TrunkLease lease = options_.workspace->lock_trunk();
        auto merge = options_.workspace->merge(options_.worker_name, task.id);

        if (merge.had_conflicts) {
            auto files = options_.workspace->conflicting_files();
            emit(WorkerEventType::MERGE_CONFLICT, {
                {"taskId", task.id},
                {"hadConflicts", true},
                {"conflictingFiles", files},
                {"message", merge.message}
            });

            ConflictResolution resolution = ConflictResolution::RESOLVED;
            if (options_.on_merge_conflict) {
                resolution = options_.on_merge_conflict(
                    MergeConflictContext{task.id, options_.worker_name, worktree.path, files});
            }

            options_.workspace->abort_merge();
            if (resolution == ConflictResolution::ABORT) {
                throw std::runtime_error("Merge conflict could not be resolved");
            }
            continue;
        }

        if (!merge.success) {
            emit_error(task.id, merge.message);
            continue;
        }

        emit(WorkerEventType::MERGE_COMPLETED, {{"taskId", task.id}, {"message", merge.message}});

        if (options_.test_runner) {
            auto tests = options_.test_runner->run_tests();
            if (!tests.success) {
                // The merge stays on the trunk; the next agent run must fix it
                emit(WorkerEventType::TESTS_FAILED, {
                    {"taskId", task.id},
                    {"success", false},
                    {"output", tests.output}
                });
                continue;
            }
        }

        options_.workspace->remove(options_.worker_name, task.id);
        return true;
    }

    return false;
}

void WorkerLoop::pause() {
    std::optional<std::string> task_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (paused_) return;
        paused_ = true;
        state_ = WorkerState::PAUSED;
        task_id = current_task_id_;
    }

    json data = json::object();
    if (task_id) data["taskId"] = *task_id;
    emit(WorkerEventType::PAUSED, data);
}

void WorkerLoop::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!paused_) return;
        paused_ = false;
        state_ = WorkerState::RUNNING;
    }
    pause_cv_.notify_all();
    emit(WorkerEventType::RESUMED);
}

void WorkerLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    pause_cv_.notify_all();
}

void WorkerLoop::force_stop() {
    force_stopped_ = true;
    stop();
    options_.agent_runner->cancel();
}

bool WorkerLoop::is_paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

WorkerState WorkerLoop::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<std::string> WorkerLoop::current_task_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_task_id_;
}

void WorkerLoop::set_event_callback(WorkerEventCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    event_callback_ = std::move(callback);
}

void WorkerLoop::wait_while_paused() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (paused_ && !stopped_) {
        pause_cv_.wait_for(lock, options_.pause_poll_interval);
    }
}

void WorkerLoop::set_current_task(std::optional<std::string> task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_task_id_ = std::move(task_id);
}

void WorkerLoop::emit(WorkerEventType type, json data) {
    spdlog::debug("Worker {}: {} {}", options_.worker_name,
                  worker_event_type_to_string(type), data.dump());

    WorkerEventCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = event_callback_;
    }
    if (callback) {
        callback(WorkerEvent{type, options_.worker_name, std::move(data)});
    }
}

void WorkerLoop::emit_error(const std::string& task_id, const std::string& message) {
    spdlog::error("Worker {} task {}: {}", options_.worker_name, task_id, message);
    emit(WorkerEventType::ERROR, {{"taskId", task_id}, {"message", message}});
}

} // namespace foreman::worker
