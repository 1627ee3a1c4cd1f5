#include "worker/types.hpp"

namespace foreman::worker {

const char* worker_state_to_string(WorkerState state) {
    switch (state) {
        case WorkerState::IDLE:    return "idle";
        case WorkerState::RUNNING: return "running";
        case WorkerState::PAUSED:  return "paused";
        default: return "unknown";
    }
}

const char* worker_event_type_to_string(WorkerEventType type) {
    switch (type) {
        case WorkerEventType::IDLE:             return "idle";
        case WorkerEventType::TASK_STARTED:     return "task_started";
        case WorkerEventType::WORKTREE_CREATED: return "worktree_created";
        case WorkerEventType::AGENT_STARTED:    return "agent_started";
        case WorkerEventType::AGENT_COMPLETED:  return "agent_completed";
        case WorkerEventType::MERGE_CONFLICT:   return "merge_conflict";
        case WorkerEventType::MERGE_COMPLETED:  return "merge_completed";
        case WorkerEventType::TESTS_FAILED:     return "tests_failed";
        case WorkerEventType::TASK_COMPLETED:   return "task_completed";
        case WorkerEventType::PAUSED:           return "paused";
        case WorkerEventType::RESUMED:          return "resumed";
        case WorkerEventType::ERROR:            return "error";
        default: return "unknown";
    }
}

} // namespace foreman::worker
