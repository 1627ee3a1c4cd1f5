#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>
#include "persistence/iteration_state_store.hpp"
#include "runtime/agent/controller.hpp"
#include "runtime/executor.hpp"

namespace foreman::registry {

constexpr size_t kMaxEventHistory = 1000;
constexpr uint32_t kDefaultMaxInstances = 10;

// Conflict left in the trunk by an instance's merge
struct MergeConflict {
    std::vector<std::string> files;
    std::string source_branch;
    int64_t timestamp = 0;
};

void to_json(nlohmann::json& j, const MergeConflict& conflict);
void from_json(const nlohmann::json& j, MergeConflict& conflict);

struct CreateInstanceOptions {
    std::string id;
    std::string name;
    std::string agent_name;
    std::optional<std::filesystem::path> worktree_path;   // nullopt = main workspace
    std::optional<std::string> workspace_id;
    std::optional<std::string> branch;
    std::optional<runtime::AgentOptions> agent_options;   // overrides the registry defaults
};

// Point-in-time copy of an instance's bookkeeping
struct InstanceInfo {
    std::string id;
    std::string name;
    std::string agent_name;
    std::optional<std::filesystem::path> worktree_path;
    std::optional<std::string> workspace_id;
    std::optional<std::string> branch;
    std::filesystem::path cwd;
    int64_t created_at = 0;
    std::optional<std::string> current_task_id;
    std::optional<std::string> current_task_title;
    std::optional<std::string> session_id;      // first one the agent reported
    std::optional<MergeConflict> merge_conflict;
    runtime::AgentStatus status = runtime::AgentStatus::STOPPED;
};

void to_json(nlohmann::json& j, const InstanceInfo& info);

// Lookups that distinguish "no such instance" from a null value
struct CurrentTaskResult {
    bool found = false;
    std::optional<std::string> task_id;
    std::optional<std::string> task_title;
};

struct MergeConflictResult {
    bool found = false;
    std::optional<MergeConflict> conflict;
};

enum class RegistryEventType {
    INSTANCE_CREATED,
    INSTANCE_DISPOSED,
    MERGE_CONFLICT,
    INSTANCE_EVENT     // forwarded controller stream, see RegistryEvent::kind
};

const char* registry_event_type_to_string(RegistryEventType type);

struct RegistryEvent {
    RegistryEventType type;
    std::string instance_id;
    std::string kind;     // "ralph:event", "ralph:status", "ralph:output", "ralph:error", "ralph:exit"
    nlohmann::json data;
};

using RegistryEventCallback = std::function<void(const RegistryEvent&)>;
using ControllerFactory =
    std::function<std::shared_ptr<runtime::AgentController>(const runtime::AgentOptions&)>;

struct RegistryOptions {
    runtime::AgentOptions default_agent_options;
    std::optional<std::filesystem::path> main_workspace;
    uint32_t max_instances = kDefaultMaxInstances;    // 0 = unlimited
    std::shared_ptr<persistence::IterationStateStore> state_store;
    ControllerFactory controller_factory;              // default spawns AgentProcess
    size_t background_threads = 2;
};

// Owns the set of live agent instances. Forwards every controller stream
// as instance-tagged RegistryEvents, keeps a bounded event history per
// instance, checkpoints iteration state and caps the instance count.
class InstanceRegistry {
public:
    explicit InstanceRegistry(RegistryOptions options = {});
    ~InstanceRegistry();

    // Non-copyable
    InstanceRegistry(const InstanceRegistry&) = delete;
    InstanceRegistry& operator=(const InstanceRegistry&) = delete;

    // Throws std::runtime_error when the id is taken
    InstanceInfo create(const CreateInstanceOptions& options);

    std::optional<InstanceInfo> get(const std::string& instance_id) const;
    std::shared_ptr<runtime::AgentController> controller(const std::string& instance_id) const;
    bool has(const std::string& instance_id) const;
    std::vector<InstanceInfo> get_all() const;             // creation order
    std::vector<std::string> get_instance_ids() const;     // creation order
    size_t size() const;

    std::vector<nlohmann::json> get_event_history(const std::string& instance_id) const;
    uint64_t total_events_appended(const std::string& instance_id) const;
    void clear_event_history(const std::string& instance_id);

    CurrentTaskResult get_current_task(const std::string& instance_id) const;

    // False when the instance does not exist
    bool set_merge_conflict(const std::string& instance_id, std::optional<MergeConflict> conflict);
    MergeConflictResult get_merge_conflict(const std::string& instance_id) const;

    // Persistence never throws; failures are logged
    void save_iteration_state(const std::string& instance_id);
    void save_all_iteration_states();
    bool delete_iteration_state(const std::string& instance_id);
    std::optional<persistence::PersistedIterationState> load_iteration_state(const std::string& instance_id);

    void set_iteration_state_store(std::shared_ptr<persistence::IterationStateStore> store);
    std::shared_ptr<persistence::IterationStateStore> iteration_state_store() const;

    // Idempotent. instance_disposed is the last event emitted for the id.
    void dispose(const std::string& instance_id);
    void dispose_all();

    void set_event_callback(RegistryEventCallback callback);

    // Block until queued auto-saves and evictions have finished
    void wait_for_background();

private:
    struct Instance {
        std::string id;
        std::string name;
        std::string agent_name;
        std::optional<std::filesystem::path> worktree_path;
        std::optional<std::string> workspace_id;
        std::optional<std::string> branch;
        std::filesystem::path cwd;
        int64_t created_at = 0;
        uint64_t sequence = 0;
        std::shared_ptr<runtime::AgentController> controller;

        // Guarded by the registry mutex
        std::optional<std::string> current_task_id;
        std::optional<std::string> current_task_title;
        std::optional<std::string> session_id;
        std::optional<MergeConflict> merge_conflict;

        std::mutex history_mutex;
        std::deque<nlohmann::json> history;
        uint64_t total_appended = 0;

        // Serializes saves of this instance
        std::mutex save_mutex;

        std::atomic<bool> disposing{false};
        std::recursive_mutex exit_mutex;   // orders ralph:exit before instance_disposed
    };

    RegistryOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Instance>> instances_;
    std::unordered_set<std::string> evicting_;
    uint64_t next_sequence_ = 0;
    std::shared_ptr<persistence::IterationStateStore> state_store_;

    std::mutex callback_mutex_;
    RegistryEventCallback event_callback_;

    // Declared last so queued jobs finish before the other members go away
    runtime::BackgroundExecutor executor_;

    std::shared_ptr<Instance> find(const std::string& instance_id) const;
    InstanceInfo snapshot(const Instance& instance) const;
    void save_instance_state(Instance& instance);
    void wire_controller(const std::shared_ptr<Instance>& instance);
    void handle_event(Instance& instance, nlohmann::json event);
    void append_history(Instance& instance, nlohmann::json event);
    void schedule_save(const std::string& instance_id, const std::string& reason);
    void enforce_max_instances(const std::string& new_instance_id);
    void emit(RegistryEventType type, const std::string& instance_id,
              std::string kind = "", nlohmann::json data = nullptr);
};

} // namespace foreman::registry
