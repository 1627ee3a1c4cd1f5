#include "registry/instance_registry.hpp"
#include "conversation/reconstructor.hpp"
#include "core/clock.hpp"
#include "runtime/agent/process.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdio>
#include <random>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace foreman::registry {

namespace {

// Random RFC 4122 version 4 identifier
std::string generate_event_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buffer;
}

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

template <typename T>
json optional_json(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

bool is_active(runtime::AgentController& controller) {
    return controller.is_running() || controller.status() == runtime::AgentStatus::PAUSED;
}

} // namespace

void to_json(json& j, const MergeConflict& conflict) {
    j = json{
        {"files", conflict.files},
        {"sourceBranch", conflict.source_branch},
        {"timestamp", conflict.timestamp}
    };
}

void from_json(const json& j, MergeConflict& conflict) {
    conflict.files = j.value("files", std::vector<std::string>{});
    conflict.source_branch = j.value("sourceBranch", "");
    conflict.timestamp = j.value("timestamp", int64_t{0});
}

void to_json(json& j, const InstanceInfo& info) {
    j = json{
        {"id", info.id},
        {"name", info.name},
        {"agentName", info.agent_name},
        {"worktreePath", info.worktree_path ? json(info.worktree_path->string()) : json(nullptr)},
        {"workspaceId", optional_json(info.workspace_id)},
        {"branch", optional_json(info.branch)},
        {"cwd", info.cwd.string()},
        {"createdAt", info.created_at},
        {"currentTaskId", optional_json(info.current_task_id)},
        {"currentTaskTitle", optional_json(info.current_task_title)},
        {"sessionId", optional_json(info.session_id)},
        {"mergeConflict", optional_json(info.merge_conflict)},
        {"status", runtime::agent_status_to_string(info.status)}
    };
}

const char* registry_event_type_to_string(RegistryEventType type) {
    switch (type) {
        case RegistryEventType::INSTANCE_CREATED:  return "instance_created";
        case RegistryEventType::INSTANCE_DISPOSED: return "instance_disposed";
        case RegistryEventType::MERGE_CONFLICT:    return "merge_conflict";
        case RegistryEventType::INSTANCE_EVENT:    return "instance_event";
        default: return "unknown";
    }
}

InstanceRegistry::InstanceRegistry(RegistryOptions options)
    : options_(std::move(options)),
      state_store_(options_.state_store),
      executor_(options_.background_threads) {
    if (!options_.controller_factory) {
        options_.controller_factory = [](const runtime::AgentOptions& agent_options) {
            return std::make_shared<runtime::AgentProcess>(agent_options);
        };
    }
}

InstanceRegistry::~InstanceRegistry() {
    dispose_all();
    executor_.drain();
}

InstanceInfo InstanceRegistry::create(const CreateInstanceOptions& options) {
    auto duplicate = [&options]() {
        return std::runtime_error("Instance with ID '" + options.id + "' already exists");
    };

    if (has(options.id)) {
        throw duplicate();
    }

    auto instance = std::make_shared<Instance>();
    instance->id = options.id;
    instance->name = options.name;
    instance->agent_name = options.agent_name;
    instance->worktree_path = options.worktree_path;
    instance->workspace_id = options.workspace_id;
    instance->branch = options.branch;
    instance->created_at = core::now_ms();

    if (options.worktree_path) {
        instance->cwd = *options.worktree_path;
    } else if (options_.main_workspace) {
        instance->cwd = *options_.main_workspace;
    } else {
        instance->cwd = fs::current_path();
    }

    runtime::AgentOptions agent_options = options.agent_options.value_or(options_.default_agent_options);
    agent_options.cwd = instance->cwd;
    instance->controller = options_.controller_factory(agent_options);
    if (!instance->controller) {
        throw std::runtime_error("Controller factory returned no controller for '" + options.id + "'");
    }

    wire_controller(instance);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (instances_.count(options.id) > 0) {
            instance->controller->clear_callbacks();
            throw duplicate();
        }
        instance->sequence = next_sequence_++;
        instances_.emplace(options.id, instance);
    }

    InstanceInfo info = snapshot(*instance);
    spdlog::info("Created instance {} ({}) in {}", info.id, info.name, info.cwd.string());
    emit(RegistryEventType::INSTANCE_CREATED, info.id, "", info);

    enforce_max_instances(options.id);
    return info;
}

std::optional<InstanceInfo> InstanceRegistry::get(const std::string& instance_id) const {
    auto instance = find(instance_id);
    if (!instance) {
        return std::nullopt;
    }
    return snapshot(*instance);
}

std::shared_ptr<runtime::AgentController> InstanceRegistry::controller(const std::string& instance_id) const {
    auto instance = find(instance_id);
    return instance ? instance->controller : nullptr;
}

bool InstanceRegistry::has(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.count(instance_id) > 0;
}

std::vector<InstanceInfo> InstanceRegistry::get_all() const {
    std::vector<std::shared_ptr<Instance>> instances;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, instance] : instances_) {
            instances.push_back(instance);
        }
    }
    std::sort(instances.begin(), instances.end(),
              [](const auto& a, const auto& b) { return a->sequence < b->sequence; });

    std::vector<InstanceInfo> result;
    result.reserve(instances.size());
    for (const auto& instance : instances) {
        result.push_back(snapshot(*instance));
    }
    return result;
}

std::vector<std::string> InstanceRegistry::get_instance_ids() const {
    std::vector<std::pair<uint64_t, std::string>> ordered;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, instance] : instances_) {
            ordered.emplace_back(instance->sequence, id);
        }
    }
    std::sort(ordered.begin(), ordered.end());

    std::vector<std::string> ids;
    ids.reserve(ordered.size());
    for (auto& entry : ordered) {
        ids.push_back(std::move(entry.second));
    }
    return ids;
}

size_t InstanceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.size();
}

std::vector<json> InstanceRegistry::get_event_history(const std::string& instance_id) const {
    auto instance = find(instance_id);
    if (!instance) {
        return {};
    }
    std::lock_guard<std::mutex> lock(instance->history_mutex);
    return std::vector<json>(instance->history.begin(), instance->history.end());
}

uint64_t InstanceRegistry::total_events_appended(const std::string& instance_id) const {
    auto instance = find(instance_id);
    if (!instance) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(instance->history_mutex);
    return instance->total_appended;
}

void InstanceRegistry::clear_event_history(const std::string& instance_id) {
    auto instance = find(instance_id);
    if (!instance) {
        return;
    }
    std::lock_guard<std::mutex> lock(instance->history_mutex);
    instance->history.clear();
    instance->total_appended = 0;
}

CurrentTaskResult InstanceRegistry::get_current_task(const std::string& instance_id) const {
    CurrentTaskResult result;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(instance_id);
    if (it == instances_.end()) {
        return result;
    }
    result.found = true;
    result.task_id = it->second->current_task_id;
    result.task_title = it->second->current_task_title;
    return result;
}

bool InstanceRegistry::set_merge_conflict(const std::string& instance_id,
                                          std::optional<MergeConflict> conflict) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instances_.find(instance_id);
        if (it == instances_.end()) {
            return false;
        }
        it->second->merge_conflict = conflict;
    }

    if (conflict) {
        spdlog::warn("Instance {} has merge conflicts in {} file(s)", instance_id, conflict->files.size());
    }
    emit(RegistryEventType::MERGE_CONFLICT, instance_id, "", optional_json(conflict));
    return true;
}

MergeConflictResult InstanceRegistry::get_merge_conflict(const std::string& instance_id) const {
    MergeConflictResult result;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(instance_id);
    if (it == instances_.end()) {
        return result;
    }
    result.found = true;
    result.conflict = it->second->merge_conflict;
    return result;
}

void InstanceRegistry::save_iteration_state(const std::string& instance_id) {
    if (auto instance = find(instance_id)) {
        save_instance_state(*instance);
    }
}

void InstanceRegistry::save_instance_state(Instance& instance) {
    auto store = iteration_state_store();
    if (!store) {
        return;
    }

    // A caller queued behind an in-flight save still writes fresh data
    std::lock_guard<std::mutex> save_lock(instance.save_mutex);

    std::vector<json> events;
    {
        std::lock_guard<std::mutex> lock(instance.history_mutex);
        events.assign(instance.history.begin(), instance.history.end());
    }

    persistence::PersistedIterationState state;
    state.instance_id = instance.id;
    state.conversation_context = conversation::build_conversation_context(events);
    state.status = runtime::agent_status_to_string(instance.controller->status());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state.current_task_id = instance.current_task_id;
    }
    state.saved_at = core::now_ms();
    state.version = persistence::kIterationStateVersion;

    try {
        store->save(state);
    } catch (const std::exception& e) {
        spdlog::error("Failed to save iteration state for {}: {}", instance.id, e.what());
    }
}

void InstanceRegistry::save_all_iteration_states() {
    if (!iteration_state_store()) {
        return;
    }

    std::vector<std::shared_ptr<Instance>> instances;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, instance] : instances_) {
            instances.push_back(instance);
        }
    }

    std::vector<std::thread> savers;
    for (const auto& instance : instances) {
        auto status = instance->controller->status();
        if (status == runtime::AgentStatus::RUNNING || status == runtime::AgentStatus::PAUSED) {
            savers.emplace_back([this, id = instance->id]() { save_iteration_state(id); });
        }
    }
    for (auto& saver : savers) {
        saver.join();
    }
}

bool InstanceRegistry::delete_iteration_state(const std::string& instance_id) {
    auto store = iteration_state_store();
    if (!store) {
        return false;
    }
    try {
        return store->erase(instance_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to delete iteration state for {}: {}", instance_id, e.what());
        return false;
    }
}

std::optional<persistence::PersistedIterationState> InstanceRegistry::load_iteration_state(
    const std::string& instance_id) {
    auto store = iteration_state_store();
    if (!store) {
        return std::nullopt;
    }
    try {
        return store->load(instance_id);
    } catch (const std::exception& e) {
        spdlog::error("Failed to load iteration state for {}: {}", instance_id, e.what());
        return std::nullopt;
    }
}

void InstanceRegistry::set_iteration_state_store(std::shared_ptr<persistence::IterationStateStore> store) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_store_ = std::move(store);
}

std::shared_ptr<persistence::IterationStateStore> InstanceRegistry::iteration_state_store() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_store_;
}

void InstanceRegistry::dispose(const std::string& instance_id) {
    auto instance = find(instance_id);
    if (!instance || instance->disposing.exchange(true)) {
        return;
    }

    if (is_active(*instance->controller)) {
        save_iteration_state(instance_id);
        try {
            instance->controller->stop(runtime::kDefaultStopTimeout);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to stop instance {} during dispose: {}", instance_id, e.what());
        }
    }

    instance->controller->clear_callbacks();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        instances_.erase(instance_id);
        evicting_.erase(instance_id);
    }

    spdlog::info("Disposed instance {}", instance_id);
    // Waits out an exit notification that passed the disposing check
    std::lock_guard<std::recursive_mutex> exit_lock(instance->exit_mutex);
    emit(RegistryEventType::INSTANCE_DISPOSED, instance_id);
}

void InstanceRegistry::dispose_all() {
    std::vector<std::thread> disposers;
    for (const auto& id : get_instance_ids()) {
        disposers.emplace_back([this, id]() { dispose(id); });
    }
    for (auto& disposer : disposers) {
        disposer.join();
    }
}

void InstanceRegistry::set_event_callback(RegistryEventCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    event_callback_ = std::move(callback);
}

void InstanceRegistry::wait_for_background() {
    executor_.drain();
}

std::shared_ptr<InstanceRegistry::Instance> InstanceRegistry::find(const std::string& instance_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(instance_id);
    return it == instances_.end() ? nullptr : it->second;
}

InstanceInfo InstanceRegistry::snapshot(const Instance& instance) const {
    InstanceInfo info;
    info.id = instance.id;
    info.name = instance.name;
    info.agent_name = instance.agent_name;
    info.worktree_path = instance.worktree_path;
    info.workspace_id = instance.workspace_id;
    info.branch = instance.branch;
    info.cwd = instance.cwd;
    info.created_at = instance.created_at;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        info.current_task_id = instance.current_task_id;
        info.current_task_title = instance.current_task_title;
        info.session_id = instance.session_id;
        info.merge_conflict = instance.merge_conflict;
    }
    info.status = instance.controller->status();
    return info;
}

void InstanceRegistry::wire_controller(const std::shared_ptr<Instance>& instance) {
    std::weak_ptr<Instance> weak = instance;
    const std::string id = instance->id;

    runtime::ControllerCallbacks callbacks;

    callbacks.on_event = [this, weak](const json& event) {
        if (auto self = weak.lock()) {
            handle_event(*self, event);
        }
    };

    callbacks.on_status = [this, id](runtime::AgentStatus status) {
        emit(RegistryEventType::INSTANCE_EVENT, id, "ralph:status",
             runtime::agent_status_to_string(status));

        // Fully stopped is covered by the exit save
        if (status == runtime::AgentStatus::PAUSED ||
            status == runtime::AgentStatus::STOPPING_AFTER_CURRENT) {
            schedule_save(id, std::string("status ") + runtime::agent_status_to_string(status));
        }
    };

    callbacks.on_output = [this, id](const std::string& line) {
        emit(RegistryEventType::INSTANCE_EVENT, id, "ralph:output", line);
    };

    callbacks.on_error = [this, id](const std::string& message) {
        emit(RegistryEventType::INSTANCE_EVENT, id, "ralph:error", message);
        schedule_save(id, "error");
    };

    callbacks.on_exit = [this, weak](const runtime::ExitInfo& info) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        json data = {
            {"code", optional_json(info.code)},
            {"signal", optional_json(info.signal)}
        };

        // Checkpoint before anyone hears about the exit; the save outlives a
        // concurrent dispose, the notification does not
        auto save_then_forward = [this, self, data]() {
            save_instance_state(*self);
            std::lock_guard<std::recursive_mutex> lock(self->exit_mutex);
            if (!self->disposing) {
                emit(RegistryEventType::INSTANCE_EVENT, self->id, "ralph:exit", data);
            }
        };
        if (!executor_.submit("exit save " + self->id, save_then_forward)) {
            save_then_forward();
        }
    };

    instance->controller->set_callbacks(std::move(callbacks));
}

void InstanceRegistry::handle_event(Instance& instance, json event) {
    if (!event.is_object()) {
        return;
    }

    auto id_it = event.find("id");
    if (id_it == event.end() || id_it->is_null() || (id_it->is_string() && id_it->get<std::string>().empty())) {
        event["id"] = generate_event_id();
    }

    std::string type = optional_string(event, "type").value_or("");
    if (type == "ralph_task_started") {
        std::lock_guard<std::mutex> lock(mutex_);
        instance.current_task_id = optional_string(event, "taskId");
        instance.current_task_title = optional_string(event, "taskTitle");
    } else if (type == "ralph_task_completed") {
        std::lock_guard<std::mutex> lock(mutex_);
        instance.current_task_id.reset();
        instance.current_task_title.reset();
    }

    auto session = optional_string(event, "sessionId");
    if (!session || session->empty()) {
        session = optional_string(event, "session_id");
    }
    if (session && !session->empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!instance.session_id) {
            instance.session_id = session;
        }
    }

    append_history(instance, event);
    emit(RegistryEventType::INSTANCE_EVENT, instance.id, "ralph:event", event);

    if (type == "result" || type == "ralph_task_completed" || type == "message_stop") {
        schedule_save(instance.id, "after " + type);
    }
}

void InstanceRegistry::append_history(Instance& instance, json event) {
    std::lock_guard<std::mutex> lock(instance.history_mutex);
    instance.history.push_back(std::move(event));
    instance.total_appended++;
    while (instance.history.size() > kMaxEventHistory) {
        instance.history.pop_front();
    }
}

void InstanceRegistry::schedule_save(const std::string& instance_id, const std::string& reason) {
    if (!iteration_state_store()) {
        return;
    }
    bool queued = executor_.submit("auto-save " + instance_id + " (" + reason + ")",
                                   [this, instance_id]() { save_iteration_state(instance_id); });
    if (!queued) {
        spdlog::warn("Auto-save for {} ({}) skipped during shutdown", instance_id, reason);
    }
}

void InstanceRegistry::enforce_max_instances(const std::string& new_instance_id) {
    if (options_.max_instances == 0) {
        return;
    }

    std::vector<std::shared_ptr<Instance>> candidates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (instances_.size() - evicting_.size() <= options_.max_instances) {
            return;
        }
        for (const auto& [id, instance] : instances_) {
            if (id != new_instance_id && evicting_.count(id) == 0) {
                candidates.push_back(instance);
            }
        }
    }
    if (candidates.empty()) {
        return;
    }

    std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
        if (a->created_at != b->created_at) return a->created_at < b->created_at;
        return a->sequence < b->sequence;
    });

    // Oldest stopped instance first, otherwise the oldest overall
    std::shared_ptr<Instance> victim = candidates.front();
    for (const auto& candidate : candidates) {
        if (candidate->controller->status() == runtime::AgentStatus::STOPPED) {
            victim = candidate;
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (instances_.size() - evicting_.size() <= options_.max_instances ||
            instances_.count(victim->id) == 0 || !evicting_.insert(victim->id).second) {
            return;
        }
    }

    spdlog::info("Instance limit {} exceeded, evicting {}", options_.max_instances, victim->id);
    auto evict = [this, id = victim->id]() { dispose(id); };
    if (!executor_.submit("evict " + victim->id, evict)) {
        evict();
    }
}

void InstanceRegistry::emit(RegistryEventType type, const std::string& instance_id,
                            std::string kind, json data) {
    RegistryEventCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = event_callback_;
    }
    if (callback) {
        callback(RegistryEvent{type, instance_id, std::move(kind), std::move(data)});
    }
}

} // namespace foreman::registry
