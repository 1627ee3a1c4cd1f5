#include "persistence/iteration_state_store.hpp"
#include "core/clock.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace foreman::persistence {

void to_json(json& j, const PersistedIterationState& state) {
    j = json{
        {"instanceId", state.instance_id},
        {"conversationContext", state.conversation_context},
        {"status", state.status},
        {"currentTaskId", state.current_task_id ? json(*state.current_task_id) : json(nullptr)},
        {"savedAt", state.saved_at},
        {"version", state.version}
    };
}

void from_json(const json& j, PersistedIterationState& state) {
    state.instance_id = j.at("instanceId").get<std::string>();
    state.conversation_context = j.at("conversationContext").get<conversation::ConversationContext>();
    state.status = j.value("status", "stopped");
    state.current_task_id.reset();
    if (j.contains("currentTaskId") && j["currentTaskId"].is_string()) {
        state.current_task_id = j["currentTaskId"].get<std::string>();
    }
    state.saved_at = j.value("savedAt", int64_t{0});
    state.version = j.value("version", 0);
}

FileIterationStateStore::FileIterationStateStore(const fs::path& workspace)
    : dir_(core::paths::iterations_dir(workspace)) {}

bool FileIterationStateStore::is_valid_id(const std::string& instance_id) {
    return !instance_id.empty() && instance_id != "." && instance_id != ".." &&
           instance_id.find('/') == std::string::npos;
}

fs::path FileIterationStateStore::state_path(const std::string& instance_id) const {
    return dir_ / (instance_id + ".json");
}

void FileIterationStateStore::save(const PersistedIterationState& state) {
    if (!is_valid_id(state.instance_id)) {
        throw std::invalid_argument("Invalid instance id: '" + state.instance_id + "'");
    }

    PersistedIterationState stamped = state;
    stamped.saved_at = core::now_ms();
    stamped.version = kIterationStateVersion;

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw std::runtime_error("Failed to create " + dir_.string() + ": " + ec.message());
    }

    fs::path target = state_path(state.instance_id);
    fs::path tmp = target;
    tmp += ".tmp." + std::to_string(getpid());

    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Failed to open " + tmp.string() + " for writing");
        }
        file << json(stamped).dump(2);
        if (!file) {
            throw std::runtime_error("Failed to write " + tmp.string());
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error("Failed to replace " + target.string());
    }

    spdlog::debug("Saved iteration state for instance {}", state.instance_id);
}

std::optional<PersistedIterationState> FileIterationStateStore::load(const std::string& instance_id) {
    if (!is_valid_id(instance_id)) {
        return std::nullopt;
    }

    fs::path path = state_path(instance_id);
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }

    try {
        json j = json::parse(file);

        if (!j.is_object() || j.value("version", 0) != kIterationStateVersion) {
            spdlog::warn("Unknown iteration state version for instance {}, ignoring", instance_id);
            return std::nullopt;
        }

        if (!j.contains("instanceId") || !j["instanceId"].is_string() ||
            j["instanceId"].get<std::string>().empty() ||
            !j.contains("conversationContext") || !j["conversationContext"].is_object()) {
            spdlog::warn("Malformed iteration state for instance {}, ignoring", instance_id);
            return std::nullopt;
        }

        return j.get<PersistedIterationState>();
    } catch (const json::exception& e) {
        spdlog::warn("Error loading iteration state for instance {}: {}", instance_id, e.what());
        return std::nullopt;
    }
}

bool FileIterationStateStore::erase(const std::string& instance_id) {
    if (!is_valid_id(instance_id)) {
        return false;
    }

    std::error_code ec;
    bool removed = fs::remove(state_path(instance_id), ec);
    if (ec) {
        spdlog::warn("Failed to delete iteration state for instance {}: {}", instance_id, ec.message());
        return false;
    }
    return removed;
}

bool FileIterationStateStore::has(const std::string& instance_id) const {
    std::error_code ec;
    return is_valid_id(instance_id) && fs::exists(state_path(instance_id), ec);
}

std::vector<std::string> FileIterationStateStore::get_all_instance_ids() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return ids;
    }

    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        const fs::path& path = entry.path();
        if (entry.is_regular_file(ec) && path.extension() == ".json") {
            ids.push_back(path.stem().string());
        }
    }
    return ids;
}

std::vector<PersistedIterationState> FileIterationStateStore::get_all() {
    std::vector<PersistedIterationState> states;
    for (const auto& id : get_all_instance_ids()) {
        if (auto state = load(id)) {
            states.push_back(std::move(*state));
        }
    }
    return states;
}

size_t FileIterationStateStore::count() const {
    return get_all_instance_ids().size();
}

size_t FileIterationStateStore::cleanup_stale(std::chrono::milliseconds threshold) {
    int64_t now = core::now_ms();
    size_t removed = 0;

    for (const auto& id : get_all_instance_ids()) {
        auto state = load(id);
        if (!state) {
            continue;
        }
        int64_t age = now - state->saved_at;
        if (age > threshold.count()) {
            spdlog::info("Removing stale iteration state for instance {} (age: {}m)", id, age / 1000 / 60);
            if (erase(id)) {
                removed++;
            }
        }
    }
    return removed;
}

void FileIterationStateStore::clear() {
    for (const auto& id : get_all_instance_ids()) {
        erase(id);
    }
}

} // namespace foreman::persistence
