#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "conversation/context.hpp"

namespace foreman::persistence {

constexpr int kIterationStateVersion = 1;
constexpr std::chrono::milliseconds kStaleStateThreshold{60 * 60 * 1000};

// Resumable snapshot of one instance
struct PersistedIterationState {
    std::string instance_id;
    conversation::ConversationContext conversation_context;
    std::string status;
    std::optional<std::string> current_task_id;
    int64_t saved_at = 0;
    int version = kIterationStateVersion;
};

void to_json(nlohmann::json& j, const PersistedIterationState& state);
void from_json(const nlohmann::json& j, PersistedIterationState& state);

// Durable store keyed by instance id. save() throws on I/O failure.
class IterationStateStore {
public:
    virtual ~IterationStateStore() = default;

    virtual void save(const PersistedIterationState& state) = 0;
    virtual std::optional<PersistedIterationState> load(const std::string& instance_id) = 0;

    // False when nothing was stored for the id
    virtual bool erase(const std::string& instance_id) = 0;
};

// One JSON file per instance under <workspace>/.foreman/iterations
class FileIterationStateStore : public IterationStateStore {
public:
    explicit FileIterationStateStore(const std::filesystem::path& workspace);

    // Stamps saved_at and version, then writes atomically
    void save(const PersistedIterationState& state) override;

    // Missing, unreadable, malformed or unknown-version files load as nothing
    std::optional<PersistedIterationState> load(const std::string& instance_id) override;

    bool erase(const std::string& instance_id) override;

    bool has(const std::string& instance_id) const;
    std::vector<PersistedIterationState> get_all();
    std::vector<std::string> get_all_instance_ids() const;
    size_t count() const;

    // Remove states saved longer ago than the threshold; returns how many
    size_t cleanup_stale(std::chrono::milliseconds threshold = kStaleStateThreshold);

    void clear();

    const std::filesystem::path& directory() const { return dir_; }

private:
    std::filesystem::path dir_;

    std::filesystem::path state_path(const std::string& instance_id) const;
    static bool is_valid_id(const std::string& instance_id);
};

} // namespace foreman::persistence
