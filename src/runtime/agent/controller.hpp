#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "runtime/agent/types.hpp"

namespace foreman::runtime {

constexpr std::chrono::milliseconds kDefaultStopTimeout{5000};

// Listeners for one controller. Empty members are skipped.
struct ControllerCallbacks {
    std::function<void(const nlohmann::json& event)> on_event;
    std::function<void(AgentStatus status)> on_status;
    std::function<void(const std::string& line)> on_output;
    std::function<void(const std::string& message)> on_error;
    std::function<void(const ExitInfo& info)> on_exit;
};

// Control surface of one agent process. Callbacks may arrive on an
// internal reader thread.
class AgentController {
public:
    virtual ~AgentController() = default;

    // Spawn the process; throws std::runtime_error on failure
    virtual void start() = 0;

    // SIGTERM, then SIGKILL once the timeout expires
    virtual void stop(std::chrono::milliseconds timeout) = 0;

    virtual void pause() = 0;
    virtual void resume() = 0;

    // Ask the agent to exit once its current task is done
    virtual void stop_after_current() = 0;

    // Write one JSON line to the agent; throws when not running
    virtual void send(const nlohmann::json& payload) = 0;

    virtual bool can_accept_messages() const = 0;
    virtual bool is_running() const = 0;
    virtual AgentStatus status() const = 0;

    // Block until the process has exited; false if the timeout expired first
    virtual bool wait_for_exit(std::optional<std::chrono::milliseconds> timeout = std::nullopt) = 0;

    // Exit information of the last run
    virtual std::optional<ExitInfo> last_exit() const = 0;

    virtual void set_callbacks(ControllerCallbacks callbacks) = 0;
    virtual void clear_callbacks() = 0;
};

} // namespace foreman::runtime
