#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace foreman::runtime {

// Lifecycle of an agent process
enum class AgentStatus {
    STOPPED,
    STARTING,
    RUNNING,
    PAUSING,
    PAUSED,
    STOPPING,
    STOPPING_AFTER_CURRENT
};

// Wire names ("stopped", "stopping_after_current", ...)
const char* agent_status_to_string(AgentStatus status);
AgentStatus agent_status_from_string(const std::string& str);

// How an agent process ended
struct ExitInfo {
    std::optional<int> code;     // set when the process exited normally
    std::optional<int> signal;   // set when it was killed by a signal
};

// Agent process configuration
struct AgentOptions {
    std::filesystem::path cwd;              // empty = process cwd
    std::string command = "claude";
    std::vector<std::string> args;
    std::map<std::string, std::string> env; // added to the inherited environment
};

} // namespace foreman::runtime
