#include "runtime/agent/types.hpp"

namespace foreman::runtime {

const char* agent_status_to_string(AgentStatus status) {
    switch (status) {
        case AgentStatus::STOPPED:                return "stopped";
        case AgentStatus::STARTING:               return "starting";
        case AgentStatus::RUNNING:                return "running";
        case AgentStatus::PAUSING:                return "pausing";
        case AgentStatus::PAUSED:                 return "paused";
        case AgentStatus::STOPPING:               return "stopping";
        case AgentStatus::STOPPING_AFTER_CURRENT: return "stopping_after_current";
        default: return "unknown";
    }
}

AgentStatus agent_status_from_string(const std::string& str) {
    if (str == "starting") return AgentStatus::STARTING;
    if (str == "running") return AgentStatus::RUNNING;
    if (str == "pausing") return AgentStatus::PAUSING;
    if (str == "paused") return AgentStatus::PAUSED;
    if (str == "stopping") return AgentStatus::STOPPING;
    if (str == "stopping_after_current") return AgentStatus::STOPPING_AFTER_CURRENT;
    return AgentStatus::STOPPED;
}

} // namespace foreman::runtime
