#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "registry/instance_registry.hpp"
#include "worker/types.hpp"

namespace foreman::worker {

struct ProcessAgentRunnerOptions {
    std::string instance_id;                  // registry id used for every run
    std::string command;
    std::vector<std::string> args;            // "{taskId}" and "{taskTitle}" are replaced per task
    std::map<std::string, std::string> env;
    std::shared_ptr<registry::InstanceRegistry> registry;   // optional, a private one otherwise
};

// Runs the agent inside the task worktree as a registry instance, so its
// events are forwarded, tracked and checkpointed. The instance is disposed
// when the run ends.
class ProcessAgentRunner : public AgentRunner {
public:
    explicit ProcessAgentRunner(ProcessAgentRunnerOptions options);

    // Throws when the instance cannot be created or started
    RunAgentResult run(const std::filesystem::path& cwd, const ReadyTask& task) override;

    // Kills the in-flight agent. Permanent: later runs return without starting.
    void cancel() override;

    const std::shared_ptr<registry::InstanceRegistry>& registry() const { return options_.registry; }

private:
    ProcessAgentRunnerOptions options_;

    std::mutex mutex_;
    bool cancelled_ = false;
    std::shared_ptr<runtime::AgentController> current_;
};

// Substitute task placeholders into agent arguments
std::vector<std::string> expand_agent_args(const std::vector<std::string>& args,
                                           const ReadyTask& task);

} // namespace foreman::worker
