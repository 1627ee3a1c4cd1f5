#include "worker/process_agent_runner.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace foreman::worker {

namespace {

void replace_all(std::string& value, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = value.find(from, pos)) != std::string::npos) {
        value.replace(pos, from.size(), to);
        pos += to.size();
    }
}

int exit_code_of(const std::optional<runtime::ExitInfo>& exit) {
    if (exit && exit->code) return *exit->code;
    if (exit && exit->signal) return 128 + *exit->signal;
    return -1;
}

} // namespace

std::vector<std::string> expand_agent_args(const std::vector<std::string>& args,
                                           const ReadyTask& task) {
    std::vector<std::string> expanded;
    expanded.reserve(args.size());
    for (auto arg : args) {
        replace_all(arg, "{taskId}", task.id);
        replace_all(arg, "{taskTitle}", task.title);
        expanded.push_back(std::move(arg));
    }
    return expanded;
}

ProcessAgentRunner::ProcessAgentRunner(ProcessAgentRunnerOptions options)
    : options_(std::move(options)) {
    if (options_.instance_id.empty()) {
        throw std::invalid_argument("ProcessAgentRunner requires an instance id");
    }
    if (!options_.registry) {
        registry::RegistryOptions registry_options;
        registry_options.max_instances = 0;
        registry_options.background_threads = 1;
        options_.registry = std::make_shared<registry::InstanceRegistry>(std::move(registry_options));
        options_.registry->set_event_callback([](const registry::RegistryEvent& event) {
            if (event.kind == "ralph:output") {
                spdlog::info("[{}] {}", event.instance_id, event.data.get<std::string>());
            } else if (event.kind == "ralph:error") {
                spdlog::warn("[{}] {}", event.instance_id, event.data.get<std::string>());
            }
        });
    }
}

RunAgentResult ProcessAgentRunner::run(const std::filesystem::path& cwd, const ReadyTask& task) {
    const std::string& id = options_.instance_id;
    auto& registry = *options_.registry;

    runtime::AgentOptions agent_options;
    agent_options.command = options_.command;
    agent_options.args = expand_agent_args(options_.args, task);
    agent_options.env = options_.env;
    agent_options.env["FOREMAN_TASK_ID"] = task.id;
    agent_options.env["FOREMAN_TASK_TITLE"] = task.title;

    registry::CreateInstanceOptions create;
    create.id = id;
    create.name = id;
    create.agent_name = options_.command;
    create.worktree_path = cwd;
    create.agent_options = std::move(agent_options);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            spdlog::info("Agent runner {} cancelled, not starting task {}", id, task.id);
            return RunAgentResult{-1, ""};
        }
    }

    // Registry callbacks may call cancel(), so mutex_ is not held here
    registry.create(create);
    auto controller = registry.controller(id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = controller;
    }

    auto release = [this, &registry, &id]() {
        registry.dispose(id);
        std::lock_guard<std::mutex> lock(mutex_);
        current_.reset();
    };

    try {
        if (!controller) {
            throw std::runtime_error("Instance " + id + " was evicted before it started");
        }
        controller->start();
    } catch (const std::exception&) {
        release();
        throw;
    }

    // A cancel that landed while start() ran found nothing to stop yet
    bool cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled = cancelled_;
    }
    if (cancelled) {
        controller->stop(runtime::kDefaultStopTimeout);
    }

    controller->wait_for_exit();

    RunAgentResult result;
    result.exit_code = exit_code_of(controller->last_exit());
    if (auto info = registry.get(id)) {
        result.session_id = info->session_id.value_or("");
    }

    release();
    return result;
}

void ProcessAgentRunner::cancel() {
    std::shared_ptr<runtime::AgentController> controller;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        controller = current_;
    }
    if (controller) {
        spdlog::info("Cancelling agent {}", options_.instance_id);
        controller->stop(runtime::kDefaultStopTimeout);
    }
}

} // namespace foreman::worker
