/**
 * foremand - runs autonomous coding-agent workers against a git workspace
 *
 * Configuration comes from FOREMAN_* environment variables and .env files.
 * First SIGINT/SIGTERM: finish the current step and exit.
 * Second signal: kill in-flight agents and exit.
 */
#include <atomic>
#include <chrono>
#include <csignal>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>
#include "core/config.hpp"
#include "core/logger.hpp"
#include "persistence/iteration_state_store.hpp"
#include "registry/instance_registry.hpp"
#include "worker/command_task_source.hpp"
#include "worker/command_test_runner.hpp"
#include "worker/process_agent_runner.hpp"
#include "worker/worker_loop.hpp"
#include "workspace/worktree_manager.hpp"

using namespace foreman;

// Async-signal-safe: only count, the main thread reacts
static volatile sig_atomic_t g_signal_count = 0;

static void signal_handler(int) {
    if (g_signal_count < 2) {
        g_signal_count = g_signal_count + 1;
    }
}

static void log_worker_event(const worker::WorkerEvent& event) {
    const char* type = worker::worker_event_type_to_string(event.type);
    if (event.type == worker::WorkerEventType::ERROR) {
        spdlog::error("[{}] {} {}", event.worker_name, type, event.data.dump());
    } else if (event.type == worker::WorkerEventType::IDLE) {
        spdlog::debug("[{}] {}", event.worker_name, type);
    } else {
        spdlog::info("[{}] {} {}", event.worker_name, type, event.data.dump());
    }
}

static void log_registry_event(const registry::RegistryEvent& event) {
    if (event.type != registry::RegistryEventType::INSTANCE_EVENT) {
        spdlog::debug("[{}] {}", event.instance_id, registry::registry_event_type_to_string(event.type));
        return;
    }
    if (event.kind == "ralph:output" && event.data.is_string()) {
        spdlog::info("[{}] {}", event.instance_id, event.data.get<std::string>());
    } else if (event.kind == "ralph:error" && event.data.is_string()) {
        spdlog::warn("[{}] {}", event.instance_id, event.data.get<std::string>());
    } else if (event.kind == "ralph:exit") {
        spdlog::debug("[{}] agent exited {}", event.instance_id, event.data.dump());
    }
}

int main() {
    core::config::load_dotenv();
    auto settings = core::config::load_settings();

    core::init_logger();
    core::set_log_level(core::log_level_from_string(settings.log_level));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    spdlog::info("foremand starting in {} with {} worker(s)",
                 settings.workspace.string(), settings.workers.size());

    auto state_store = std::make_shared<persistence::FileIterationStateStore>(settings.workspace);
    size_t stale = state_store->cleanup_stale();
    if (stale > 0) {
        spdlog::info("Removed {} stale iteration state file(s)", stale);
    }

    registry::RegistryOptions registry_options;
    registry_options.main_workspace = settings.workspace;
    registry_options.max_instances = settings.max_instances;
    registry_options.state_store = state_store;
    auto instances = std::make_shared<registry::InstanceRegistry>(std::move(registry_options));
    instances->set_event_callback(log_registry_event);

    auto workspace = std::make_shared<workspace::GitWorktreeManager>(settings.workspace,
                                                                     settings.branch_prefix);

    auto task_source = std::make_shared<worker::CommandTaskSource>(worker::CommandTaskSourceOptions{
        settings.ready_command, settings.claim_command, settings.close_command, settings.workspace});

    std::shared_ptr<worker::TestRunner> test_runner;
    if (!settings.test_command.empty()) {
        test_runner = std::make_shared<worker::CommandTestRunner>(settings.test_command, settings.workspace);
    }

    std::vector<std::unique_ptr<worker::WorkerLoop>> loops;
    for (const auto& name : settings.workers) {
        worker::WorkerLoopOptions options;
        options.worker_name = name;
        options.task_source = task_source;
        options.workspace = workspace;
        worker::ProcessAgentRunnerOptions runner_options;
        runner_options.instance_id = name;
        runner_options.command = settings.agent_command;
        runner_options.args = settings.agent_args;
        runner_options.env = {{"FOREMAN_WORKER", name}};
        runner_options.registry = instances;
        options.agent_runner = std::make_shared<worker::ProcessAgentRunner>(std::move(runner_options));
        options.test_runner = test_runner;
        options.max_attempts = settings.max_attempts;
        options.pause_poll_interval = std::chrono::milliseconds(settings.pause_poll_ms);

        auto loop = std::make_unique<worker::WorkerLoop>(std::move(options));
        loop->set_event_callback(log_worker_event);
        loops.push_back(std::move(loop));
    }

    std::atomic<size_t> running{loops.size()};
    std::vector<std::thread> threads;
    const auto idle_poll = std::chrono::milliseconds(settings.idle_poll_ms);

    for (auto& loop : loops) {
        threads.emplace_back([&running, idle_poll, loop = loop.get()]() {
            while (!loop->is_stopped()) {
                loop->run_loop();

                // Queue ran dry: wait before asking the task source again
                auto deadline = std::chrono::steady_clock::now() + idle_poll;
                while (!loop->is_stopped() && std::chrono::steady_clock::now() < deadline) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
            }
            running--;
        });
    }

    int handled_signals = 0;
    while (running > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        int signals = g_signal_count;
        if (signals > handled_signals) {
            handled_signals = signals;
            if (signals == 1) {
                spdlog::info("Shutdown requested, workers stop after the current step "
                             "(signal again to force)");
                for (auto& loop : loops) loop->stop();
            } else {
                spdlog::warn("Forcing shutdown, killing in-flight agents");
                for (auto& loop : loops) loop->force_stop();
            }
        }
    }

    for (auto& thread : threads) {
        thread.join();
    }
    instances->dispose_all();

    spdlog::info("foremand stopped");
    return 0;
}
