#include "worker/command_task_source.hpp"
#include "runtime/subprocess.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace foreman::worker {

std::optional<ReadyTask> parse_ready_task(const std::string& output) {
    if (output.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }

    json parsed;
    try {
        parsed = json::parse(output);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Ready command returned invalid JSON: ") + e.what());
    }

    if (parsed.is_array()) {
        if (parsed.empty()) {
            return std::nullopt;
        }
        parsed = parsed.front();
    }

    if (!parsed.is_object() || !parsed.contains("id") || !parsed["id"].is_string()) {
        throw std::runtime_error("Ready command returned a task without an id");
    }

    ReadyTask task;
    task.id = parsed["id"].get<std::string>();
    if (parsed.contains("title") && parsed["title"].is_string()) {
        task.title = parsed["title"].get<std::string>();
    }
    return task;
}

CommandTaskSource::CommandTaskSource(CommandTaskSourceOptions options)
    : options_(std::move(options)) {}

std::optional<ReadyTask> CommandTaskSource::get_ready_task() {
    auto result = runtime::run_shell(options_.ready_command, options_.cwd);
    if (!result.ok()) {
        throw std::runtime_error("Ready command failed: " + result.combined_output());
    }
    return parse_ready_task(result.out);
}

void CommandTaskSource::claim_task(const std::string& task_id) {
    run_for_task(options_.claim_command, task_id, "claim");
}

void CommandTaskSource::close_task(const std::string& task_id) {
    run_for_task(options_.close_command, task_id, "close");
}

void CommandTaskSource::run_for_task(const std::string& command, const std::string& task_id,
                                     const char* action) {
    std::string line = command;
    std::string quoted = runtime::shell_quote(task_id);
    size_t pos = 0;
    while ((pos = line.find("{id}", pos)) != std::string::npos) {
        line.replace(pos, 4, quoted);
        pos += quoted.size();
    }

    auto result = runtime::run_shell(line, options_.cwd);
    if (!result.ok()) {
        throw std::runtime_error("Failed to " + std::string(action) + " task " + task_id + ": " +
                                 result.combined_output());
    }
    spdlog::debug("Ran {} command for task {}", action, task_id);
}

} // namespace foreman::worker
