#pragma once
#include <filesystem>
#include <string>
#include "worker/types.hpp"

namespace foreman::worker {

struct CommandTaskSourceOptions {
    std::string ready_command;   // prints a JSON task object or array
    std::string claim_command;   // "{id}" is replaced by the quoted task id
    std::string close_command;
    std::filesystem::path cwd;
};

// Task source backed by an issue-tracker CLI
class CommandTaskSource : public TaskSource {
public:
    explicit CommandTaskSource(CommandTaskSourceOptions options);

    std::optional<ReadyTask> get_ready_task() override;
    void claim_task(const std::string& task_id) override;
    void close_task(const std::string& task_id) override;

private:
    CommandTaskSourceOptions options_;

    void run_for_task(const std::string& command, const std::string& task_id, const char* action);
};

// Parse ready-command output: an object or the first element of an array
std::optional<ReadyTask> parse_ready_task(const std::string& output);

} // namespace foreman::worker
