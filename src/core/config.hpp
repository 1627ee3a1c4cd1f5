#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace foreman::core::config {

// Load environment variables from a .env file (idempotent).
// Variables already present in the environment are never overridden.
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Integer environment variable; fallback when missing or unparsable.
int64_t get_env_int(const std::string& key, int64_t fallback);

// Split on a separator, trimming whitespace and dropping empty items.
std::vector<std::string> split_list(const std::string& value, char separator);

// Split a command line on whitespace.
std::vector<std::string> split_args(const std::string& value);

// Runtime settings for the orchestrator, read from FOREMAN_* variables.
struct Settings {
    std::filesystem::path workspace;
    std::vector<std::string> workers = {"homer"};
    uint32_t max_instances = 10;

    std::string agent_command = "claude";
    std::vector<std::string> agent_args = {"-p", "--output-format", "stream-json", "--verbose"};

    std::string test_command;  // empty = no test hook
    std::string ready_command = "bd ready --json --limit 1";
    std::string claim_command = "bd update {id} --status in_progress";
    std::string close_command = "bd close {id}";

    uint32_t max_attempts = 0;      // 0 = retry forever
    uint32_t pause_poll_ms = 100;
    uint32_t idle_poll_ms = 5000;   // daemon wait before re-polling an empty queue
    std::string branch_prefix = "foreman/";
    std::string log_level = "info";
};

// Build settings from the environment (call load_dotenv first).
Settings load_settings();

} // namespace foreman::core::config
