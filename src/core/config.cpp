#include "core/config.hpp"
#include "core/paths.hpp"
#include <cstdlib>
#include <limits>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace foreman::core::config {

namespace {

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2) {
        char first = value.front();
        char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

void apply_dotenv_file(const std::filesystem::path& env_path) {
    std::ifstream file(env_path);
    std::string line;
    int applied = 0;

    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = unquote(trim(line.substr(eq_pos + 1)));

        if (!key.empty() && std::getenv(key.c_str()) == nullptr) {
            setenv(key.c_str(), value.c_str(), 0);
            applied++;
        }
    }

    spdlog::debug("Loaded {} variable(s) from {}", applied, env_path.string());
}

// Negative values become 0, values past the range saturate
uint32_t to_u32(int64_t value) {
    if (value < 0) return 0;
    if (value > std::numeric_limits<uint32_t>::max()) return std::numeric_limits<uint32_t>::max();
    return static_cast<uint32_t>(value);
}

} // namespace

void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths) {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    std::vector<std::filesystem::path> search_paths = paths::config_search_paths();
    for (const auto& p : extra_search_paths) {
        search_paths.push_back(p);
    }

    for (const auto& base : search_paths) {
        auto env_path = base / ".env";
        std::error_code ec;
        if (std::filesystem::is_regular_file(env_path, ec)) {
            apply_dotenv_file(env_path);
            break;
        }
    }
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

int64_t get_env_int(const std::string& key, int64_t fallback) {
    auto value = trim(get_env(key));
    if (value.empty()) {
        return fallback;
    }
    try {
        size_t consumed = 0;
        int64_t parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            spdlog::warn("Ignoring {}={}: not an integer", key, value);
            return fallback;
        }
        return parsed;
    } catch (const std::exception&) {
        spdlog::warn("Ignoring {}={}: not an integer", key, value);
        return fallback;
    }
}

std::vector<std::string> split_list(const std::string& value, char separator) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, separator)) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::vector<std::string> split_args(const std::string& value) {
    std::vector<std::string> args;
    std::istringstream stream(value);
    std::string arg;
    while (stream >> arg) {
        args.push_back(arg);
    }
    return args;
}

Settings load_settings() {
    Settings settings;

    auto workspace = get_env("FOREMAN_WORKSPACE");
    if (workspace.empty()) {
        std::error_code ec;
        settings.workspace = std::filesystem::current_path(ec);
    } else {
        settings.workspace = std::filesystem::path(workspace);
    }

    auto workers = split_list(get_env("FOREMAN_WORKERS"), ',');
    if (!workers.empty()) {
        settings.workers = workers;
    }

    int64_t max_instances = get_env_int("FOREMAN_MAX_INSTANCES", settings.max_instances);
    settings.max_instances = to_u32(max_instances);

    settings.agent_command = get_env_or("FOREMAN_AGENT_COMMAND", settings.agent_command);
    auto agent_args = get_env("FOREMAN_AGENT_ARGS");
    if (!agent_args.empty()) {
        settings.agent_args = split_args(agent_args);
    }

    settings.test_command = get_env("FOREMAN_TEST_COMMAND");
    settings.ready_command = get_env_or("FOREMAN_READY_COMMAND", settings.ready_command);
    settings.claim_command = get_env_or("FOREMAN_CLAIM_COMMAND", settings.claim_command);
    settings.close_command = get_env_or("FOREMAN_CLOSE_COMMAND", settings.close_command);

    int64_t max_attempts = get_env_int("FOREMAN_MAX_ATTEMPTS", settings.max_attempts);
    settings.max_attempts = to_u32(max_attempts);

    int64_t poll_ms = get_env_int("FOREMAN_PAUSE_POLL_MS", settings.pause_poll_ms);
    settings.pause_poll_ms = poll_ms <= 0 ? 100 : to_u32(poll_ms);

    int64_t idle_ms = get_env_int("FOREMAN_IDLE_POLL_MS", settings.idle_poll_ms);
    settings.idle_poll_ms = to_u32(idle_ms);

    settings.branch_prefix = get_env_or("FOREMAN_BRANCH_PREFIX", settings.branch_prefix);
    settings.log_level = get_env_or("FOREMAN_LOG_LEVEL", settings.log_level);

    return settings;
}

} // namespace foreman::core::config
