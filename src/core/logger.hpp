#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace foreman::core {

// Initialize logging with console output
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Map "trace".."off" to a spdlog level; unknown names fall back to info.
spdlog::level::level_enum log_level_from_string(const std::string& name);

} // namespace foreman::core
