#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace foreman::runtime {

// Outcome of a finished child process.
struct CommandResult {
    bool launched = false;   // pipes/fork succeeded
    int exit_code = -1;      // -1 when killed by a signal
    int signal = 0;
    std::string out;
    std::string err;

    bool ok() const { return launched && exit_code == 0; }

    // Trimmed stdout and stderr joined by a newline, skipping empty parts.
    std::string combined_output() const;
};

// Run argv[0] (PATH lookup) with stdin from /dev/null and wait for it.
// An empty cwd keeps the caller's working directory.
CommandResult run_command(const std::vector<std::string>& argv,
                          const std::filesystem::path& cwd = {});

// Run a command line through /bin/sh -c.
CommandResult run_shell(const std::string& command,
                        const std::filesystem::path& cwd = {});

// Single-quote a value for safe interpolation into a shell command line.
std::string shell_quote(const std::string& value);

} // namespace foreman::runtime
