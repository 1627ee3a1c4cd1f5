#include "runtime/subprocess.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace foreman::runtime {

namespace {

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

} // namespace

std::string CommandResult::combined_output() const {
    std::string stdout_part = trim(out);
    std::string stderr_part = trim(err);
    if (stdout_part.empty()) return stderr_part;
    if (stderr_part.empty()) return stdout_part;
    return stdout_part + "\n" + stderr_part;
}

CommandResult run_command(const std::vector<std::string>& argv,
                          const std::filesystem::path& cwd) {
    CommandResult result;
    if (argv.empty()) {
        result.err = "empty command";
        return result;
    }

    // No allocation between fork and exec
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) < 0 || pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        result.err = std::string("pipe failed: ") + std::strerror(errno);
        spdlog::error("Failed to create pipes for '{}': {}", argv[0], std::strerror(errno));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.err = std::string("fork failed: ") + std::strerror(errno);
        spdlog::error("Failed to fork '{}': {}", argv[0], std::strerror(errno));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return result;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            dprintf(STDERR_FILENO, "cannot chdir to %s: %s\n", cwd.c_str(), std::strerror(errno));
            _exit(126);
        }

        execvp(args[0], args.data());
        dprintf(STDERR_FILENO, "cannot exec %s: %s\n", args[0], std::strerror(errno));
        _exit(127);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    result.launched = true;

    struct pollfd fds[2];
    fds[0].fd = stdout_pipe[0];
    fds[0].events = POLLIN;
    fds[1].fd = stderr_pipe[0];
    fds[1].events = POLLIN;

    char chunk[4096];
    int open_fds = 2;
    while (open_fds > 0) {
        int ret = poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll failed while running '{}': {}", argv[0], std::strerror(errno));
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t n = read(fds[i].fd, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
                continue;
            }
            (i == 0 ? result.out : result.err).append(chunk, static_cast<size_t>(n));
        }
    }

    for (auto& pfd : fds) {
        if (pfd.fd >= 0) close(pfd.fd);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("waitpid failed for '{}': {}", argv[0], std::strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }

    spdlog::debug("'{}' exited (code={}, signal={})", argv[0], result.exit_code, result.signal);
    return result;
}

CommandResult run_shell(const std::string& command, const std::filesystem::path& cwd) {
    return run_command({"/bin/sh", "-c", command}, cwd);
}

std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace foreman::runtime
