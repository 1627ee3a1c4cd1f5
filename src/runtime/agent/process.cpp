#include "runtime/agent/process.hpp"
#include "core/clock.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

using json = nlohmann::json;

namespace foreman::runtime {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

std::string event_type(const json& event) {
    auto it = event.find("type");
    if (it != event.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

} // namespace

AgentProcess::AgentProcess(AgentOptions options)
    : options_(std::move(options)) {}

AgentProcess::~AgentProcess() {
    if (is_running()) {
        stop();
    }
    join_reader();
}

void AgentProcess::start() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ != AgentStatus::STOPPED || !exited_) {
            throw std::runtime_error("Agent process is already running");
        }
    }
    join_reader();
    set_status(AgentStatus::STARTING);

    // Build argv and envp before forking
    std::vector<std::string> argv_storage;
    argv_storage.push_back(options_.command);
    argv_storage.insert(argv_storage.end(), options_.args.begin(), options_.args.end());

    std::vector<std::string> env_storage;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string value(*entry);
        if (options_.env.count(value.substr(0, value.find('='))) == 0) {
            env_storage.push_back(std::move(value));
        }
    }
    for (const auto& [key, value] : options_.env) {
        env_storage.push_back(key + "=" + value);
    }

    std::vector<char*> argv;
    for (auto& arg : argv_storage) argv.push_back(arg.data());
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (auto& var : env_storage) envp.push_back(var.data());
    envp.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (pipe2(stdin_pipe, O_CLOEXEC) < 0 || pipe2(stdout_pipe, O_CLOEXEC) < 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        std::string reason = std::strerror(errno);
        close_all();
        set_status(AgentStatus::STOPPED);
        throw std::runtime_error("Failed to create pipes for agent process: " + reason);
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::string reason = std::strerror(errno);
        close_all();
        set_status(AgentStatus::STOPPED);
        throw std::runtime_error("Failed to fork agent process: " + reason);
    }

    if (pid == 0) {
        // Child process
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        if (!options_.cwd.empty() && chdir(options_.cwd.c_str()) != 0) {
            dprintf(STDERR_FILENO, "cannot chdir to %s: %s\n",
                    options_.cwd.c_str(), std::strerror(errno));
            _exit(126);
        }

        execvpe(argv[0], argv.data(), envp.data());
        dprintf(STDERR_FILENO, "cannot exec %s: %s\n", argv[0], std::strerror(errno));
        _exit(127);
    }

    // Parent process
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        stdin_fd_ = stdin_pipe[1];
    }
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pid_ = pid;
        exited_ = false;
        last_exit_.reset();
        reader_id_ = std::thread::id();
    }

    spdlog::info("Agent process started: {} (pid={}, cwd={})", options_.command, pid,
                 options_.cwd.empty() ? "." : options_.cwd.string());

    set_status(AgentStatus::RUNNING);

    // The reader takes state_mutex_ before dispatching, so reader_id_ is set by then
    std::lock_guard<std::mutex> lock(state_mutex_);
    reader_thread_ = std::thread(&AgentProcess::reader_loop, this);
    reader_id_ = reader_thread_.get_id();
}

void AgentProcess::stop(std::chrono::milliseconds timeout) {
    pid_t pid;
    bool can_wait;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pid = pid_;
        if (exited_ || pid <= 0) {
            return;
        }
        // Nothing reaps the child until the reader runs, and the reader
        // cannot wait for itself
        can_wait = reader_id_ != std::thread::id() && std::this_thread::get_id() != reader_id_;
    }

    set_status(AgentStatus::STOPPING);
    kill(pid, SIGTERM);

    if (!can_wait) {
        return;
    }

    std::unique_lock<std::mutex> lock(state_mutex_);
    if (!exit_cv_.wait_for(lock, timeout, [this]() { return exited_; })) {
        spdlog::warn("Agent process {} ignored SIGTERM for {}ms, sending SIGKILL",
                     pid, timeout.count());
        kill(pid, SIGKILL);
        exit_cv_.wait(lock, [this]() { return exited_; });
    }
}

void AgentProcess::pause() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ != AgentStatus::RUNNING) {
            return;
        }
        pause_deadline_ = std::chrono::steady_clock::now() + kPauseTimeout;
    }

    set_status(AgentStatus::PAUSING);
    try {
        send({{"type", "pause"}});
    } catch (const std::exception&) {
        set_status(AgentStatus::RUNNING);
        throw;
    }
}

void AgentProcess::resume() {
    AgentStatus current = status();
    if (current != AgentStatus::PAUSED && current != AgentStatus::PAUSING) {
        return;
    }
    send({{"type", "resume"}});
}

void AgentProcess::stop_after_current() {
    AgentStatus current = status();
    if (current != AgentStatus::RUNNING && current != AgentStatus::PAUSING &&
        current != AgentStatus::PAUSED) {
        return;
    }
    set_status(AgentStatus::STOPPING_AFTER_CURRENT);
    send({{"type", "stop"}});
}

void AgentProcess::send(const json& payload) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0) {
        throw std::runtime_error("Agent process is not running");
    }

    std::string line = payload.dump() + "\n";
    size_t offset = 0;
    while (offset < line.size()) {
        ssize_t n = write(stdin_fd_, line.data() + offset, line.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(std::string("Failed to write to agent stdin: ") +
                                     std::strerror(errno));
        }
        offset += static_cast<size_t>(n);
    }
}

bool AgentProcess::can_accept_messages() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_ == AgentStatus::RUNNING || status_ == AgentStatus::PAUSING ||
           status_ == AgentStatus::PAUSED;
}

bool AgentProcess::is_running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_ != AgentStatus::STOPPED;
}

AgentStatus AgentProcess::status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_;
}

void AgentProcess::set_callbacks(ControllerCallbacks callbacks) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_ = std::move(callbacks);
}

void AgentProcess::clear_callbacks() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_ = ControllerCallbacks{};
}

bool AgentProcess::wait_for_exit(std::optional<std::chrono::milliseconds> timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    if (!timeout) {
        exit_cv_.wait(lock, [this]() { return exited_; });
        return true;
    }
    return exit_cv_.wait_for(lock, *timeout, [this]() { return exited_; });
}

std::optional<ExitInfo> AgentProcess::last_exit() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_exit_;
}

void AgentProcess::reader_loop() {
    std::string buffers[2];
    char chunk[4096];

    struct pollfd fds[2];
    fds[0].fd = stdout_fd_;
    fds[0].events = POLLIN;
    fds[1].fd = stderr_fd_;
    fds[1].events = POLLIN;

    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pid = pid_;
    }
    int wait_status = 0;
    bool reaped = false;
    int open_fds = 2;

    auto dispatch_lines = [this](std::string& buffer, bool from_stdout) {
        size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            if (from_stdout) {
                handle_stdout_line(line);
            } else {
                handle_stderr_line(line);
            }
        }
    };

    while (open_fds > 0) {
        check_pause_timeout();

        int ret = poll(fds, 2, reaped ? 0 : 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll failed on agent process {}: {}", pid, std::strerror(errno));
            break;
        }

        if (ret == 0) {
            // Descendants may hold the pipes open after the agent is gone
            if (reaped) break;
            if (waitpid(pid, &wait_status, WNOHANG) == pid) {
                reaped = true;
            }
            continue;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }

            ssize_t n = read(fds[i].fd, chunk, sizeof(chunk));
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            if (n <= 0) {
                close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
                continue;
            }

            buffers[i].append(chunk, static_cast<size_t>(n));
            dispatch_lines(buffers[i], i == 0);
        }
    }

    // Trailing output without a newline
    for (int i = 0; i < 2; ++i) {
        if (!buffers[i].empty()) {
            buffers[i] += '\n';
            dispatch_lines(buffers[i], i == 0);
        }
        if (fds[i].fd >= 0) {
            close(fds[i].fd);
        }
    }
    stdout_fd_ = -1;
    stderr_fd_ = -1;

    if (!reaped) {
        while (waitpid(pid, &wait_status, 0) < 0) {
            if (errno != EINTR) {
                spdlog::error("waitpid failed for agent process {}: {}", pid, std::strerror(errno));
                break;
            }
        }
    }

    finish(wait_status);
}

void AgentProcess::handle_stdout_line(const std::string& line) {
    json event;
    try {
        event = json::parse(line);
    } catch (const json::exception&) {
        event = nullptr;
    }

    auto callbacks = snapshot_callbacks();
    if (!event.is_object()) {
        if (callbacks.on_output) callbacks.on_output(line);
        return;
    }

    if (!event.contains("timestamp")) {
        event["timestamp"] = core::now_ms();
    }

    std::string type = event_type(event);
    if (type == "ralph_paused") {
        AgentStatus current = status();
        if (current == AgentStatus::PAUSING || current == AgentStatus::RUNNING) {
            set_status(AgentStatus::PAUSED);
        }
    } else if (type == "ralph_resumed") {
        AgentStatus current = status();
        if (current == AgentStatus::PAUSED || current == AgentStatus::PAUSING) {
            set_status(AgentStatus::RUNNING);
        }
    }

    if (callbacks.on_event) callbacks.on_event(event);
}

void AgentProcess::handle_stderr_line(const std::string& line) {
    spdlog::debug("agent stderr: {}", line);
    auto callbacks = snapshot_callbacks();
    if (callbacks.on_error) callbacks.on_error("stderr: " + line);
}

void AgentProcess::finish(int wait_status) {
    ExitInfo info;
    if (WIFEXITED(wait_status)) {
        info.code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        info.signal = WTERMSIG(wait_status);
    }

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        close_fd(stdin_fd_);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_exit_ = info;
        pid_ = -1;
    }

    spdlog::info("Agent process exited (code={}, signal={})",
                 info.code ? std::to_string(*info.code) : "none",
                 info.signal ? std::to_string(*info.signal) : "none");

    set_status(AgentStatus::STOPPED);
    auto callbacks = snapshot_callbacks();
    if (callbacks.on_exit) callbacks.on_exit(info);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        exited_ = true;
    }
    exit_cv_.notify_all();
}

void AgentProcess::set_status(AgentStatus status) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ == status) {
            return;
        }
        status_ = status;
    }

    spdlog::debug("Agent process status: {}", agent_status_to_string(status));
    auto callbacks = snapshot_callbacks();
    if (callbacks.on_status) callbacks.on_status(status);
}

void AgentProcess::check_pause_timeout() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ != AgentStatus::PAUSING ||
            std::chrono::steady_clock::now() < pause_deadline_) {
            return;
        }
    }
    spdlog::warn("Agent did not acknowledge pause within {}ms, marking paused",
                 kPauseTimeout.count());
    set_status(AgentStatus::PAUSED);
}

void AgentProcess::join_reader() {
    if (!reader_thread_.joinable()) {
        return;
    }
    if (reader_thread_.get_id() == std::this_thread::get_id()) {
        reader_thread_.detach();
    } else {
        reader_thread_.join();
    }
}

ControllerCallbacks AgentProcess::snapshot_callbacks() const {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    return callbacks_;
}

} // namespace foreman::runtime
