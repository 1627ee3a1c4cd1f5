/**
 * Foreman Agent Process
 *
 * Runs an agent command as a child process. The agent writes one JSON
 * event per stdout line and accepts JSON control messages on stdin.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <sys/types.h>
#include "runtime/agent/controller.hpp"

namespace foreman::runtime {

constexpr std::chrono::milliseconds kPauseTimeout{10000};

class AgentProcess : public AgentController {
public:
    explicit AgentProcess(AgentOptions options);
    ~AgentProcess() override;

    // Non-copyable
    AgentProcess(const AgentProcess&) = delete;
    AgentProcess& operator=(const AgentProcess&) = delete;

    void start() override;
    void stop(std::chrono::milliseconds timeout = kDefaultStopTimeout) override;
    void pause() override;
    void resume() override;
    void stop_after_current() override;
    void send(const nlohmann::json& payload) override;

    bool can_accept_messages() const override;
    bool is_running() const override;
    AgentStatus status() const override;

    void set_callbacks(ControllerCallbacks callbacks) override;
    void clear_callbacks() override;

    bool wait_for_exit(std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;
    std::optional<ExitInfo> last_exit() const override;

    pid_t pid() const { return pid_; }
    const AgentOptions& options() const { return options_; }

private:
    AgentOptions options_;

    // Child process handles
    std::atomic<pid_t> pid_{-1};
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::mutex write_mutex_;

    // Status and exit tracking
    mutable std::mutex state_mutex_;
    std::condition_variable exit_cv_;
    AgentStatus status_ = AgentStatus::STOPPED;
    bool exited_ = true;
    std::optional<ExitInfo> last_exit_;
    std::chrono::steady_clock::time_point pause_deadline_;

    mutable std::mutex callbacks_mutex_;
    ControllerCallbacks callbacks_;

    std::thread reader_thread_;
    std::thread::id reader_id_;   // guarded by state_mutex_

    // Internal methods
    void reader_loop();
    void handle_stdout_line(const std::string& line);
    void handle_stderr_line(const std::string& line);
    void finish(int wait_status);
    void set_status(AgentStatus status);
    void check_pause_timeout();
    void join_reader();
    ControllerCallbacks snapshot_callbacks() const;
};

} // namespace foreman::runtime
