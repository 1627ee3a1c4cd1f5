/*
Agent process tests using /bin/sh scripts as stand-in agents.
*/
#include "runtime/agent/process.hpp"
#include "test_support.hpp"

#include <mutex>
#include <signal.h>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace foreman;
using namespace foreman::runtime;
using json = nlohmann::json;

namespace {

// Answers pause/resume/stop control messages the way a real agent does
const char* kInteractiveAgent =
    "echo '{\"type\":\"system\",\"sessionId\":\"s1\"}'\n"
    "while read line; do\n"
    "  case \"$line\" in\n"
    "    *'\"pause\"'*) echo '{\"type\":\"ralph_paused\"}' ;;\n"
    "    *'\"resume\"'*) echo '{\"type\":\"ralph_resumed\"}' ;;\n"
    "    *'\"stop\"'*) exit 3 ;;\n"
    "  esac\n"
    "done\n";

struct Recorder {
    std::mutex mutex;
    std::vector<json> events;
    std::vector<AgentStatus> statuses;
    std::vector<std::string> output;
    std::vector<std::string> errors;
    std::vector<ExitInfo> exits;

    ControllerCallbacks callbacks() {
        ControllerCallbacks cb;
        cb.on_event = [this](const json& event) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(event);
        };
        cb.on_status = [this](AgentStatus status) {
            std::lock_guard<std::mutex> lock(mutex);
            statuses.push_back(status);
        };
        cb.on_output = [this](const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex);
            output.push_back(line);
        };
        cb.on_error = [this](const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex);
            errors.push_back(message);
        };
        cb.on_exit = [this](const ExitInfo& info) {
            std::lock_guard<std::mutex> lock(mutex);
            exits.push_back(info);
        };
        return cb;
    }

    bool saw_status(AgentStatus status) {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto s : statuses) {
            if (s == status) return true;
        }
        return false;
    }
};

AgentOptions shell_agent(const std::string& script) {
    AgentOptions options;
    options.command = "/bin/sh";
    options.args = {"-c", script};
    return options;
}

} // namespace

static int test_stream_dispatch(void)
{
    test::TempDir dir;
    AgentOptions options = shell_agent(
        "echo '{\"type\":\"assistant\",\"content\":\"hi\",\"timestamp\":5}'\n"
        "echo '{\"type\":\"tick\"}'\n"
        "echo 'plain text'\n"
        "echo '[1,2]'\n"
        "echo \"cwd=$(pwd -P)\"\n"
        "echo \"task=$FOREMAN_TASK_ID\"\n"
        "echo 'oops' >&2\n"
        "printf 'no newline'\n"
        "exit 4\n");
    options.cwd = dir.path();
    options.env["FOREMAN_TASK_ID"] = "t42";

    Recorder recorder;
    AgentProcess process(options);
    process.set_callbacks(recorder.callbacks());
    process.start();
    EXPECT(process.pid() > 0, "child spawned");
    EXPECT(process.wait_for_exit(std::chrono::milliseconds(5000)), "process exited");

    EXPECT(process.status() == AgentStatus::STOPPED, "stopped after exit");
    EXPECT(!process.is_running(), "not running");
    auto exit = process.last_exit();
    EXPECT(exit && exit->code == std::optional<int>(4) && !exit->signal, "exit code reported");

    std::lock_guard<std::mutex> lock(recorder.mutex);
    EXPECT(recorder.events.size() == 2, "JSON objects become events");
    EXPECT(recorder.events[0]["timestamp"] == 5, "existing timestamp kept");
    EXPECT(recorder.events[1]["timestamp"].is_number_integer(), "missing timestamp added");

    std::string cwd_line = "cwd=" + std::filesystem::canonical(dir.path()).string();
    EXPECT((recorder.output == std::vector<std::string>{"plain text", "[1,2]", cwd_line, "task=t42",
                                                         "no newline"}),
           "other lines become output");
    EXPECT(recorder.errors == std::vector<std::string>{"stderr: oops"}, "stderr becomes errors");
    EXPECT(recorder.exits.size() == 1 && recorder.exits[0].code == std::optional<int>(4),
           "exit callback fired once");
    EXPECT(recorder.statuses.front() == AgentStatus::STARTING, "starting first");
    EXPECT(recorder.statuses.back() == AgentStatus::STOPPED, "stopped last");
    return 0;
}

static int test_pause_resume_stop_after_current(void)
{
    Recorder recorder;
    AgentProcess process(shell_agent(kInteractiveAgent));
    process.set_callbacks(recorder.callbacks());
    process.start();
    EXPECT(process.can_accept_messages(), "running agent accepts messages");

    process.pause();
    EXPECT(test::wait_until([&]() { return process.status() == AgentStatus::PAUSED; }),
           "paused once the agent confirms");
    EXPECT(recorder.saw_status(AgentStatus::PAUSING), "pausing while waiting");
    EXPECT(process.can_accept_messages(), "paused agent accepts messages");

    process.resume();
    EXPECT(test::wait_until([&]() { return process.status() == AgentStatus::RUNNING; }),
           "running once the agent confirms");

    process.stop_after_current();
    EXPECT(recorder.saw_status(AgentStatus::STOPPING_AFTER_CURRENT), "stopping after current");
    EXPECT(process.wait_for_exit(std::chrono::milliseconds(5000)), "agent exited");
    EXPECT(process.last_exit()->code == std::optional<int>(3), "agent exit code kept");
    return 0;
}

static int test_stop_terminates(void)
{
    AgentProcess process(shell_agent(kInteractiveAgent));
    process.start();
    process.stop(std::chrono::milliseconds(2000));

    EXPECT(process.status() == AgentStatus::STOPPED, "stop waits for the exit");
    auto exit = process.last_exit();
    EXPECT(exit && exit->signal == std::optional<int>(SIGTERM), "terminated by SIGTERM");

    process.stop();
    EXPECT(process.status() == AgentStatus::STOPPED, "second stop is a no-op");
    return 0;
}

static int test_stop_from_start_callback(void)
{
    AgentOptions options;
    options.command = "sleep";
    options.args = {"5"};
    AgentProcess process(options);

    ControllerCallbacks callbacks;
    callbacks.on_status = [&process](AgentStatus status) {
        if (status == AgentStatus::RUNNING) process.stop(std::chrono::milliseconds(2000));
    };
    process.set_callbacks(callbacks);

    auto begin = std::chrono::steady_clock::now();
    process.start();
    EXPECT(process.wait_for_exit(std::chrono::milliseconds(3000)), "child reaped after an early stop");
    EXPECT(std::chrono::steady_clock::now() - begin < std::chrono::seconds(3), "start did not block on its own stop");
    auto exit = process.last_exit();
    EXPECT(exit && exit->signal == std::optional<int>(SIGTERM), "terminated by SIGTERM");
    return 0;
}

static int test_stop_escalates_to_kill(void)
{
    AgentProcess process(shell_agent("trap '' TERM\nwhile true; do sleep 0.05; done\n"));
    process.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto started = std::chrono::steady_clock::now();
    process.stop(std::chrono::milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - started;

    auto exit = process.last_exit();
    EXPECT(exit && exit->signal == std::optional<int>(SIGKILL), "killed after the timeout");
    EXPECT(elapsed >= std::chrono::milliseconds(200), "waited for the grace period");
    return 0;
}

static int test_restart_and_errors(void)
{
    AgentProcess process(shell_agent("read line\n"));

    bool threw = false;
    try {
        process.send({{"type", "ping"}});
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "Agent process is not running";
    }
    EXPECT(threw, "send before start rejected");

    process.pause();
    EXPECT(process.status() == AgentStatus::STOPPED, "pause ignored when stopped");

    process.start();
    threw = false;
    try {
        process.start();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    EXPECT(threw, "double start rejected");

    process.send({{"type", "ping"}});
    EXPECT(process.wait_for_exit(std::chrono::milliseconds(5000)), "agent read its line and exited");
    EXPECT(process.last_exit()->code == std::optional<int>(0), "clean exit");

    process.start();
    EXPECT(process.is_running(), "restart after exit");
    process.stop();
    return 0;
}

static int test_missing_command(void)
{
    AgentOptions options;
    options.command = "/nonexistent/foreman-agent";
    Recorder recorder;
    AgentProcess process(options);
    process.set_callbacks(recorder.callbacks());
    process.start();

    EXPECT(process.wait_for_exit(std::chrono::milliseconds(5000)), "exec failure exits");
    EXPECT(process.last_exit()->code == std::optional<int>(127), "exec failure code");
    std::lock_guard<std::mutex> lock(recorder.mutex);
    EXPECT(!recorder.errors.empty(), "exec failure reported on stderr");
    return 0;
}

int main(void)
{
    signal(SIGPIPE, SIG_IGN);

    if (test_stream_dispatch() != 0) return 1;
    if (test_pause_resume_stop_after_current() != 0) return 1;
    if (test_stop_terminates() != 0) return 1;
    if (test_stop_from_start_callback() != 0) return 1;
    if (test_stop_escalates_to_kill() != 0) return 1;
    if (test_restart_and_errors() != 0) return 1;
    if (test_missing_command() != 0) return 1;
    return 0;
}
