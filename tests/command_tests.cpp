/*
Subprocess helpers and the command-backed worker collaborators.
*/
#include "runtime/subprocess.hpp"
#include "worker/command_task_source.hpp"
#include "worker/command_test_runner.hpp"
#include "worker/process_agent_runner.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <signal.h>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace foreman;
using namespace foreman::worker;

static std::string read_file(const std::filesystem::path& path)
{
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

static int test_run_command(void)
{
    auto echo = runtime::run_command({"echo", "hello"});
    EXPECT(echo.ok() && echo.out == "hello\n", "stdout captured");

    auto failing = runtime::run_shell("echo out; echo err >&2; exit 2");
    EXPECT(failing.launched && !failing.ok(), "non-zero exit is not ok");
    EXPECT(failing.exit_code == 2, "exit code kept");
    EXPECT(failing.combined_output() == "out\nerr", "combined output");

    auto missing = runtime::run_command({"/nonexistent/foreman-binary"});
    EXPECT(!missing.ok() && missing.exit_code == 127, "missing binary reported");

    auto killed = runtime::run_shell("kill -9 $$");
    EXPECT(killed.exit_code == -1 && killed.signal == SIGKILL, "signal reported");

    auto stdin_closed = runtime::run_shell("cat");
    EXPECT(stdin_closed.ok() && stdin_closed.out.empty(), "stdin is empty");

    test::TempDir dir;
    auto pwd = runtime::run_shell("pwd -P", dir.path());
    EXPECT(pwd.out == std::filesystem::canonical(dir.path()).string() + "\n", "runs in cwd");

    EXPECT(runtime::run_command({}).launched == false, "empty argv rejected");
    return 0;
}

static int test_shell_quote(void)
{
    EXPECT(runtime::shell_quote("abc") == "'abc'", "plain value quoted");
    EXPECT(runtime::shell_quote("it's") == "'it'\\''s'", "embedded quote escaped");

    auto echoed = runtime::run_shell("printf %s " + runtime::shell_quote("a b; $(rm -rf x) 'q'"));
    EXPECT(echoed.out == "a b; $(rm -rf x) 'q'", "quoted value passes through the shell intact");
    return 0;
}

static int test_parse_ready_task(void)
{
    EXPECT(!parse_ready_task("").has_value(), "empty output means no work");
    EXPECT(!parse_ready_task("  \n").has_value(), "blank output means no work");
    EXPECT(!parse_ready_task("[]").has_value(), "empty array means no work");

    auto object = parse_ready_task(R"({"id":"bd-1","title":"Fix parser"})");
    EXPECT(object && object->id == "bd-1" && object->title == "Fix parser", "object parsed");

    auto array = parse_ready_task(R"([{"id":"bd-2"},{"id":"bd-3"}])");
    EXPECT(array && array->id == "bd-2" && array->title.empty(), "first array element used");

    bool threw = false;
    try {
        parse_ready_task(R"({"title":"no id"})");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    EXPECT(threw, "task without id rejected");

    threw = false;
    try {
        parse_ready_task("{oops");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    EXPECT(threw, "invalid JSON rejected");
    return 0;
}

static int test_command_task_source(void)
{
    test::TempDir dir;
    CommandTaskSourceOptions options;
    options.ready_command = "cat ready.json";
    options.claim_command = "echo claim {id} >> log";
    options.close_command = "echo close {id} >> log";
    options.cwd = dir.path();

    std::ofstream(dir.path() / "ready.json") << R"([{"id":"bd 7","title":"Spaces"}])";

    CommandTaskSource source(options);
    auto task = source.get_ready_task();
    EXPECT(task && task->id == "bd 7", "ready task read");

    source.claim_task(task->id);
    source.close_task(task->id);
    EXPECT(read_file(dir.path() / "log") == "claim bd 7\nclose bd 7\n", "commands ran with the id");

    options.claim_command = "echo already claimed >&2; exit 1";
    CommandTaskSource failing(options);
    std::string message;
    try {
        failing.claim_task("bd-7");
    } catch (const std::runtime_error& e) {
        message = e.what();
    }
    EXPECT(message == "Failed to claim task bd-7: already claimed", "claim failure reported");

    options.ready_command = "exit 3";
    CommandTaskSource broken(options);
    bool threw = false;
    try {
        broken.get_ready_task();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    EXPECT(threw, "ready command failure thrown");
    return 0;
}

static int test_command_test_runner(void)
{
    test::TempDir dir;
    CommandTestRunner passing("echo all good", dir.path());
    auto ok = passing.run_tests();
    EXPECT(ok.success && ok.output == "all good", "passing tests");

    CommandTestRunner failing("echo 1 failed; exit 1", dir.path());
    auto bad = failing.run_tests();
    EXPECT(!bad.success && bad.output == "1 failed", "failing tests");
    return 0;
}

static int test_run_command_from_many_threads(void)
{
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([i, &failures]() {
            for (int round = 0; round < 5; ++round) {
                auto result = runtime::run_command({"echo", std::to_string(i)});
                if (!result.ok() || result.out != std::to_string(i) + "\n") failures++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT(failures == 0, "every concurrent command ran cleanly");
    return 0;
}

static int test_process_agent_runner(void)
{
    ReadyTask task{"t9", "Write docs"};
    auto args = expand_agent_args({"-p", "Work on {taskId}: {taskTitle}"}, task);
    EXPECT((args == std::vector<std::string>{"-p", "Work on t9: Write docs"}), "placeholders expanded");

    test::TempDir dir;
    ProcessAgentRunnerOptions options;
    options.instance_id = "homer";
    options.command = "/bin/sh";
    options.args = {"-c",
        "echo '{\"type\":\"system\",\"session_id\":\"abc\"}'\n"
        "echo '{\"type\":\"system\",\"sessionId\":\"later\"}'\n"
        "echo \"$FOREMAN_TASK_ID $FOREMAN_WORKER\" > marker\n"
        "exit 5\n"};
    options.env = {{"FOREMAN_WORKER", "homer"}};
    ProcessAgentRunner runner(std::move(options));

    auto result = runner.run(dir.path(), task);
    EXPECT(result.exit_code == 5, "agent exit code returned");
    EXPECT(result.session_id == "abc", "first session id kept");
    EXPECT(read_file(dir.path() / "marker") == "t9 homer\n", "task env and cwd applied");
    EXPECT(runner.registry()->size() == 0, "instance released after the run");

    // Same id again: the previous instance was disposed
    auto again = runner.run(dir.path(), task);
    EXPECT(again.exit_code == 5, "runner reusable");
    return 0;
}

static int test_process_agent_runner_shared_registry(void)
{
    auto instances = std::make_shared<registry::InstanceRegistry>();
    std::atomic<int> disposed{0};
    instances->set_event_callback([&disposed](const registry::RegistryEvent& event) {
        if (event.type == registry::RegistryEventType::INSTANCE_DISPOSED) disposed++;
    });

    test::TempDir dir;
    ProcessAgentRunnerOptions options;
    options.instance_id = "bart";
    options.command = "/bin/sh";
    options.args = {"-c", "exit 0"};
    options.registry = instances;
    ProcessAgentRunner runner(std::move(options));

    auto result = runner.run(dir.path(), {"t1", ""});
    EXPECT(result.exit_code == 0, "clean exit");
    EXPECT(runner.registry() == instances, "runner uses the given registry");
    EXPECT(disposed == 1, "instance created and disposed through the registry");
    EXPECT(!instances->has("bart"), "nothing left behind");
    return 0;
}

static int test_cancel_before_run(void)
{
    test::TempDir dir;
    ProcessAgentRunnerOptions options;
    options.instance_id = "homer";
    options.command = "/bin/sh";
    options.args = {"-c", "touch started"};
    ProcessAgentRunner runner(std::move(options));

    runner.cancel();
    auto result = runner.run(dir.path(), {"t1", ""});
    EXPECT(result.exit_code == -1, "cancelled runner does not start");
    EXPECT(!std::filesystem::exists(dir.path() / "started"), "agent never spawned");
    return 0;
}

static int test_cancel_while_starting(void)
{
    auto instances = std::make_shared<registry::InstanceRegistry>();
    test::TempDir dir;
    ProcessAgentRunnerOptions options;
    options.instance_id = "lisa";
    options.command = "sleep";
    options.args = {"5"};
    options.registry = instances;
    ProcessAgentRunner runner(std::move(options));

    // Cancel lands before the child exists
    instances->set_event_callback([&runner](const registry::RegistryEvent& event) {
        if (event.kind == "ralph:status" && event.data == "starting") runner.cancel();
    });

    auto begin = std::chrono::steady_clock::now();
    auto result = runner.run(dir.path(), {"t1", ""});
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT(result.exit_code == 128 + SIGTERM, "agent terminated after start");
    EXPECT(elapsed < std::chrono::seconds(3), "run returned without waiting out the agent");
    return 0;
}

int main(void)
{
    signal(SIGPIPE, SIG_IGN);

    if (test_run_command() != 0) return 1;
    if (test_shell_quote() != 0) return 1;
    if (test_parse_ready_task() != 0) return 1;
    if (test_command_task_source() != 0) return 1;
    if (test_command_test_runner() != 0) return 1;
    if (test_run_command_from_many_threads() != 0) return 1;
    if (test_process_agent_runner() != 0) return 1;
    if (test_process_agent_runner_shared_registry() != 0) return 1;
    if (test_cancel_before_run() != 0) return 1;
    if (test_cancel_while_starting() != 0) return 1;
    return 0;
}
