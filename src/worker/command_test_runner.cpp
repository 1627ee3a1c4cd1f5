#include "worker/command_test_runner.hpp"
#include "runtime/subprocess.hpp"
#include <spdlog/spdlog.h>

namespace foreman::worker {

CommandTestRunner::CommandTestRunner(std::string command, std::filesystem::path cwd)
    : command_(std::move(command)), cwd_(std::move(cwd)) {}

TestResult CommandTestRunner::run_tests() {
    spdlog::info("Running tests: {}", command_);
    auto result = runtime::run_shell(command_, cwd_);

    TestResult tests;
    tests.success = result.ok();
    tests.output = result.combined_output();
    if (!tests.success) {
        spdlog::warn("Tests failed (code={})", result.exit_code);
    }
    return tests;
}

} // namespace foreman::worker
