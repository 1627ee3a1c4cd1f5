#pragma once
#include <filesystem>
#include <string>
#include "worker/types.hpp"

namespace foreman::worker {

// Runs a shell test command in the main workspace after each merge
class CommandTestRunner : public TestRunner {
public:
    CommandTestRunner(std::string command, std::filesystem::path cwd);

    TestResult run_tests() override;

private:
    std::string command_;
    std::filesystem::path cwd_;
};

} // namespace foreman::worker
