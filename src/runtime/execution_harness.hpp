#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "core/config/limits.hpp"
#include "core/errors/runner_errors.hpp"
#include "protocol/run_result.hpp"
#include "protocol/run_spec.hpp"
#include "runtime/process_executor.hpp"

namespace runner::runtime {

struct HarnessConfig {
    std::filesystem::path workspace_root = std::filesystem::temp_directory_path();

    // Run mode: <run_command...> <run_file>, stdin forwarded.
    std::vector<std::string> run_command = {"python"};
    std::string run_file = "main.py";

    // Test mode: <test_command...> in a workspace holding both files. The
    // test file name follows pytest's test_*.py discovery rule.
    std::vector<std::string> test_command = {"pytest", "-q", "--maxfail=1",
                                             "--disable-warnings"};
    std::string solution_file = "solution.py";
    std::string test_file = "test_solution.py";

    std::size_t output_limit = core::config::kOutputLimitChars;
};

// Stages a workspace, runs one subprocess in it and tears the workspace down
// before returning. Errors are returned only for workspace faults; anything
// the subprocess does ends up in the result.
class ExecutionHarness {
public:
    explicit ExecutionHarness(HarnessConfig config,
                              ProcessExecutor executor = ProcessExecutor());

    core::errors::Result<protocol::RunResult> run(const protocol::RunSpec& spec) const;

    core::errors::Result<protocol::TestResult> test(const protocol::RunSpec& spec) const;

    const HarnessConfig& config() const { return config_; }

private:
    HarnessConfig config_;
    ProcessExecutor executor_;
};

}  // namespace runner::runtime
