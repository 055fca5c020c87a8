#include "runtime/execution_harness.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "session/workspace.hpp"

namespace runner::runtime {

using core::errors::ErrorCategory;
using core::errors::RunnerError;
using protocol::ExecutionMode;
using protocol::RunResult;
using protocol::RunSpec;
using protocol::TestResult;
using session::StagedFile;
using session::Workspace;

ExecutionHarness::ExecutionHarness(HarnessConfig config, ProcessExecutor executor)
    : config_(std::move(config)), executor_(std::move(executor)) {}

core::errors::Result<RunResult> ExecutionHarness::run(const RunSpec& spec) const {
    auto staged = session::stage_workspace(config_.workspace_root, "run-",
                                           {StagedFile{config_.run_file, spec.source_text}});
    if (core::errors::is_error(staged)) {
        return core::errors::get_error(staged);
    }
    const Workspace workspace = std::move(core::errors::get_value(staged));

    ProcessRequest request;
    request.argv = config_.run_command;
    request.argv.push_back(config_.run_file);
    request.working_directory = workspace.path();
    request.timeout_seconds = spec.timeout_seconds;
    request.stdin_text = spec.stdin_text;
    request.capture_limit_bytes = capture_limit_for(config_.output_limit);

    const auto outcome = executor_.run(request);
    RunResult result = to_run_result(outcome, config_.output_limit);
    LOG_INFO("Harness: " + protocol::to_string(ExecutionMode::Run) +
             " finished with exit code " + std::to_string(result.exit_code));
    return result;
}

core::errors::Result<TestResult> ExecutionHarness::test(const RunSpec& spec) const {
    if (!spec.test_text.has_value()) {
        return RunnerError{ErrorCategory::Input, "Field required: tests",
                           "missing_field"};
    }

    auto staged = session::stage_workspace(
        config_.workspace_root, "test-",
        {StagedFile{config_.solution_file, spec.source_text},
         StagedFile{config_.test_file, spec.test_text.value()}});
    if (core::errors::is_error(staged)) {
        return core::errors::get_error(staged);
    }
    const Workspace workspace = std::move(core::errors::get_value(staged));

    // Stdin is never forwarded to the test runner.
    ProcessRequest request;
    request.argv = config_.test_command;
    request.working_directory = workspace.path();
    request.timeout_seconds = spec.timeout_seconds;
    request.capture_limit_bytes = capture_limit_for(config_.output_limit);

    const auto outcome = executor_.run(request);
    TestResult result;
    result.run = to_run_result(outcome, config_.output_limit);
    result.summary = protocol::test_summary(result.run.exit_code);
    LOG_INFO("Harness: " + protocol::to_string(ExecutionMode::Test) + " finished: " +
             result.summary);
    return result;
}

}  // namespace runner::runtime
