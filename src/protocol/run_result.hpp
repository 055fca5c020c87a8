#pragma once

#include <string>
#include <variant>

namespace runner::protocol {

enum class ExecutionMode {
    Run,
    Test
};

// Subprocess exited on its own (including death by signal).
struct Exited {
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;
};

// Deadline expired and the process group was killed.
struct TimedOut {
    std::string partial_stdout;
};

// The command never started: pipe, fork, chdir or exec failed.
struct LaunchFailed {
    std::string message;
};

using ProcessOutcome = std::variant<Exited, TimedOut, LaunchFailed>;

struct RunResult {
    bool succeeded = false;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
};

struct TestResult {
    RunResult run;
    std::string summary;
};

inline std::string to_string(const ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::Run:
            return "run";
        case ExecutionMode::Test:
            return "test";
        default:
            return "unknown";
    }
}

inline std::string test_summary(const int exit_code) {
    return exit_code == 0 ? "tests passed" : "tests failed";
}

}  // namespace runner::protocol
