#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "protocol/run_result.hpp"

namespace runner::runtime {

using EnvironmentMap = std::map<std::string, std::string>;

// Proxy variables stripped from the child's environment so executed code
// does not reach out through a configured proxy by accident.
const std::vector<std::string>& default_stripped_env_keys();

// Snapshot of the server's own environment.
EnvironmentMap current_environment();

// Pure: base minus `removed_keys`, then `overrides` applied on top.
EnvironmentMap build_child_environment(EnvironmentMap base,
                                       const std::vector<std::string>& removed_keys,
                                       const EnvironmentMap& overrides = {});

struct ProcessRequest {
    std::vector<std::string> argv;
    std::filesystem::path working_directory;
    int timeout_seconds = 5;
    std::string stdin_text;  // Empty means the child sees EOF right away
    std::size_t capture_limit_bytes = 0;  // Per stream; 0 keeps all output
};

// Bytes worth capturing per stream so that truncating to
// `output_limit_chars` afterwards gives the same text as capturing everything.
std::size_t capture_limit_for(std::size_t output_limit_chars);

struct ExecutorOptions {
    std::vector<std::string> stripped_env_keys = default_stripped_env_keys();
    EnvironmentMap env_overrides;
    // After a kill, how long to keep draining pipes a grandchild may still hold.
    std::chrono::milliseconds kill_grace{1000};
};

class ProcessExecutor {
public:
    explicit ProcessExecutor(ExecutorOptions options = {});

    // Every way the child can end, including failing to start, maps to a
    // ProcessOutcome instead of an error.
    protocol::ProcessOutcome run(const ProcessRequest& request) const;

private:
    ExecutorOptions options_;
};

// Collapses an outcome into the wire-level result, bounding both streams to
// `output_limit` characters.
protocol::RunResult to_run_result(const protocol::ProcessOutcome& outcome,
                                  std::size_t output_limit);

}  // namespace runner::runtime
