#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/runner_errors.hpp"
#include "policy/policy_guard.hpp"
#include "runtime/execution_harness.hpp"

namespace runner::app {

struct HttpReply {
    int status = 200;
    nlohmann::json body;
};

// Transport-independent handlers for the three endpoints. The HTTP server
// only extracts the API key header and body and writes the reply back.
class ApiService {
public:
    ApiService(policy::PolicyGuard policy_guard, runtime::ExecutionHarness harness);

    HttpReply ping() const;

    HttpReply run(const std::optional<std::string>& api_key,
                  const std::string& body) const;

    HttpReply test(const std::optional<std::string>& api_key,
                   const std::string& body) const;

    static int status_for(const core::errors::RunnerError& error);

private:
    static HttpReply error_reply(const core::errors::RunnerError& error);

    policy::PolicyGuard policy_guard_;
    runtime::ExecutionHarness harness_;
};

}  // namespace runner::app
