#include <string>
#include <utility>
#include "app/api_service.hpp"
#include "app/cli_parser.hpp"
#include "app/http_server.hpp"
#include "core/config/request_id.hpp"
#include "core/errors/runner_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "runtime/execution_harness.hpp"

int main(int argc, char* argv[]) {
    // 1. Tag bootstrap log lines with their own id
    runner::core::logging::Logger::get().set_request_id(
        runner::core::config::generate_request_id("boot-"));

    // 2. Parse CLI input and return normalized input errors
    LOG_INFO("Code runner: bootstrapping...");
    auto parsed = runner::app::cli::parse_and_validate(argc, argv);
    if (runner::core::errors::is_error(parsed)) {
        const auto& err = runner::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& config = runner::core::errors::get_value(parsed);
    if (config.verbose) {
        runner::core::logging::Logger::get().set_min_level(
            runner::core::logging::LogLevel::DEBUG);
    }

    // 3. Wire policy, harness and service
    runner::policy::AuthPolicy auth_policy;
    auth_policy.require_api_key = config.require_api_key;
    auth_policy.api_key_env = config.api_key_env;
    runner::policy::PolicyGuard policy_guard(auth_policy);

    if (config.require_api_key) {
        auto probe = policy_guard.authorize(std::string());
        if (runner::core::errors::is_error(probe) &&
            runner::core::errors::get_error(probe).category ==
                runner::core::errors::ErrorCategory::Configuration) {
            LOG_WARN(config.api_key_env +
                     " is not set; /run and /test answer 503 until it is.");
        }
    } else {
        LOG_WARN("API key authentication is disabled (--no-auth).");
    }

    runner::runtime::HarnessConfig harness_config;
    harness_config.workspace_root = config.workspace_root;
    harness_config.run_command = {config.python_command};
    harness_config.test_command = {config.pytest_command, "-q", "--maxfail=1",
                                   "--disable-warnings"};
    runner::runtime::ExecutionHarness harness(std::move(harness_config));

    runner::app::ApiService service(std::move(policy_guard), std::move(harness));
    runner::app::HttpServer server(service, config.worker_threads);

    // 4. Bind and serve
    if (!server.bind(config.host, config.port)) {
        LOG_ERROR("Failed to bind " + config.host + ":" + std::to_string(config.port));
        return 3;
    }
    LOG_INFO("Listening on " + config.host + ":" + std::to_string(server.port()) +
             " (workspaces under " + config.workspace_root.string() + ", auth " +
             (config.require_api_key ? "on" : "off") + ")");
    runner::core::logging::Logger::get().clear_request_id();

    if (!server.listen()) {
        LOG_ERROR("Server stopped unexpectedly.");
        return 3;
    }
    return 0;
}
