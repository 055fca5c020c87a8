#include "app/api_service.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/http_contract.hpp"

namespace runner::app {

using core::errors::ErrorCategory;
using core::errors::RunnerError;
using protocol::ExecutionMode;

ApiService::ApiService(policy::PolicyGuard policy_guard,
                       runtime::ExecutionHarness harness)
    : policy_guard_(std::move(policy_guard)), harness_(std::move(harness)) {}

int ApiService::status_for(const RunnerError& error) {
    switch (error.category) {
        case ErrorCategory::Input:
            if (error.code == "payload_too_large") {
                return 413;
            }
            return 422;
        case ErrorCategory::Authorization:
            return 401;
        case ErrorCategory::Configuration:
            return 503;
        case ErrorCategory::Policy:
            return 403;
        case ErrorCategory::Execution:
        case ErrorCategory::Internal:
        default:
            return 500;
    }
}

HttpReply ApiService::error_reply(const RunnerError& error) {
    const int status = status_for(error);
    if (status >= 500) {
        LOG_ERROR("Request failed [" + core::errors::to_string(error.category) + "/" +
                  error.code + "]: " + error.message);
        // Internal details stay in the log.
        if (error.category != ErrorCategory::Configuration) {
            return HttpReply{status, protocol::error_to_json("Internal server error")};
        }
    } else {
        LOG_INFO("Request rejected [" + core::errors::to_string(error.category) + "/" +
                 error.code + "]: " + error.message);
    }
    return HttpReply{status, protocol::error_to_json(error.message)};
}

HttpReply ApiService::ping() const {
    return HttpReply{200, protocol::ping_to_json()};
}

HttpReply ApiService::run(const std::optional<std::string>& api_key,
                          const std::string& body) const {
    auto syntax = protocol::check_json_syntax(body);
    if (core::errors::is_error(syntax)) {
        return error_reply(core::errors::get_error(syntax));
    }

    auto authorized = policy_guard_.authorize(api_key);
    if (core::errors::is_error(authorized)) {
        return error_reply(core::errors::get_error(authorized));
    }

    auto parsed = protocol::parse_run_request(body);
    if (core::errors::is_error(parsed)) {
        return error_reply(core::errors::get_error(parsed));
    }

    auto validated = policy_guard_.validate_run_spec(
        std::move(core::errors::get_value(parsed)), ExecutionMode::Run);
    if (core::errors::is_error(validated)) {
        return error_reply(core::errors::get_error(validated));
    }

    const auto executed = harness_.run(core::errors::get_value(validated));
    if (core::errors::is_error(executed)) {
        return error_reply(core::errors::get_error(executed));
    }
    return HttpReply{200, protocol::run_response_to_json(core::errors::get_value(executed))};
}

HttpReply ApiService::test(const std::optional<std::string>& api_key,
                           const std::string& body) const {
    auto syntax = protocol::check_json_syntax(body);
    if (core::errors::is_error(syntax)) {
        return error_reply(core::errors::get_error(syntax));
    }

    auto authorized = policy_guard_.authorize(api_key);
    if (core::errors::is_error(authorized)) {
        return error_reply(core::errors::get_error(authorized));
    }

    auto parsed = protocol::parse_test_request(body);
    if (core::errors::is_error(parsed)) {
        return error_reply(core::errors::get_error(parsed));
    }

    auto validated = policy_guard_.validate_run_spec(
        std::move(core::errors::get_value(parsed)), ExecutionMode::Test);
    if (core::errors::is_error(validated)) {
        return error_reply(core::errors::get_error(validated));
    }

    const auto executed = harness_.test(core::errors::get_value(validated));
    if (core::errors::is_error(executed)) {
        return error_reply(core::errors::get_error(executed));
    }
    return HttpReply{200,
                     protocol::test_response_to_json(core::errors::get_value(executed))};
}

}  // namespace runner::app
