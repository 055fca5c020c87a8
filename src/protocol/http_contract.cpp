#include "protocol/http_contract.hpp"

#include <cstdint>
#include <utility>
#include "core/config/limits.hpp"

namespace runner::protocol {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::RunnerError;
using nlohmann::json;

namespace {

Result<json> parse_object(const std::string& body) {
    json payload = json::parse(body, nullptr, false);
    if (payload.is_discarded()) {
        return RunnerError{ErrorCategory::Input, "Invalid JSON body", "invalid_json"};
    }
    if (!payload.is_object()) {
        return RunnerError{ErrorCategory::Input, "Request body must be a JSON object",
                           "invalid_field"};
    }
    return payload;
}

Result<std::string> required_string(const json& payload, const std::string& field) {
    const auto it = payload.find(field);
    if (it == payload.end() || it->is_null()) {
        return RunnerError{ErrorCategory::Input, "Field required: " + field,
                           "missing_field"};
    }
    if (!it->is_string()) {
        return RunnerError{ErrorCategory::Input, "Field must be a string: " + field,
                           "invalid_field"};
    }
    return it->get<std::string>();
}

Result<std::string> optional_string(const json& payload, const std::string& field) {
    const auto it = payload.find(field);
    if (it == payload.end() || it->is_null()) {
        return std::string();
    }
    if (!it->is_string()) {
        return RunnerError{ErrorCategory::Input, "Field must be a string: " + field,
                           "invalid_field"};
    }
    return it->get<std::string>();
}

Result<int> timeout_field(const json& payload) {
    const auto it = payload.find("timeout_sec");
    if (it == payload.end() || it->is_null()) {
        return core::config::kDefaultTimeoutSec;
    }
    if (!it->is_number_integer()) {
        return RunnerError{ErrorCategory::Input, "timeout_sec must be an integer",
                           "invalid_field"};
    }
    const auto value = it->get<std::int64_t>();
    if (value < core::config::kMinTimeoutSec || value > core::config::kMaxTimeoutSec) {
        return RunnerError{ErrorCategory::Input,
                           "timeout_sec must be between " +
                               std::to_string(core::config::kMinTimeoutSec) + " and " +
                               std::to_string(core::config::kMaxTimeoutSec),
                           "out_of_range"};
    }
    return static_cast<int>(value);
}

}  // namespace

Result<bool> check_json_syntax(const std::string& body) {
    if (!json::accept(body)) {
        return RunnerError{ErrorCategory::Input, "Invalid JSON body", "invalid_json"};
    }
    return true;
}

Result<RunSpec> parse_run_request(const std::string& body) {
    auto parsed = parse_object(body);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const json& payload = core::errors::get_value(parsed);

    auto code = required_string(payload, "code");
    if (core::errors::is_error(code)) {
        return core::errors::get_error(code);
    }
    auto stdin_text = optional_string(payload, "stdin");
    if (core::errors::is_error(stdin_text)) {
        return core::errors::get_error(stdin_text);
    }
    auto timeout = timeout_field(payload);
    if (core::errors::is_error(timeout)) {
        return core::errors::get_error(timeout);
    }

    RunSpec spec;
    spec.source_text = std::move(core::errors::get_value(code));
    spec.stdin_text = std::move(core::errors::get_value(stdin_text));
    spec.timeout_seconds = core::errors::get_value(timeout);
    return spec;
}

Result<RunSpec> parse_test_request(const std::string& body) {
    auto parsed = parse_object(body);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const json& payload = core::errors::get_value(parsed);

    auto code = required_string(payload, "code");
    if (core::errors::is_error(code)) {
        return core::errors::get_error(code);
    }
    auto tests = required_string(payload, "tests");
    if (core::errors::is_error(tests)) {
        return core::errors::get_error(tests);
    }
    auto timeout = timeout_field(payload);
    if (core::errors::is_error(timeout)) {
        return core::errors::get_error(timeout);
    }

    RunSpec spec;
    spec.source_text = std::move(core::errors::get_value(code));
    spec.test_text = std::move(core::errors::get_value(tests));
    spec.timeout_seconds = core::errors::get_value(timeout);
    return spec;
}

json run_response_to_json(const RunResult& result) {
    json payload;
    payload["ok"] = result.succeeded;
    payload["stdout"] = result.stdout_text;
    payload["stderr"] = result.stderr_text;
    payload["exit_code"] = result.exit_code;
    return payload;
}

json test_response_to_json(const TestResult& result) {
    json payload = run_response_to_json(result.run);
    payload["summary"] = result.summary;
    return payload;
}

json ping_to_json() {
    return json{{"status", "ok"}, {"message", "pong"}};
}

json error_to_json(const std::string& detail) {
    return json{{"detail", detail}};
}

}  // namespace runner::protocol
