#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/runner_errors.hpp"
#include "protocol/run_result.hpp"
#include "protocol/run_spec.hpp"

namespace runner::protocol {

// Syntax-only check, run before authorization so a malformed body is
// reported the same way whether or not the caller holds a key.
core::errors::Result<bool> check_json_syntax(const std::string& body);

// Parses a /run body: {"code": str, "stdin"?: str|null, "timeout_sec"?: int|null}
core::errors::Result<RunSpec> parse_run_request(const std::string& body);

// Parses a /test body: {"code": str, "tests": str, "timeout_sec"?: int|null}
core::errors::Result<RunSpec> parse_test_request(const std::string& body);

nlohmann::json run_response_to_json(const RunResult& result);
nlohmann::json test_response_to_json(const TestResult& result);
nlohmann::json ping_to_json();
nlohmann::json error_to_json(const std::string& detail);

}  // namespace runner::protocol
