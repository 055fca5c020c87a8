#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "app/api_service.hpp"
#include "core/config/request_id.hpp"

namespace {

using nlohmann::json;
using runner::app::ApiService;
using runner::core::errors::ErrorCategory;
using runner::core::errors::RunnerError;
using runner::policy::AuthPolicy;
using runner::policy::PolicyGuard;
using runner::runtime::ExecutionHarness;
using runner::runtime::HarnessConfig;

constexpr const char* kKeyEnv = "CODE_RUNNER_API_TEST_KEY";

class ApiServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::current_path() /
                (".tmp_api_service_" + runner::core::config::generate_request_id());
        std::filesystem::create_directories(root_);
        setenv(kKeyEnv, "s3cret", 1);
    }

    void TearDown() override {
        unsetenv(kKeyEnv);
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    ApiService make_service(bool require_api_key = true) const {
        AuthPolicy auth;
        auth.require_api_key = require_api_key;
        auth.api_key_env = kKeyEnv;

        HarnessConfig config;
        config.workspace_root = root_;
        config.run_command = {"/bin/sh"};
        config.test_command = {"/bin/sh", "test_solution.py"};
        return ApiService(PolicyGuard(auth), ExecutionHarness(config));
    }

    bool workspace_root_empty() const { return std::filesystem::is_empty(root_); }

    std::filesystem::path root_;
};

const std::string kKey = "s3cret";

TEST_F(ApiServiceTest, PingIsAlwaysOk) {
    const auto reply = make_service().ping();
    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body.at("status").get<std::string>(), "ok");
    EXPECT_EQ(reply.body.at("message").get<std::string>(), "pong");
}

TEST_F(ApiServiceTest, RunReturnsResultFields) {
    const auto reply = make_service().run(kKey, R"({"code": "echo hi"})");
    EXPECT_EQ(reply.status, 200);
    EXPECT_TRUE(reply.body.at("ok").get<bool>());
    EXPECT_EQ(reply.body.at("stdout").get<std::string>(), "hi\n");
    EXPECT_EQ(reply.body.at("stderr").get<std::string>(), "");
    EXPECT_EQ(reply.body.at("exit_code").get<int>(), 0);
    EXPECT_TRUE(workspace_root_empty());
}

TEST_F(ApiServiceTest, RunTimeoutIsNotAnHttpError) {
    const auto reply =
        make_service().run(kKey, R"({"code": "while :; do :; done", "timeout_sec": 1})");
    EXPECT_EQ(reply.status, 200);
    EXPECT_FALSE(reply.body.at("ok").get<bool>());
    EXPECT_EQ(reply.body.at("exit_code").get<int>(), 124);
    EXPECT_EQ(reply.body.at("stderr").get<std::string>(), "TIMEOUT");
}

TEST_F(ApiServiceTest, TestReturnsSummary) {
    const auto reply = make_service().test(
        kKey, R"({"code": "x=1", "tests": "grep -q x=1 solution.py"})");
    EXPECT_EQ(reply.status, 200);
    EXPECT_TRUE(reply.body.at("ok").get<bool>());
    EXPECT_EQ(reply.body.at("summary").get<std::string>(), "tests passed");
}

TEST_F(ApiServiceTest, MissingSecretIsServiceUnavailable) {
    unsetenv(kKeyEnv);
    const auto reply = make_service().run(kKey, R"({"code": "echo hi"})");
    EXPECT_EQ(reply.status, 503);
    EXPECT_EQ(reply.body.at("detail").get<std::string>(), "API not configured");
}

TEST_F(ApiServiceTest, WrongOrMissingKeyIsUnauthorized) {
    const auto service = make_service();

    const auto wrong = service.run(std::string("nope"), R"({"code": "echo hi"})");
    EXPECT_EQ(wrong.status, 401);
    EXPECT_EQ(wrong.body.at("detail").get<std::string>(), "Invalid or missing API key");

    const auto missing = service.test(std::nullopt, R"({"code": "x", "tests": "y"})");
    EXPECT_EQ(missing.status, 401);
    EXPECT_TRUE(workspace_root_empty());
}

TEST_F(ApiServiceTest, AuthCanBeDisabled) {
    unsetenv(kKeyEnv);
    const auto reply = make_service(false).run(std::nullopt, R"({"code": "echo open"})");
    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body.at("stdout").get<std::string>(), "open\n");
}

TEST_F(ApiServiceTest, OversizedCodeIsRejectedBeforeAnyWorkspace) {
    const json body = {{"code", std::string(20001, '#')}};
    const auto reply = make_service().run(kKey, body.dump());
    EXPECT_EQ(reply.status, 413);
    EXPECT_EQ(reply.body.at("detail").get<std::string>(), "Code too large");
    EXPECT_TRUE(workspace_root_empty());
}

TEST_F(ApiServiceTest, CodeAtTheLimitIsAccepted) {
    const json body = {{"code", std::string(20000, '#')}};
    const auto reply = make_service().run(kKey, body.dump());
    EXPECT_EQ(reply.status, 200);
    EXPECT_EQ(reply.body.at("exit_code").get<int>(), 0);
}

TEST_F(ApiServiceTest, OversizedTestsAreRejected) {
    const json body = {{"code", "x"}, {"tests", std::string(20001, '#')}};
    const auto reply = make_service().test(kKey, body.dump());
    EXPECT_EQ(reply.status, 413);
    EXPECT_EQ(reply.body.at("detail").get<std::string>(), "Code or tests too large");
}

TEST_F(ApiServiceTest, MalformedBodiesMapToClientErrors) {
    const auto service = make_service();
    EXPECT_EQ(service.run(kKey, "not json").status, 422);
    EXPECT_EQ(service.run(kKey, R"({"stdin": "x"})").status, 422);
    EXPECT_EQ(service.run(kKey, R"({"code": "x", "timeout_sec": 0})").status, 422);
    EXPECT_EQ(service.run(kKey, R"({"code": "x", "timeout_sec": 21})").status, 422);
    EXPECT_EQ(service.test(kKey, R"({"code": "x"})").status, 422);
    EXPECT_TRUE(workspace_root_empty());
}

TEST_F(ApiServiceTest, MalformedJsonIsReportedBeforeAuthorization) {
    const auto service = make_service();
    const auto without_key = service.run(std::nullopt, "{\"code\": ");
    EXPECT_EQ(without_key.status, 422);
    EXPECT_EQ(without_key.body.at("detail").get<std::string>(), "Invalid JSON body");
    EXPECT_EQ(service.test("wrong", "not json").status, 422);

    // Well-formed bodies still hit authorization before schema checks.
    EXPECT_EQ(service.run("wrong", R"({"stdin": "x"})").status, 401);
    EXPECT_TRUE(workspace_root_empty());
}

TEST_F(ApiServiceTest, InfrastructureFaultIsInternalError) {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);

    const auto reply = make_service().run(kKey, R"({"code": "echo hi"})");
    EXPECT_EQ(reply.status, 500);
    EXPECT_EQ(reply.body.at("detail").get<std::string>(), "Internal server error");
}

TEST(ApiStatusTest, MapsCategoriesToStatusCodes) {
    EXPECT_EQ(ApiService::status_for(
                  RunnerError{ErrorCategory::Input, "x", "payload_too_large"}),
              413);
    EXPECT_EQ(ApiService::status_for(RunnerError{ErrorCategory::Input, "x", "invalid_json"}),
              422);
    EXPECT_EQ(ApiService::status_for(RunnerError{ErrorCategory::Input, "x", "out_of_range"}),
              422);
    EXPECT_EQ(ApiService::status_for(RunnerError{ErrorCategory::Authorization, "x"}), 401);
    EXPECT_EQ(ApiService::status_for(RunnerError{ErrorCategory::Configuration, "x"}), 503);
    EXPECT_EQ(ApiService::status_for(RunnerError{ErrorCategory::Internal, "x"}), 500);
}

}  // namespace
