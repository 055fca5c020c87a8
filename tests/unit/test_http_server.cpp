#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "app/api_service.hpp"
#include "app/http_server.hpp"
#include "core/config/request_id.hpp"

namespace {

using nlohmann::json;
using runner::app::ApiService;
using runner::app::HttpServer;
using runner::policy::AuthPolicy;
using runner::policy::PolicyGuard;
using runner::runtime::ExecutionHarness;
using runner::runtime::HarnessConfig;

constexpr const char* kKeyEnv = "CODE_RUNNER_HTTP_TEST_KEY";

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::current_path() /
                (".tmp_http_server_" + runner::core::config::generate_request_id());
        std::filesystem::create_directories(root_);
        setenv(kKeyEnv, "s3cret", 1);

        AuthPolicy auth;
        auth.api_key_env = kKeyEnv;
        HarnessConfig config;
        config.workspace_root = root_;
        config.run_command = {"/bin/sh"};
        config.test_command = {"/bin/sh", "test_solution.py"};
        service_ = std::make_unique<ApiService>(PolicyGuard(auth), ExecutionHarness(config));

        server_ = std::make_unique<HttpServer>(*service_, 2);
        ASSERT_TRUE(server_->bind("127.0.0.1", 0));
        // The socket is already listening after bind, so early clients queue.
        thread_ = std::thread([this] { server_->listen(); });
    }

    void TearDown() override {
        // Every test sends a request first, so the server is running here.
        server_->stop();
        if (thread_.joinable()) {
            thread_.join();
        }
        unsetenv(kKeyEnv);
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    httplib::Client client() const { return httplib::Client("127.0.0.1", server_->port()); }

    std::filesystem::path root_;
    std::unique_ptr<ApiService> service_;
    std::unique_ptr<HttpServer> server_;
    std::thread thread_;
};

TEST_F(HttpServerTest, PingAnswersWithoutKey) {
    auto cli = client();
    auto res = cli.Get("/ping");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");
    const auto body = json::parse(res->body);
    EXPECT_EQ(body.at("message").get<std::string>(), "pong");
}

TEST_F(HttpServerTest, RunWithKeyHeader) {
    auto cli = client();
    httplib::Headers headers = {{"X-API-Key", "s3cret"}};
    auto res = cli.Post("/run", headers, R"({"code": "echo hi", "timeout_sec": 5})",
                        "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    const auto body = json::parse(res->body);
    EXPECT_TRUE(body.at("ok").get<bool>());
    EXPECT_EQ(body.at("stdout").get<std::string>(), "hi\n");
    EXPECT_EQ(body.at("exit_code").get<int>(), 0);
}

TEST_F(HttpServerTest, HeaderNameIsCaseInsensitive) {
    auto cli = client();
    httplib::Headers headers = {{"x-api-key", "s3cret"}};
    auto res = cli.Post("/test", headers, R"({"code": "x", "tests": "exit 1"})",
                        "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body).at("summary").get<std::string>(), "tests failed");
}

TEST_F(HttpServerTest, RunWithoutKeyIsUnauthorized) {
    auto cli = client();
    auto res = cli.Post("/run", R"({"code": "echo hi"})", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 401);
    EXPECT_EQ(json::parse(res->body).at("detail").get<std::string>(),
              "Invalid or missing API key");
}

TEST_F(HttpServerTest, UnknownRouteIsJsonNotFound) {
    auto cli = client();
    auto res = cli.Get("/nope");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(json::parse(res->body).at("detail").get<std::string>(), "Not Found");
}

}  // namespace
