#include <utility>
#include <gtest/gtest.h>
#include "core/errors/runner_errors.hpp"

using namespace runner::core::errors;

// A dummy function to simulate a staging step failing
Result<std::string> simulate_stage_file(bool should_fail) {
    if (should_fail) {
        return RunnerError{ErrorCategory::Internal, "Disk full", "workspace_write_failed"};
    }
    return std::string("main.py");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_stage_file(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "main.py");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_stage_file(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Internal);
    EXPECT_EQ(error.message, "Disk full");
    EXPECT_EQ(error.code, "workspace_write_failed");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, MutableAccessAllowsMovingValueOut) {
    Result<std::string> result = std::string("payload");
    std::string taken = std::move(get_value(result));
    EXPECT_EQ(taken, "payload");
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::Authorization), "authorization");
    EXPECT_EQ(to_string(ErrorCategory::Configuration), "configuration");
}
