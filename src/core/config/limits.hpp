#pragma once
#include <cstddef>
#include <string_view>

namespace runner::core::config {

    // Request size ceiling for `code` and `tests`, in characters
    inline constexpr std::size_t kMaxCodeChars = 20000;

    // Ceiling for each of stdout / stderr returned to the caller
    inline constexpr std::size_t kOutputLimitChars = 100000;
    inline constexpr std::string_view kTruncationMarker = "\n...[truncated]...";

    inline constexpr int kDefaultTimeoutSec = 5;
    inline constexpr int kMinTimeoutSec = 1;
    inline constexpr int kMaxTimeoutSec = 20;

    // Exit code reported when the deadline expired. Never a real exit status.
    inline constexpr int kTimeoutExitCode = 124;
    inline constexpr std::string_view kTimeoutMarker = "TIMEOUT";

    inline constexpr std::string_view kDefaultApiKeyEnv = "RUNNER_API_KEY";
    inline constexpr std::string_view kApiKeyHeader = "X-API-Key";

} // namespace runner::core::config
