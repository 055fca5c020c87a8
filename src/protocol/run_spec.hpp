#pragma once
#include <optional>
#include <string>
#include "core/config/limits.hpp"

namespace runner::protocol {

    // Validated input for one harness invocation
    struct RunSpec {
        std::string source_text;
        std::string stdin_text;
        int timeout_seconds = core::config::kDefaultTimeoutSec;
        std::optional<std::string> test_text; // Only set for the test flow
    };

} // namespace runner::protocol
