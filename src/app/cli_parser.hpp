#pragma once
#include "core/config/server_config.hpp"
#include "core/errors/runner_errors.hpp"

namespace runner::app::cli {
    runner::core::errors::Result<runner::core::config::ServerConfig> parse_and_validate(int argc, char* argv[]);
}
