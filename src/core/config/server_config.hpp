#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include "core/config/limits.hpp"

namespace runner::core::config {

    // Validated server settings produced by the CLI parser
    struct ServerConfig {
        std::string host = "0.0.0.0";
        std::uint16_t port = 8000;
        bool require_api_key = true;
        std::string api_key_env = std::string(kDefaultApiKeyEnv);
        std::string python_command = "python";
        std::string pytest_command = "pytest";
        std::filesystem::path workspace_root = std::filesystem::temp_directory_path();
        std::uint32_t worker_threads = 8;
        bool verbose = false;
    };

} // namespace runner::core::config
