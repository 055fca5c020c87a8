#include "cli_parser.hpp"
#include <charconv>
#include <cstdlib>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace runner::app::cli {

    using namespace runner::core::errors;
    using runner::core::config::ServerConfig;

    // 1. Raw options struct (internal only)
    struct RawCliOptions {
        std::optional<std::string> host;
        std::optional<std::string> port;
        std::optional<std::string> api_key_env;
        std::optional<std::string> python;
        std::optional<std::string> pytest;
        std::optional<std::string> workspace_root;
        std::optional<std::string> threads;
        bool no_auth = false;
        bool verbose = false;
    };

    namespace {

        // Exception-free bounded integer parsing
        std::optional<std::uint32_t> parse_bounded(const std::string& text, std::uint32_t min, std::uint32_t max) {
            std::uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end || value < min || value > max) {
                return std::nullopt;
            }
            return value;
        }

    } // namespace

    Result<ServerConfig> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return RunnerError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: code_runner serve [--port N] [--no-auth] ..."};
        }

        std::string command = argv[1];
        if (command != "serve") {
            return RunnerError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'serve' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'serve' command
            args.push_back(argv[i]);
        }

        // 2. Parser phase: just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            auto take_value = [&](std::optional<std::string>& slot) -> bool {
                if (i + 1 >= args.size()) return false;
                slot = args[++i];
                return true;
            };

            if (args[i] == "--host") {
                if (!take_value(raw.host)) return RunnerError{ErrorCategory::Input, "Missing value for --host", "missing_value"};
            } else if (args[i] == "--port") {
                if (!take_value(raw.port)) return RunnerError{ErrorCategory::Input, "Missing value for --port", "missing_value"};
            } else if (args[i] == "--api-key-env") {
                if (!take_value(raw.api_key_env)) return RunnerError{ErrorCategory::Input, "Missing value for --api-key-env", "missing_value"};
            } else if (args[i] == "--python") {
                if (!take_value(raw.python)) return RunnerError{ErrorCategory::Input, "Missing value for --python", "missing_value"};
            } else if (args[i] == "--pytest") {
                if (!take_value(raw.pytest)) return RunnerError{ErrorCategory::Input, "Missing value for --pytest", "missing_value"};
            } else if (args[i] == "--workspace-root") {
                if (!take_value(raw.workspace_root)) return RunnerError{ErrorCategory::Input, "Missing value for --workspace-root", "missing_value"};
            } else if (args[i] == "--threads") {
                if (!take_value(raw.threads)) return RunnerError{ErrorCategory::Input, "Missing value for --threads", "missing_value"};
            } else if (args[i] == "--no-auth") {
                raw.no_auth = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return RunnerError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator phase: enforce logic and bounds
        ServerConfig config;
        config.verbose = raw.verbose;
        config.require_api_key = !raw.no_auth;

        if (raw.host) {
            if (raw.host->empty()) {
                return RunnerError{ErrorCategory::Input, "--host cannot be empty", "invalid_host"};
            }
            config.host = raw.host.value();
        }

        // Hosting platforms hand the port over in $PORT
        std::optional<std::string> port_text = raw.port;
        if (!port_text) {
            const char* env_port = std::getenv("PORT");
            if (env_port != nullptr && env_port[0] != '\0') port_text = std::string(env_port);
        }
        if (port_text) {
            auto port = parse_bounded(port_text.value(), 1, 65535);
            if (!port) {
                return RunnerError{ErrorCategory::Input, "Invalid port: " + port_text.value(), "invalid_port", "Must be between 1 and 65535."};
            }
            config.port = static_cast<std::uint16_t>(port.value());
        }

        if (raw.threads) {
            auto threads = parse_bounded(raw.threads.value(), 1, 256);
            if (!threads) {
                return RunnerError{ErrorCategory::Input, "Invalid number for --threads", "bounds_error", "Must be between 1 and 256."};
            }
            config.worker_threads = threads.value();
        }

        if (raw.api_key_env) {
            if (raw.api_key_env->empty()) {
                return RunnerError{ErrorCategory::Input, "--api-key-env cannot be empty", "invalid_env_name"};
            }
            config.api_key_env = raw.api_key_env.value();
        }
        if (raw.python) {
            if (raw.python->empty()) {
                return RunnerError{ErrorCategory::Input, "--python cannot be empty", "invalid_command"};
            }
            config.python_command = raw.python.value();
        }
        if (raw.pytest) {
            if (raw.pytest->empty()) {
                return RunnerError{ErrorCategory::Input, "--pytest cannot be empty", "invalid_command"};
            }
            config.pytest_command = raw.pytest.value();
        }

        // Path validation
        if (raw.workspace_root) {
            std::filesystem::path p(raw.workspace_root.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return RunnerError{ErrorCategory::Input, "Workspace root does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return RunnerError{ErrorCategory::Input, "Failed to canonicalize workspace root", "invalid_path"};
            }
            config.workspace_root = std::move(canonical_path);
        }

        return config;
    }

} // namespace runner::app::cli
