#include "policy/policy_guard.hpp"

#include <cstdlib>
#include <system_error>
#include <utility>
#include "core/text/utf8.hpp"

namespace runner::policy {

using core::errors::ErrorCategory;
using core::errors::RunnerError;

PolicyGuard::PolicyGuard(AuthPolicy auth_policy, const std::size_t max_code_chars)
    : auth_policy_(std::move(auth_policy)), max_code_chars_(max_code_chars) {}

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::exists(workspace_root, ec) || ec) {
        return RunnerError{ErrorCategory::Internal,
                           "Workspace root does not exist: " +
                               workspace_root.string(),
                           "invalid_workspace_root"};
    }
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return RunnerError{ErrorCategory::Internal,
                           "Workspace root is not a directory: " +
                               workspace_root.string(),
                           "invalid_workspace_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root, ec);
    if (ec) {
        return RunnerError{ErrorCategory::Internal,
                           "Unable to resolve workspace root: " +
                               workspace_root.string(),
                           "invalid_workspace_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return RunnerError{ErrorCategory::Policy,
                           "Unable to resolve target path: " + target_path.string(),
                           "invalid_path"};
    }

    // The root itself is not a stageable file.
    if (canonical_candidate == canonical_root ||
        !is_within_root(canonical_root, canonical_candidate)) {
        return RunnerError{ErrorCategory::Policy,
                           "Path escapes workspace root: " +
                               canonical_candidate.string(),
                           "path_outside_workspace"};
    }

    return canonical_candidate;
}

core::errors::Result<protocol::RunSpec> PolicyGuard::validate_run_spec(
    protocol::RunSpec spec, const protocol::ExecutionMode mode) const {
    const bool code_too_large =
        core::text::count_chars(spec.source_text) > max_code_chars_;
    const bool tests_too_large =
        spec.test_text.has_value() &&
        core::text::count_chars(spec.test_text.value()) > max_code_chars_;

    if (mode == protocol::ExecutionMode::Run && code_too_large) {
        return RunnerError{ErrorCategory::Input, "Code too large", "payload_too_large",
                           "Limit is " + std::to_string(max_code_chars_) +
                               " characters."};
    }
    if (mode == protocol::ExecutionMode::Test && (code_too_large || tests_too_large)) {
        return RunnerError{ErrorCategory::Input, "Code or tests too large",
                           "payload_too_large",
                           "Limit is " + std::to_string(max_code_chars_) +
                               " characters per field."};
    }
    if (mode == protocol::ExecutionMode::Test && !spec.test_text.has_value()) {
        return RunnerError{ErrorCategory::Input, "Field required: tests",
                           "missing_field"};
    }
    return spec;
}

core::errors::Result<bool> PolicyGuard::authorize(
    const std::optional<std::string>& provided_key) const {
    if (!auth_policy_.require_api_key) {
        return true;
    }

    const char* expected = std::getenv(auth_policy_.api_key_env.c_str());
    if (expected == nullptr || expected[0] == '\0') {
        return RunnerError{ErrorCategory::Configuration, "API not configured",
                           "missing_api_key_config",
                           "Set " + auth_policy_.api_key_env +
                               " or start the server with --no-auth."};
    }
    if (!provided_key.has_value() || provided_key.value() != expected) {
        return RunnerError{ErrorCategory::Authorization, "Invalid or missing API key",
                           "invalid_api_key"};
    }
    return true;
}

}  // namespace runner::policy
