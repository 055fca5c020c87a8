#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include "core/config/limits.hpp"
#include "core/errors/runner_errors.hpp"
#include "protocol/run_result.hpp"
#include "protocol/run_spec.hpp"

namespace runner::policy {

struct AuthPolicy {
    bool require_api_key = true;
    // Name of the environment variable holding the shared secret. It is read
    // on every check so the secret can be rotated without a restart.
    std::string api_key_env = std::string(core::config::kDefaultApiKeyEnv);
};

class PolicyGuard {
public:
    explicit PolicyGuard(AuthPolicy auth_policy = {},
                         std::size_t max_code_chars = core::config::kMaxCodeChars);

    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    // Rejects oversized code/tests before any workspace exists.
    core::errors::Result<protocol::RunSpec> validate_run_spec(
        protocol::RunSpec spec, protocol::ExecutionMode mode) const;

    // Compares the caller's key with the configured secret. A missing secret
    // is a Configuration error, a missing or wrong key an Authorization error.
    core::errors::Result<bool> authorize(
        const std::optional<std::string>& provided_key) const;

    const AuthPolicy& auth_policy() const { return auth_policy_; }

private:
    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);

    AuthPolicy auth_policy_;
    std::size_t max_code_chars_;
};

}  // namespace runner::policy
