#include "session/workspace.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <system_error>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"

namespace runner::session {

using core::errors::ErrorCategory;
using core::errors::RunnerError;

Workspace::Workspace(std::filesystem::path path) : path_(std::move(path)) {}

Workspace::Workspace(Workspace&& other) noexcept
    : path_(std::exchange(other.path_, std::filesystem::path())) {}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::exchange(other.path_, std::filesystem::path());
    }
    return *this;
}

Workspace::~Workspace() { remove(); }

core::errors::Result<Workspace> Workspace::create(const std::filesystem::path& root,
                                                  const std::string& prefix) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return RunnerError{ErrorCategory::Internal,
                           "Workspace root is not a directory: " + root.string(),
                           "invalid_workspace_root"};
    }

    const std::string templ = (root / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(templ.begin(), templ.end());
    buffer.push_back('\0');
    if (mkdtemp(buffer.data()) == nullptr) {
        const int err = errno;
        return RunnerError{ErrorCategory::Internal,
                           "Unable to create workspace under " + root.string() + ": " +
                               std::strerror(err),
                           "workspace_create_failed"};
    }

    std::filesystem::path created(buffer.data());
    LOG_DEBUG("Workspace: created " + created.string());
    return Workspace(std::move(created));
}

core::errors::Result<std::filesystem::path> Workspace::write_file(
    const std::string& name, const std::string& content) const {
    if (path_.empty()) {
        return RunnerError{ErrorCategory::Internal, "Workspace was already removed.",
                           "workspace_removed"};
    }

    const policy::PolicyGuard policy_guard;
    auto resolved = policy_guard.validate_path_in_workspace(path_, name);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return RunnerError{ErrorCategory::Internal,
                           "Unable to open workspace file: " + file_path.string(),
                           "workspace_write_failed"};
    }

    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out.good()) {
        return RunnerError{ErrorCategory::Internal,
                           "Unable to write workspace file: " + file_path.string(),
                           "workspace_write_failed"};
    }

    return file_path;
}

void Workspace::remove() noexcept {
    if (path_.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        LOG_WARN("Workspace: failed to remove " + path_.string() + ": " + ec.message());
    } else {
        LOG_DEBUG("Workspace: removed " + path_.string());
    }
    path_.clear();
}

core::errors::Result<Workspace> stage_workspace(const std::filesystem::path& root,
                                                const std::string& prefix,
                                                const std::vector<StagedFile>& files) {
    auto created = Workspace::create(root, prefix);
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }
    Workspace workspace = std::move(core::errors::get_value(created));

    for (const auto& file : files) {
        auto written = workspace.write_file(file.name, file.content);
        if (core::errors::is_error(written)) {
            return core::errors::get_error(written);
        }
    }
    return std::move(workspace);
}

}  // namespace runner::session
