#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/runner_errors.hpp"

namespace runner::session {

struct StagedFile {
    std::string name;
    std::string content;
};

// Owns one per-request directory. The directory and everything in it is
// removed when the Workspace is destroyed or remove() is called, whichever
// comes first.
class Workspace {
public:
    // Creates `<root>/<prefix>XXXXXX` with mkdtemp (mode 0700).
    static core::errors::Result<Workspace> create(const std::filesystem::path& root,
                                                  const std::string& prefix);

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;
    ~Workspace();

    // Writes `content` byte for byte to `name`, which must stay inside the
    // workspace.
    core::errors::Result<std::filesystem::path> write_file(
        const std::string& name, const std::string& content) const;

    const std::filesystem::path& path() const { return path_; }

    // Best-effort recursive removal. Errors are logged, never thrown.
    void remove() noexcept;

private:
    explicit Workspace(std::filesystem::path path);

    std::filesystem::path path_;
};

// Creates a workspace and writes every file into it. On any failure the
// partially staged directory is removed before the error is returned.
core::errors::Result<Workspace> stage_workspace(const std::filesystem::path& root,
                                                const std::string& prefix,
                                                const std::vector<StagedFile>& files);

}  // namespace runner::session
