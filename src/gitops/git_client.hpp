#pragma once

#include <filesystem>
#include <string>

#include "sandbox/process_runner.hpp"

namespace trialbench::gitops {

// Throws std::invalid_argument for a repo that looks like an option or a tag
// outside ^[a-zA-Z0-9][a-zA-Z0-9._/-]*$.
void ValidateCloneArgs(const std::string& repo, const std::string& tag);

class SourceControl {
public:
    virtual ~SourceControl() = default;

    // Shallow clone of repo at tag into dest.
    virtual void CloneAt(const std::string& repo,
                         const std::string& tag,
                         const std::filesystem::path& dest) = 0;

    // Stages every change under repo_dir (untracked files included) and
    // returns the staged diff.
    virtual std::string CaptureChanges(const std::filesystem::path& repo_dir) = 0;

    // Clones into a fresh temporary directory and returns its path.
    virtual std::filesystem::path CloneToTemp(const std::string& repo, const std::string& tag);
};

// Uses the git binary. Every invocation names its working directory explicitly.
class GitCli : public SourceControl {
public:
    explicit GitCli(sandbox::CommandExecutor executor = sandbox::DefaultCommandExecutor());

    void CloneAt(const std::string& repo,
                 const std::string& tag,
                 const std::filesystem::path& dest) override;
    std::string CaptureChanges(const std::filesystem::path& repo_dir) override;

private:
    sandbox::CommandExecutor executor_;
};

// Copies regular files and directories from src into dst, skipping .git.
// Existing files in dst are overwritten.
void CopyDir(const std::filesystem::path& src, const std::filesystem::path& dst);

}  // namespace trialbench::gitops
