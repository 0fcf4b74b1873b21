#include "gitops/git_client.hpp"

#include <atomic>
#include <chrono>
#include <regex>
#include <stdexcept>
#include <unistd.h>

#include "utils/common.hpp"

namespace trialbench::gitops {
namespace {

const std::regex& ValidTag() {
    static const std::regex pattern("^[a-zA-Z0-9][a-zA-Z0-9._/-]*$");
    return pattern;
}

constexpr auto kCloneTimeout = std::chrono::minutes(10);

}  // namespace

void ValidateCloneArgs(const std::string& repo, const std::string& tag) {
    if (repo.empty()) {
        throw std::invalid_argument("invalid repo: must not be empty");
    }
    if (repo.front() == '-') {
        throw std::invalid_argument("invalid repo \"" + repo + "\": must not start with -");
    }
    if (!std::regex_match(tag, ValidTag())) {
        throw std::invalid_argument("invalid tag \"" + tag +
                                    "\": must match ^[a-zA-Z0-9][a-zA-Z0-9._/-]*$");
    }
}

std::filesystem::path SourceControl::CloneToTemp(const std::string& repo, const std::string& tag) {
    ValidateCloneArgs(repo, tag);
    static std::atomic<unsigned long> counter{0};
    const auto dir = std::filesystem::temp_directory_path() /
        ("trialbench-validation-" + std::to_string(::getpid()) + "-" +
         std::to_string(counter.fetch_add(1)) + "-" +
         std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    try {
        CloneAt(repo, tag, dir);
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        throw;
    }
    return dir;
}

GitCli::GitCli(sandbox::CommandExecutor executor)
    : executor_(std::move(executor)) {}

void GitCli::CloneAt(const std::string& repo,
                     const std::string& tag,
                     const std::filesystem::path& dest) {
    ValidateCloneArgs(repo, tag);

    auto parent = dest.parent_path();
    if (parent.empty()) {
        parent = std::filesystem::current_path();
    }
    std::filesystem::create_directories(parent);

    sandbox::ProcessOptions options{};
    options.working_dir = parent;
    options.timeout = kCloneTimeout;
    options.merge_stderr = true;
    // "--" ends option parsing before the positional repo and destination.
    const auto result = executor_(
        {"git", "clone", "--branch", tag, "--depth", "1", "--", repo, dest.string()},
        options);
    if (!result.Ok()) {
        throw std::runtime_error("git clone " + repo + " at " + tag + ": " +
                                 utils::Trim(result.output) +
                                 (result.timed_out ? " (timed out)" : ""));
    }
}

std::string GitCli::CaptureChanges(const std::filesystem::path& repo_dir) {
    sandbox::ProcessOptions options{};
    options.working_dir = repo_dir;
    options.timeout = std::chrono::minutes(5);

    const auto added = executor_({"git", "-C", repo_dir.string(), "add", "-A"}, options);
    if (!added.Ok()) {
        throw std::runtime_error("git add -A: " + utils::Trim(added.output + added.error));
    }
    const auto diff = executor_({"git", "-C", repo_dir.string(), "diff", "--cached"}, options);
    if (!diff.Ok()) {
        throw std::runtime_error("git diff --cached: " + utils::Trim(diff.error));
    }
    return diff.output;
}

void CopyDir(const std::filesystem::path& src, const std::filesystem::path& dst) {
    namespace fs = std::filesystem;
    fs::create_directories(dst);
    for (auto it = fs::recursive_directory_iterator(src); it != fs::recursive_directory_iterator(); ++it) {
        const auto rel = fs::relative(it->path(), src);
        if (*rel.begin() == ".git") {
            if (it->is_directory()) {
                it.disable_recursion_pending();
            }
            continue;
        }
        const auto target = dst / rel;
        if (it->is_directory()) {
            fs::create_directories(target);
        } else if (it->is_regular_file()) {
            fs::create_directories(target.parent_path());
            fs::copy_file(it->path(), target, fs::copy_options::overwrite_existing);
        }
    }
}

}  // namespace trialbench::gitops
