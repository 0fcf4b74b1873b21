#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <stop_token>
#include <string>
#include <vector>

namespace trialbench::sandbox {

struct ProcessOptions {
    std::filesystem::path working_dir;
    // Zero means no deadline.
    std::chrono::milliseconds timeout{0};
    // Added on top of the inherited environment.
    std::map<std::string, std::string> env;
    bool merge_stderr = false;
    std::stop_token stop;
};

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string output;
    std::string error;

    bool Ok() const { return exit_code == 0 && !timed_out && !cancelled; }
};

// Runs argv directly (no shell). Throws std::runtime_error when the process
// cannot be launched; every other outcome is reported in ProcessResult.
class ProcessRunner {
public:
    static ProcessResult Run(const std::vector<std::string>& argv, const ProcessOptions& options);
};

using CommandExecutor =
    std::function<ProcessResult(const std::vector<std::string>&, const ProcessOptions&)>;

CommandExecutor DefaultCommandExecutor();

}  // namespace trialbench::sandbox
