#pragma once

#include <chrono>
#include <filesystem>
#include <stop_token>
#include <string>

#include "sandbox/process_runner.hpp"

namespace trialbench::validation {

// Runs one shell command inside an image with the workspace mounted at
// /workspace. Output is stdout and stderr combined. Throws std::runtime_error
// when the engine cannot be launched or the caller cancels.
class ValidationRunner {
public:
    virtual ~ValidationRunner() = default;
    virtual sandbox::ProcessResult RunInImage(const std::filesystem::path& work_dir,
                                              const std::string& image,
                                              const std::string& command,
                                              std::stop_token stop) = 0;
};

class DockerValidationRunner : public ValidationRunner {
public:
    explicit DockerValidationRunner(std::string engine = "docker",
                                    sandbox::CommandExecutor executor = sandbox::DefaultCommandExecutor(),
                                    std::chrono::milliseconds timeout = std::chrono::minutes(15));

    sandbox::ProcessResult RunInImage(const std::filesystem::path& work_dir,
                                      const std::string& image,
                                      const std::string& command,
                                      std::stop_token stop) override;

private:
    std::string engine_;
    sandbox::CommandExecutor executor_;
    std::chrono::milliseconds timeout_;
};

}  // namespace trialbench::validation
