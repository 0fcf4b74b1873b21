#include "validation/validation_runner.hpp"

#include <atomic>
#include <stdexcept>
#include <unistd.h>

#include "utils/logging.hpp"

namespace trialbench::validation {
namespace {

using utils::LogLevel;
using utils::LogLine;

std::string NextContainerName() {
    static std::atomic<unsigned long> counter{0};
    return "trialbench-val-" + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1));
}

}  // namespace

DockerValidationRunner::DockerValidationRunner(std::string engine,
                                               sandbox::CommandExecutor executor,
                                               std::chrono::milliseconds timeout)
    : engine_(std::move(engine))
    , executor_(std::move(executor))
    , timeout_(timeout) {}

sandbox::ProcessResult DockerValidationRunner::RunInImage(const std::filesystem::path& work_dir,
                                                          const std::string& image,
                                                          const std::string& command,
                                                          std::stop_token stop) {
    const auto name = NextContainerName();
    sandbox::ProcessOptions options{};
    options.timeout = timeout_;
    options.merge_stderr = true;
    options.stop = stop;

    auto result = executor_(
        {engine_, "run", "--rm", "--init", "--name", name, "--label", "trialbench=true",
         "-v", std::filesystem::absolute(work_dir).string() + ":/workspace", "-w", "/workspace",
         image, "sh", "-c", command},
        options);

    if (result.timed_out || result.cancelled) {
        // Killing the client leaves the container running.
        sandbox::ProcessOptions cleanup{};
        cleanup.timeout = std::chrono::seconds(60);
        const auto removed = executor_({engine_, "rm", "-f", name}, cleanup);
        if (!removed.Ok()) {
            LogLine(LogLevel::kWarn, "validation") << "removing " << name << ": " << removed.error;
        }
    }
    if (result.cancelled) {
        throw std::runtime_error("validation command cancelled");
    }
    return result;
}

}  // namespace trialbench::validation
