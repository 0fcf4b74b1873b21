#include "sandbox/process_runner.hpp"

#include <boost/process.hpp>
#include <atomic>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace trialbench::sandbox {
namespace bp = boost::process;
namespace {

std::filesystem::path TempCapturePath(const std::string& stream) {
    static std::atomic<unsigned long> counter{0};
    const auto stamp = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    return std::filesystem::temp_directory_path() /
        ("trialbench_" + stream + "_" + std::to_string(::getpid()) + "_" + stamp + "_" +
         std::to_string(counter.fetch_add(1)) + ".log");
}

std::string ReadCapture(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return "";
    }
    std::ostringstream stream;
    stream << input.rdbuf();
    return stream.str();
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

bool WaitUntil(bp::child& child, std::chrono::steady_clock::time_point deadline,
               std::chrono::milliseconds poll) {
    while (std::chrono::steady_clock::now() < deadline) {
        std::error_code ec;
        if (!child.running(ec)) {
            return true;
        }
        std::this_thread::sleep_for(poll);
    }
    std::error_code ec;
    return !child.running(ec);
}

}  // namespace

ProcessResult ProcessRunner::Run(const std::vector<std::string>& argv, const ProcessOptions& options) {
    if (argv.empty()) {
        throw std::invalid_argument("process runner: empty command");
    }

    boost::filesystem::path exe = argv.front();
    if (argv.front().find('/') == std::string::npos) {
        exe = bp::search_path(argv.front());
        if (exe.empty()) {
            throw std::runtime_error("exec failed: " + argv.front() + " not found in PATH");
        }
    }
    const std::vector<std::string> args(argv.begin() + 1, argv.end());
    const auto start_dir = options.working_dir.empty()
        ? std::filesystem::current_path().string()
        : options.working_dir.string();

    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : options.env) {
        env[key] = value;
    }

    const auto stdout_path = TempCapturePath("stdout");
    const auto stderr_path = TempCapturePath("stderr");
    auto remove_captures = [&]() {
        std::error_code ec;
        std::filesystem::remove(stdout_path, ec);
        std::filesystem::remove(stderr_path, ec);
    };

    ProcessResult result{};
    try {
        bp::child child = options.merge_stderr
            ? bp::child(exe, bp::args(args), env,
                        bp::start_dir = start_dir,
                        bp::std_in < bp::null,
                        (bp::std_out & bp::std_err) > stdout_path.string())
            : bp::child(exe, bp::args(args), env,
                        bp::start_dir = start_dir,
                        bp::std_in < bp::null,
                        bp::std_out > stdout_path.string(),
                        bp::std_err > stderr_path.string());

        const bool has_deadline = options.timeout.count() > 0;
        const auto deadline = std::chrono::steady_clock::now() + options.timeout;
        bool finished = false;
        while (true) {
            std::error_code ec;
            if (!child.running(ec)) {
                finished = true;
                break;
            }
            if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
                break;
            }
            if (options.stop.stop_requested()) {
                result.cancelled = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (!finished) {
            ::kill(child.id(), SIGTERM);
            finished = WaitUntil(
                child,
                std::chrono::steady_clock::now() + std::chrono::seconds(2),
                std::chrono::milliseconds(100));
            if (!finished) {
                std::error_code ec;
                child.terminate(ec);
            }
        }

        if (finished) {
            result.exit_code = DecodeStatus(child.native_exit_code());
        } else {
            result.exit_code = 124;
        }
    } catch (const bp::process_error& ex) {
        remove_captures();
        throw std::runtime_error(std::string("exec failed: ") + argv.front() + ": " + ex.what());
    }

    result.output = ReadCapture(stdout_path);
    if (!options.merge_stderr) {
        result.error = ReadCapture(stderr_path);
    }
    remove_captures();
    return result;
}

CommandExecutor DefaultCommandExecutor() {
    return [](const std::vector<std::string>& argv, const ProcessOptions& options) {
        return ProcessRunner::Run(argv, options);
    };
}

}  // namespace trialbench::sandbox
