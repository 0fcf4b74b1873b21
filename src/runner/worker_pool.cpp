#include "runner/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <system_error>

#include "utils/logging.hpp"

namespace trialbench::runner {

using utils::LogLevel;
using utils::LogLine;

std::vector<std::string> RunPool(int max_workers, const std::vector<Job>& jobs) {
    return RunPool(max_workers, jobs, [](std::function<void()> body) {
        return std::jthread(std::move(body));
    });
}

std::vector<std::string> RunPool(int max_workers, const std::vector<Job>& jobs, const ThreadSpawner& spawn) {
    const auto workers = static_cast<std::size_t>(std::max(1, max_workers));
    std::atomic<std::size_t> next{0};
    std::mutex errors_mutex;
    std::vector<std::string> errors;

    auto worker = [&]() {
        for (auto index = next.fetch_add(1); index < jobs.size(); index = next.fetch_add(1)) {
            std::string error;
            try {
                jobs[index]();
                continue;
            } catch (const std::exception& ex) {
                error = ex.what();
            } catch (...) {
                error = "job " + std::to_string(index) + " failed with a non-standard exception";
            }
            std::lock_guard<std::mutex> lock(errors_mutex);
            errors.push_back(std::move(error));
        }
    };

    // Declared last: destroyed, and so joined, before the state above.
    std::vector<std::jthread> threads;
    const auto count = std::min(workers, jobs.size());
    threads.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        try {
            threads.push_back(spawn(worker));
        } catch (const std::system_error& ex) {
            if (threads.empty()) {
                throw;
            }
            LogLine(LogLevel::kWarn, "pool") << "started " << threads.size() << " of " << count
                                             << " workers: " << ex.what();
            break;
        }
    }
    for (auto& thread : threads) {
        thread.join();
    }
    return errors;
}

}  // namespace trialbench::runner
