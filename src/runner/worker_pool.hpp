#pragma once

#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace trialbench::runner {

using Job = std::function<void()>;
using ThreadSpawner = std::function<std::jthread(std::function<void()>)>;

// Runs every job with at most max_workers in flight (values below 1 mean 1).
// A job fails by throwing; the messages of all failed jobs are returned once
// every job has finished.
std::vector<std::string> RunPool(int max_workers, const std::vector<Job>& jobs);

// As above with thread creation delegated to `spawn`. If a spawn throws after
// at least one worker started, the started workers drain the remaining jobs.
// If the first spawn throws, the exception propagates.
std::vector<std::string> RunPool(int max_workers, const std::vector<Job>& jobs, const ThreadSpawner& spawn);

}  // namespace trialbench::runner
