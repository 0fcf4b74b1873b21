#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "gitops/git_client.hpp"
#include "result/trial_meta.hpp"
#include "sandbox/container_runner.hpp"

namespace trialbench::runner {

inline constexpr const char* kNoTaskDescription = "No task description available";

// timed_out -> "timeout"; 0 -> "completed"; 2 -> "gave_up"; else "crashed".
std::string ExitReasonFromCode(int exit_code, bool timed_out);

// Category tiers: marathon* -> 60 min, *complex* -> 30 min, else 10 min.
std::chrono::minutes TimeoutForCategory(const std::string& category);
// time_limit_minutes when positive, else the category tier.
std::chrono::minutes TimeoutForTask(const config::TaskConfig& task);

// Last path component of the repository URL.
std::string TaskName(const config::TaskConfig& task);

struct TrialOpts {
    config::OrchestratorConfig orchestrator;
    config::TaskConfig task;
    int trial = 1;
    std::filesystem::path run_dir;
    // Host-side gateway URL; rewritten for the container. Empty disables it.
    std::string gateway_url;
    std::filesystem::path usage_log;
    // Zero means TimeoutForTask.
    std::chrono::milliseconds timeout{0};
    bool isolate_network = false;
    std::vector<std::string> allowlist;
    double cpu_limit = 0.0;
    std::int64_t memory_limit = 0;
    double budget_usd = 0.0;
};

class TrialRunner {
public:
    TrialRunner(sandbox::ContainerRunner& container, gitops::SourceControl& source_control);

    // Clone, run the adapter, capture the diff, account usage and persist
    // meta.json. Setup failures throw and leave no meta.json behind.
    result::TrialMeta RunTrial(const TrialOpts& opts, std::stop_token stop);

private:
    std::vector<sandbox::Mount> BuildMounts(const TrialOpts& opts,
                                            const std::filesystem::path& task_desc_path) const;

    sandbox::ContainerRunner& container_;
    gitops::SourceControl& source_control_;
};

}  // namespace trialbench::runner
