#include "runner/trial_runner.hpp"

#include <fstream>
#include <stdexcept>
#include <unistd.h>

#include "gateway/cost_gateway.hpp"
#include "gateway/usage_log.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace trialbench::runner {
namespace {

namespace fs = std::filesystem;
using utils::LogLevel;
using utils::LogLine;

fs::path ExpandHome(const std::string& path) {
    if (path == "~" || utils::StartsWith(path, "~/")) {
        const auto home = utils::GetEnv("HOME");
        if (!home.empty()) {
            return fs::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("writing " + path.string());
    }
    output << content;
}

void WriteTaskDescription(const fs::path& work_dir, const fs::path& dest) {
    std::error_code ec;
    const auto source = work_dir / "TASK.md";
    if (fs::is_regular_file(source, ec)) {
        fs::copy_file(source, dest, fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            return;
        }
        LogLine(LogLevel::kWarn, "runner") << "copying TASK.md: " << ec.message();
    }
    WriteFile(dest, kNoTaskDescription);
}

}  // namespace

std::string ExitReasonFromCode(int exit_code, bool timed_out) {
    if (timed_out) {
        return "timeout";
    }
    switch (exit_code) {
        case 0:
            return "completed";
        case 2:
            return "gave_up";
        default:
            return "crashed";
    }
}

std::chrono::minutes TimeoutForCategory(const std::string& category) {
    if (utils::StartsWith(category, "marathon")) {
        return std::chrono::minutes(60);
    }
    if (category.find("complex") != std::string::npos) {
        return std::chrono::minutes(30);
    }
    return std::chrono::minutes(10);
}

std::chrono::minutes TimeoutForTask(const config::TaskConfig& task) {
    if (task.time_limit_minutes > 0) {
        return std::chrono::minutes(task.time_limit_minutes);
    }
    return TimeoutForCategory(task.category);
}

std::string TaskName(const config::TaskConfig& task) {
    auto repo = task.repo;
    while (!repo.empty() && repo.back() == '/') {
        repo.pop_back();
    }
    const auto slash = repo.find_last_of('/');
    return slash == std::string::npos ? repo : repo.substr(slash + 1);
}

TrialRunner::TrialRunner(sandbox::ContainerRunner& container, gitops::SourceControl& source_control)
    : container_(container)
    , source_control_(source_control) {}

std::vector<sandbox::Mount> TrialRunner::BuildMounts(const TrialOpts& opts,
                                                     const fs::path& task_desc_path) const {
    const auto adapter = fs::absolute(ExpandHome(opts.orchestrator.adapter));
    if (!fs::is_regular_file(adapter)) {
        throw std::runtime_error("adapter not found: " + adapter.string());
    }
    std::vector<sandbox::Mount> mounts{
        {adapter, "/adapter.sh", true},
        {task_desc_path, "/task.md", true}};
    for (const auto& mount : opts.orchestrator.mounts) {
        const auto source = ExpandHome(mount.source);
        std::error_code ec;
        if (mount.target.empty() || !fs::exists(source, ec)) {
            LogLine(LogLevel::kDebug, "runner") << "skipping mount " << mount.source;
            continue;
        }
        mounts.push_back({fs::absolute(source), mount.target, true});
    }
    return mounts;
}

result::TrialMeta TrialRunner::RunTrial(const TrialOpts& opts, std::stop_token stop) {
    const auto task_name = TaskName(opts.task);
    const auto trial_dir = result::TrialDir(opts.run_dir, opts.orchestrator.name, task_name, opts.trial);
    fs::create_directories(trial_dir);

    const auto work_dir = trial_dir / "workspace";
    fs::remove_all(work_dir);
    try {
        source_control_.CloneAt(opts.task.repo, opts.task.tag, work_dir);
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string("cloning task repo: ") + ex.what());
    }

    const auto task_desc_path = trial_dir / "task.md";
    WriteTaskDescription(work_dir, task_desc_path);

    sandbox::RunOpts run{};
    run.image = opts.orchestrator.image;
    run.command = {"bash", "/adapter.sh"};
    run.work_dir = fs::absolute(work_dir);
    run.env = {{"TASK_DIR", sandbox::kWorkspaceMountTarget}, {"TASK_DESCRIPTION", "/task.md"}};
    if (!opts.gateway_url.empty()) {
        run.env["PROXY_URL"] = gateway::RewriteForContainer(opts.gateway_url);
    }
    for (const auto& [key, value] : opts.orchestrator.env) {
        run.env[key] = value;
    }
    run.timeout = opts.timeout.count() > 0 ? opts.timeout
                                           : std::chrono::milliseconds(TimeoutForTask(opts.task));
    run.extra_mounts = BuildMounts(opts, fs::absolute(task_desc_path));
    run.isolate_network = opts.isolate_network;
    run.allowlist = opts.allowlist;
    run.cpu_limit = opts.cpu_limit;
    run.memory_limit = opts.memory_limit;
    run.user = std::to_string(::getuid()) + ":" + std::to_string(::getgid());

    LogLine(LogLevel::kInfo, "runner") << opts.orchestrator.name << "/" << task_name << " trial "
                                       << opts.trial << " starting (timeout "
                                       << std::chrono::duration_cast<std::chrono::minutes>(run.timeout).count()
                                       << "m)";
    const auto window_start = utils::ToEpochSeconds(utils::Now());
    sandbox::RunResult outcome{};
    try {
        outcome = container_.Run(run, stop);
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string("running container: ") + ex.what());
    }
    const auto window_end = utils::ToEpochSeconds(utils::Now());

    std::string diff;
    try {
        diff = source_control_.CaptureChanges(work_dir);
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string("capturing changes: ") + ex.what());
    }
    WriteFile(trial_dir / "diff.patch", diff);

    result::TrialMeta meta{};
    meta.orchestrator = opts.orchestrator.name;
    meta.task = task_name;
    meta.trial = opts.trial;
    meta.duration_s = static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(outcome.duration).count());
    meta.exit_code = outcome.exit_code;
    meta.exit_reason = ExitReasonFromCode(outcome.exit_code, outcome.timed_out);

    std::error_code usage_ec;
    if (!opts.usage_log.empty() && fs::exists(opts.usage_log, usage_ec)) {
        try {
            const auto records = gateway::FilterWindow(
                gateway::ParseUsageLogs(opts.usage_log), window_start, window_end);
            const auto totals = gateway::TotalUsage(records);
            meta.input_tokens = totals.input_tokens;
            meta.output_tokens = totals.output_tokens;
            meta.total_tokens = totals.Total();
            meta.total_cost_usd = gateway::EstimateCost(records);
            meta.budget_exceeded = opts.budget_usd > 0.0 && meta.total_cost_usd > opts.budget_usd;
        } catch (const std::exception& ex) {
            LogLine(LogLevel::kWarn, "runner") << "usage for " << task_name << " trial " << opts.trial
                                               << " unavailable: " << ex.what();
        }
    }

    result::WriteTrialMeta(trial_dir, meta);
    LogLine(LogLevel::kInfo, "runner") << opts.orchestrator.name << "/" << task_name << " trial " << opts.trial
                                       << " " << meta.exit_reason << " in " << meta.duration_s << "s, "
                                       << meta.total_tokens << " tokens, $" << meta.total_cost_usd;
    return meta;
}

}  // namespace trialbench::runner
