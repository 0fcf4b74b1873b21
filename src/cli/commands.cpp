#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "config/config_loader.hpp"
#include "gateway/cost_gateway.hpp"
#include "gitops/git_client.hpp"
#include "providers/llm_provider.hpp"
#include "result/trial_meta.hpp"
#include "runner/trial_runner.hpp"
#include "runner/trial_scorer.hpp"
#include "runner/worker_pool.hpp"
#include "sandbox/container_runner.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "validation/rubric.hpp"
#include "validation/validation_runner.hpp"

namespace {

namespace fs = std::filesystem;
using trialbench::utils::LogLevel;
using trialbench::utils::LogLine;

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

struct CliOptions {
    std::string command;
    std::string config_path = "trialbench.json";
    std::string orchestrator;
    std::string task;
    std::string category;
    std::string run_dir;
    std::optional<int> trials;
    int parallel = 1;
};

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  trialbench run [--config F] [--orchestrator N] [--task N] [--category C|prefix/*]\n"
              << "                 [--trials N] [--parallel N]\n"
              << "  trialbench validate <run-dir> [--config F] [--parallel N]\n"
              << "  trialbench list [--config F]" << std::endl;
}

bool ParseArgs(int argc, char** argv, CliOptions& options) {
    if (argc < 2) {
        return false;
    }
    options.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (!trialbench::utils::StartsWith(arg, "--")) {
            if (options.command == "validate" && options.run_dir.empty()) {
                options.run_dir = arg;
                continue;
            }
            std::cerr << "unexpected argument " << arg << std::endl;
            return false;
        }
        if (i + 1 >= argc) {
            std::cerr << "missing value for " << arg << std::endl;
            return false;
        }
        const std::string value = argv[++i];
        if (arg == "--config") {
            options.config_path = value;
        } else if (arg == "--orchestrator") {
            options.orchestrator = value;
        } else if (arg == "--task") {
            options.task = value;
        } else if (arg == "--category") {
            options.category = value;
        } else if (arg == "--trials") {
            options.trials = std::stoi(value);
        } else if (arg == "--parallel") {
            options.parallel = std::stoi(value);
        } else {
            std::cerr << "unknown flag " << arg << std::endl;
            return false;
        }
    }
    return true;
}

bool MatchesCategory(const std::string& category, const std::string& filter) {
    if (filter.empty()) {
        return true;
    }
    if (trialbench::utils::EndsWith(filter, "/*")) {
        return trialbench::utils::StartsWith(category, filter.substr(0, filter.size() - 1));
    }
    return category == filter;
}

bool MatchesTask(const trialbench::config::TaskConfig& task, const std::string& filter) {
    return filter.empty() || task.name == filter || task.id == filter ||
        trialbench::runner::TaskName(task) == filter;
}

std::map<std::string, std::string> LoadSecrets(const trialbench::config::Config& config) {
    if (config.secrets.env_file.empty()) {
        return {};
    }
    try {
        return trialbench::config::ParseEnvFile(config.secrets.env_file);
    } catch (const std::exception& ex) {
        LogLine(LogLevel::kWarn, "cli") << ex.what() << "; rubric judge falls back to the environment";
        return {};
    }
}

// Translates SIGINT/SIGTERM into a stop request from a normal thread.
class SignalWatcher {
public:
    explicit SignalWatcher(std::stop_source& source)
        : source_(source) {
        struct sigaction action {};
        action.sa_handler = HandleSignal;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);
        thread_ = std::thread([this]() {
            while (!done_.load()) {
                if (g_signal != 0 && !source_.stop_requested()) {
                    LogLine(LogLevel::kWarn, "cli") << "signal " << g_signal << " received, stopping trials";
                    source_.request_stop();
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });
    }

    ~SignalWatcher() {
        done_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    std::stop_source& source_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

int PrintErrors(const std::vector<std::string>& errors) {
    if (errors.empty()) {
        return 0;
    }
    std::cerr << errors.size() << " error(s):" << std::endl;
    for (const auto& error : errors) {
        std::cerr << "  " << error << std::endl;
    }
    return 1;
}

int RunCommand(const CliOptions& options, const trialbench::config::Config& config) {
    using namespace trialbench;

    std::vector<const config::OrchestratorConfig*> orchestrators;
    for (const auto& orchestrator : config.orchestrators) {
        if (options.orchestrator.empty() || orchestrator.name == options.orchestrator) {
            orchestrators.push_back(&orchestrator);
        }
    }
    std::vector<const config::TaskConfig*> tasks;
    for (const auto& task : config.tasks) {
        if (MatchesTask(task, options.task) && MatchesCategory(task.category, options.category)) {
            tasks.push_back(&task);
        }
    }
    if (orchestrators.empty() || tasks.empty()) {
        std::cerr << "no orchestrator/task combinations match the filters" << std::endl;
        return 1;
    }
    const int trials = options.trials.value_or(config.trials);
    if (trials < 1) {
        std::cerr << "--trials must be at least 1" << std::endl;
        return 1;
    }

    const auto run_dir = result::CreateRunDir(config.results.dir);
    const auto secrets = LoadSecrets(config);
    std::cout << "Run directory: " << run_dir.string() << std::endl;

    sandbox::DockerCliRunner container(config.sandbox.engine);
    gitops::GitCli git;
    validation::DockerValidationRunner validator(config.sandbox.engine);

    std::stop_source stop_source;
    SignalWatcher watcher(stop_source);
    std::mutex output_mutex;

    std::vector<runner::Job> jobs;
    for (const auto* orchestrator : orchestrators) {
        for (const auto* task : tasks) {
            for (int trial = 1; trial <= trials; ++trial) {
                jobs.push_back([&, orchestrator, task, trial]() {
                    const auto label = orchestrator->name + "/" + runner::TaskName(*task) + " trial " +
                        std::to_string(trial);
                    try {
                        const auto stop = stop_source.get_token();
                        if (stop.stop_requested()) {
                            throw std::runtime_error("not started, run cancelled");
                        }

                        gateway::StartOpts gateway_opts{};
                        gateway_opts.proxy_command = config.proxy.command;
                        gateway_opts.upstream = config.proxy.upstream;
                        gateway_opts.log_dir = config.proxy.log_dir;
                        const auto gateway = gateway::CostGateway::Start(gateway_opts, stop);
                        LogLine(LogLevel::kDebug, "cli") << label << ": proxy log "
                                                         << gateway->ServerLogPath().string();

                        runner::TrialOpts opts{};
                        opts.orchestrator = *orchestrator;
                        opts.task = *task;
                        opts.trial = trial;
                        opts.run_dir = run_dir;
                        opts.gateway_url = gateway->URL();
                        opts.usage_log = gateway->UsageLogPath();
                        opts.isolate_network = config.network.isolate;
                        opts.allowlist = config.network.allowlist;
                        opts.cpu_limit = config.sandbox.cpu_limit;
                        opts.memory_limit = config.sandbox.memory_limit_bytes;
                        opts.budget_usd = config.proxy.budget_per_trial_usd;

                        runner::TrialRunner trial_runner(container, git);
                        const auto meta = trial_runner.RunTrial(opts, stop);

                        const auto settings = providers::ResolveJudgeSettings(
                            secrets, gateway->URL(), config.proxy.judge_model);
                        auto provider = providers::CreateProvider(settings);
                        validation::LLMRubricJudge judge(
                            *provider, {settings.model, config.proxy.judge_samples});
                        runner::TrialScorer scorer(validator, judge, git);
                        const auto scored = scorer.ValidateAndScore(
                            result::TrialDir(run_dir, meta.orchestrator, meta.task, meta.trial), *task, stop);

                        std::lock_guard<std::mutex> lock(output_mutex);
                        std::cout << label << ": " << scored.exit_reason << " (exit " << scored.exit_code
                                  << ", " << scored.duration_s << "s) composite=" << scored.composite_score
                                  << " tokens=" << scored.total_tokens << " cost=$" << scored.total_cost_usd
                                  << (scored.budget_exceeded ? " BUDGET EXCEEDED" : "") << std::endl;
                    } catch (const std::exception& ex) {
                        throw std::runtime_error(label + ": " + ex.what());
                    }
                });
            }
        }
    }

    LogLine(LogLevel::kInfo, "cli") << "running " << jobs.size() << " trial(s), " << options.parallel
                                    << " in parallel";
    const auto errors = runner::RunPool(options.parallel, jobs);
    return PrintErrors(errors);
}

int ValidateCommand(const CliOptions& options, const trialbench::config::Config& config) {
    using namespace trialbench;

    if (options.run_dir.empty()) {
        std::cerr << "validate needs a run directory" << std::endl;
        return 1;
    }
    const fs::path trials_dir = fs::path(options.run_dir) / "trials";
    if (!fs::is_directory(trials_dir)) {
        std::cerr << "no trials directory under " << options.run_dir << std::endl;
        return 1;
    }

    std::vector<fs::path> meta_paths;
    for (const auto& entry : fs::recursive_directory_iterator(trials_dir)) {
        if (entry.is_directory() && entry.path().filename() == "workspace") {
            continue;
        }
        if (entry.is_regular_file() && entry.path().filename() == "meta.json") {
            meta_paths.push_back(entry.path());
        }
    }
    if (meta_paths.empty()) {
        std::cerr << "no meta.json files under " << trials_dir.string() << std::endl;
        return 1;
    }

    const auto secrets = LoadSecrets(config);
    const auto settings = providers::ResolveJudgeSettings(secrets, "", config.proxy.judge_model);
    if (!settings.Usable()) {
        LogLine(LogLevel::kWarn, "cli") << "no judge credentials found; rubric scores will be absent";
    }
    validation::DockerValidationRunner validator(config.sandbox.engine);
    gitops::GitCli git;

    std::stop_source stop_source;
    SignalWatcher watcher(stop_source);
    std::mutex output_mutex;

    std::vector<runner::Job> jobs;
    for (const auto& meta_path : meta_paths) {
        jobs.push_back([&, meta_path]() {
            const auto trial_dir = meta_path.parent_path();
            try {
                const auto meta = result::ReadTrialMeta(meta_path);
                const config::TaskConfig* task = nullptr;
                for (const auto& candidate : config.tasks) {
                    if (runner::TaskName(candidate) == meta.task) {
                        task = &candidate;
                        break;
                    }
                }
                if (!task) {
                    throw std::runtime_error("no task named " + meta.task + " in config");
                }
                auto provider = providers::CreateProvider(settings);
                validation::LLMRubricJudge judge(*provider, {settings.model, config.proxy.judge_samples});
                runner::TrialScorer scorer(validator, judge, git);
                const auto scored = scorer.ValidateAndScore(trial_dir, *task, stop_source.get_token());

                std::lock_guard<std::mutex> lock(output_mutex);
                std::cout << scored.orchestrator << "/" << scored.task << " trial " << scored.trial
                          << ": composite=" << scored.composite_score << std::endl;
            } catch (const std::exception& ex) {
                throw std::runtime_error(trial_dir.string() + ": " + ex.what());
            }
        });
    }
    return PrintErrors(runner::RunPool(options.parallel, jobs));
}

int ListCommand(const trialbench::config::Config& config) {
    std::cout << "Orchestrators:" << std::endl;
    for (const auto& orchestrator : config.orchestrators) {
        std::cout << "  " << orchestrator.name << "  image=" << orchestrator.image
                  << "  adapter=" << orchestrator.adapter << std::endl;
    }
    std::cout << "Tasks:" << std::endl;
    for (const auto& task : config.tasks) {
        std::cout << "  " << trialbench::runner::TaskName(task) << "  tag=" << task.tag
                  << "  category=" << (task.category.empty() ? "-" : task.category)
                  << (task.greenfield ? "  greenfield" : "")
                  << "  timeout=" << trialbench::runner::TimeoutForTask(task).count() << "m" << std::endl;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    CliOptions options{};
    try {
        if (!ParseArgs(argc, argv, options)) {
            PrintUsage();
            return 2;
        }
    } catch (const std::exception& ex) {
        std::cerr << "invalid arguments: " << ex.what() << std::endl;
        PrintUsage();
        return 2;
    }
    if (options.command != "run" && options.command != "validate" && options.command != "list") {
        PrintUsage();
        return 2;
    }

    try {
        const auto config = trialbench::config::LoadConfig(options.config_path);
        trialbench::utils::SetLogConfig({trialbench::utils::ParseLogLevel(
            config.logging.level, trialbench::utils::LogLevel::kInfo)});

        if (options.command == "list") {
            return ListCommand(config);
        }
        if (options.command == "validate") {
            return ValidateCommand(options, config);
        }
        return RunCommand(options, config);
    } catch (const std::exception& ex) {
        std::cerr << "trialbench: " << ex.what() << std::endl;
        return 1;
    }
}
