#include "sandbox/container_runner.hpp"

#include <atomic>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace trialbench::sandbox {
namespace {

using utils::LogLevel;
using utils::LogLine;

constexpr const char* kLabel = "trialbench=true";
constexpr std::size_t kLogTailLines = 100;

std::string LastLine(const std::string& text) {
    const auto lines = utils::SplitLines(utils::Trim(text));
    return lines.empty() ? std::string() : utils::Trim(lines.back());
}

std::string Describe(const ProcessResult& result) {
    auto detail = utils::Trim(result.error.empty() ? result.output : result.error);
    if (detail.empty()) {
        detail = "exit code " + std::to_string(result.exit_code);
    }
    return detail;
}

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << cpus;
    return oss.str();
}

// Removes the container (and its network) however Run leaves scope.
class ContainerGuard {
public:
    explicit ContainerGuard(std::function<void()> cleanup)
        : cleanup_(std::move(cleanup)) {}
    ~ContainerGuard() { cleanup_(); }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

private:
    std::function<void()> cleanup_;
};

}  // namespace

DockerCliRunner::DockerCliRunner(std::string engine, CommandExecutor executor)
    : engine_(std::move(engine))
    , executor_(std::move(executor)) {}

std::vector<std::string> DockerCliRunner::BuildCreateArgs(const RunOpts& opts,
                                                          const std::string& network,
                                                          const std::string& host_gateway) {
    std::vector<std::string> args{"create", "--init", "--label", kLabel};
    if (!opts.user.empty()) {
        args.insert(args.end(), {"--user", opts.user});
    }
    if (opts.cpu_limit > 0) {
        args.insert(args.end(), {"--cpus", FormatCpus(opts.cpu_limit)});
    }
    if (opts.memory_limit > 0) {
        args.insert(args.end(), {"--memory", std::to_string(opts.memory_limit)});
    }
    if (!network.empty()) {
        args.insert(args.end(), {"--network", network});
    }
    args.insert(args.end(), {"--add-host", std::string(kHostGatewayAlias) + ":" + host_gateway});

    args.insert(args.end(), {
        "--mount",
        "type=bind,source=" + opts.work_dir.string() + ",target=" + kWorkspaceMountTarget});
    for (const auto& mount : opts.extra_mounts) {
        auto spec = "type=bind,source=" + mount.source.string() + ",target=" + mount.target;
        if (mount.read_only) {
            spec += ",readonly";
        }
        args.insert(args.end(), {"--mount", spec});
    }

    // Values travel through the engine CLI's environment, never argv.
    for (const auto& [key, value] : opts.env) {
        args.insert(args.end(), {"-e", key});
    }

    args.push_back(opts.image);
    args.insert(args.end(), opts.command.begin(), opts.command.end());
    return args;
}

ProcessResult DockerCliRunner::Engine(const std::vector<std::string>& args,
                                      const ProcessOptions& options) const {
    std::vector<std::string> argv{engine_};
    argv.insert(argv.end(), args.begin(), args.end());
    return executor_(argv, options);
}

std::string DockerCliRunner::CreateIsolatedNetwork() const {
    static std::atomic<unsigned long> counter{0};
    const auto name = "trialbench-net-" + std::to_string(::getpid()) + "-" +
        std::to_string(counter.fetch_add(1));
    const auto created = Engine({"network", "create", "--internal", "--driver", "bridge",
                                 "--label", kLabel, name});
    if (!created.Ok()) {
        throw std::runtime_error("creating isolated network: " + Describe(created));
    }
    return name;
}

std::string DockerCliRunner::NetworkGateway(const std::string& network) const {
    const auto inspected = Engine({"network", "inspect", "-f",
                                   "{{range .IPAM.Config}}{{.Gateway}}{{end}}", network});
    if (!inspected.Ok()) {
        throw std::runtime_error("inspecting network " + network + ": " + Describe(inspected));
    }
    const auto gateway = LastLine(inspected.output);
    if (gateway.empty()) {
        throw std::runtime_error("network " + network + " has no gateway address");
    }
    return gateway;
}

std::string DockerCliRunner::TailLogs(const std::string& container_id) const {
    ProcessOptions options{};
    options.merge_stderr = true;
    options.timeout = std::chrono::seconds(30);
    try {
        const auto logs = Engine({"logs", "--tail", std::to_string(kLogTailLines), container_id}, options);
        return logs.output;
    } catch (const std::exception& ex) {
        LogLine(LogLevel::kWarn, "sandbox") << "reading logs of " << container_id << ": " << ex.what();
        return "";
    }
}

void DockerCliRunner::Cleanup(const std::string& container_id, const std::string& network) const {
    ProcessOptions options{};
    options.timeout = std::chrono::seconds(60);
    if (!container_id.empty()) {
        try {
            const auto removed = Engine({"rm", "-f", container_id}, options);
            if (!removed.Ok()) {
                LogLine(LogLevel::kWarn, "sandbox") << "removing container " << container_id
                                                    << ": " << Describe(removed);
            }
        } catch (const std::exception& ex) {
            LogLine(LogLevel::kWarn, "sandbox") << "removing container " << container_id
                                                << ": " << ex.what();
        }
    }
    if (!network.empty()) {
        try {
            const auto removed = Engine({"network", "rm", network}, options);
            if (!removed.Ok()) {
                LogLine(LogLevel::kWarn, "sandbox") << "removing network " << network
                                                    << ": " << Describe(removed);
            }
        } catch (const std::exception& ex) {
            LogLine(LogLevel::kWarn, "sandbox") << "removing network " << network << ": " << ex.what();
        }
    }
}

RunResult DockerCliRunner::Run(const RunOpts& opts, std::stop_token stop) {
    std::string container_id;
    std::string network;
    ContainerGuard guard([&]() { Cleanup(container_id, network); });

    std::string host_gateway = "host-gateway";
    if (opts.isolate_network) {
        network = CreateIsolatedNetwork();
        host_gateway = NetworkGateway(network);
    }
    if (!opts.allowlist.empty()) {
        LogLine(LogLevel::kInfo, "sandbox")
            << "allowlist has " << opts.allowlist.size() << " entries; not enforced ("
            << (opts.isolate_network ? "egress denied except host gateway" : "egress unrestricted") << ")";
    }

    ProcessOptions create_options{};
    create_options.env = opts.env;
    create_options.timeout = std::chrono::minutes(5);
    const auto created = Engine(BuildCreateArgs(opts, network, host_gateway), create_options);
    if (!created.Ok()) {
        throw std::runtime_error("creating container: " + Describe(created));
    }
    container_id = LastLine(created.output);
    if (container_id.empty()) {
        throw std::runtime_error("creating container: engine returned no container id");
    }

    const auto start = std::chrono::steady_clock::now();
    const auto started = Engine({"start", container_id});
    if (!started.Ok()) {
        throw std::runtime_error("starting container: " + Describe(started));
    }

    ProcessOptions wait_options{};
    wait_options.timeout = opts.timeout;
    wait_options.stop = stop;
    const auto waited = Engine({"wait", container_id}, wait_options);

    RunResult result{};
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (waited.timed_out || waited.cancelled) {
        const auto killed = Engine({"kill", "--signal", "KILL", container_id});
        if (!killed.Ok()) {
            LogLine(LogLevel::kWarn, "sandbox") << "killing container " << container_id
                                                << ": " << Describe(killed);
        }
        if (waited.cancelled) {
            throw std::runtime_error("container run cancelled");
        }
        LogLine(LogLevel::kWarn, "sandbox") << "container " << container_id << " timed out after "
                                            << opts.timeout.count() << "ms, logs:\n"
                                            << TailLogs(container_id);
        result.exit_code = kTimeoutExitCode;
        result.timed_out = true;
        return result;
    }
    if (!waited.Ok()) {
        throw std::runtime_error("waiting for container: " + Describe(waited));
    }

    try {
        result.exit_code = std::stoi(LastLine(waited.output));
    } catch (const std::exception&) {
        throw std::runtime_error("waiting for container: unexpected status '" +
                                 utils::Trim(waited.output) + "'");
    }

    const auto logs = TailLogs(container_id);
    if (!logs.empty()) {
        LogLine(LogLevel::kDebug, "sandbox") << "container logs:\n" << logs;
    }
    return result;
}

}  // namespace trialbench::sandbox
