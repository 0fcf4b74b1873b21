#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <stop_token>
#include <string>
#include <vector>

#include "sandbox/process_runner.hpp"

namespace trialbench::sandbox {

inline constexpr int kTimeoutExitCode = 124;
inline constexpr const char* kHostGatewayAlias = "host.docker.internal";
inline constexpr const char* kWorkspaceMountTarget = "/workspace";

struct Mount {
    std::filesystem::path source;
    std::string target;
    bool read_only = false;
};

struct RunOpts {
    std::string image;
    std::vector<std::string> command;
    // Bound read-write at /workspace.
    std::filesystem::path work_dir;
    std::map<std::string, std::string> env;
    std::chrono::milliseconds timeout{std::chrono::minutes(10)};
    std::vector<Mount> extra_mounts;
    // Egress default-deny: the container joins a fresh internal network and
    // only the host gateway address stays reachable.
    bool isolate_network = false;
    // Reported only; see DESIGN.md.
    std::vector<std::string> allowlist;
    // Fraction of cores; <= 0 means unlimited.
    double cpu_limit = 0.0;
    // Bytes; <= 0 means unlimited.
    std::int64_t memory_limit = 0;
    // "uid:gid"; empty keeps the image default.
    std::string user;
};

struct RunResult {
    int exit_code = -1;
    bool timed_out = false;
    std::chrono::milliseconds duration{0};
};

// Owns exactly one container per Run call. Implementations must remove the
// container on every exit path. Setup failures and cancellation throw.
class ContainerRunner {
public:
    virtual ~ContainerRunner() = default;
    virtual RunResult Run(const RunOpts& opts, std::stop_token stop) = 0;
};

// Drives a docker-compatible engine through its command line.
class DockerCliRunner : public ContainerRunner {
public:
    explicit DockerCliRunner(std::string engine = "docker",
                             CommandExecutor executor = DefaultCommandExecutor());

    RunResult Run(const RunOpts& opts, std::stop_token stop) override;

    // Arguments for "<engine> create ..." without the engine name itself.
    static std::vector<std::string> BuildCreateArgs(const RunOpts& opts,
                                                    const std::string& network,
                                                    const std::string& host_gateway);

private:
    ProcessResult Engine(const std::vector<std::string>& args,
                         const ProcessOptions& options = {}) const;
    std::string CreateIsolatedNetwork() const;
    std::string NetworkGateway(const std::string& network) const;
    void Cleanup(const std::string& container_id, const std::string& network) const;
    std::string TailLogs(const std::string& container_id) const;

    std::string engine_;
    CommandExecutor executor_;
};

}  // namespace trialbench::sandbox
