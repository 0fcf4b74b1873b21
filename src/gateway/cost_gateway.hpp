#pragma once

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <map>
#include <memory>
#include <stop_token>
#include <string>

#include <boost/process.hpp>

namespace trialbench::gateway {

struct StartOpts {
    // Proxy executable; resolved through PATH when it has no slash.
    std::string proxy_command = "trialbench-proxy";
    std::string upstream;
    std::filesystem::path log_dir = "logs";
    std::map<std::string, std::string> env;
    int ready_attempts = 30;
    std::chrono::milliseconds ready_interval{500};
};

// One reverse-proxy subprocess per trial. Stop() is idempotent and runs from
// the destructor, so a gateway is never leaked on an error path.
class CostGateway {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    CostGateway(PrivateTag, int port, std::filesystem::path usage_log_path, std::filesystem::path server_log_path);
    ~CostGateway();

    CostGateway(const CostGateway&) = delete;
    CostGateway& operator=(const CostGateway&) = delete;

    // Throws std::runtime_error if the proxy cannot be launched or never
    // accepts connections.
    static std::unique_ptr<CostGateway> Start(const StartOpts& opts, std::stop_token stop = {});

    void Stop();

    int Port() const { return port_; }
    std::string URL() const;
    const std::filesystem::path& UsageLogPath() const { return usage_log_path_; }
    const std::filesystem::path& ServerLogPath() const { return server_log_path_; }

private:
    int port_ = 0;
    std::filesystem::path usage_log_path_;
    std::filesystem::path server_log_path_;
    std::unique_ptr<FILE, int (*)(FILE*)> log_file_{nullptr, &std::fclose};
    std::unique_ptr<boost::process::child> child_;
};

int FindFreePort();

// Bounded retry: attempts connections to 127.0.0.1:port.
bool WaitForPort(int port, int attempts, std::chrono::milliseconds interval, std::stop_token stop = {});

// Rewrites a localhost gateway URL so a container reaches the host through
// the host-gateway alias.
std::string RewriteForContainer(const std::string& url);

}  // namespace trialbench::gateway
