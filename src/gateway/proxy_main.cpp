#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "gateway/usage_log.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/url.hpp"

namespace {

using trialbench::utils::LogLevel;
using trialbench::utils::LogLine;

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

struct ProxyArgs {
    std::string host = "0.0.0.0";
    int port = 0;
    std::string log_path;
    std::string upstream = "https://api.anthropic.com";
};

bool ParseArgs(int argc, char** argv, ProxyArgs& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "missing value for " << flag << std::endl;
            return false;
        }
        const std::string value = argv[++i];
        if (flag == "--port") {
            args.port = std::stoi(value);
        } else if (flag == "--log") {
            args.log_path = value;
        } else if (flag == "--upstream") {
            args.upstream = value;
        } else if (flag == "--host") {
            args.host = value;
        } else {
            std::cerr << "unknown flag " << flag << std::endl;
            return false;
        }
    }
    return args.port > 0 && !args.log_path.empty();
}

bool IsDroppedRequestHeader(const std::string& name) {
    static const std::set<std::string> dropped{
        "host", "content-length", "transfer-encoding", "accept-encoding", "connection"};
    return dropped.count(trialbench::utils::ToLower(name)) > 0;
}

bool IsDroppedResponseHeader(const std::string& name) {
    static const std::set<std::string> dropped{
        "content-length", "transfer-encoding", "connection", "content-encoding", "content-type"};
    return dropped.count(trialbench::utils::ToLower(name)) > 0;
}

// Appends one NDJSON line per metered call.
class UsageWriter {
public:
    explicit UsageWriter(std::string path)
        : path_(std::move(path)) {}

    void Append(const trialbench::gateway::UsageRecord& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ofstream out(path_, std::ios::app);
        if (!out.is_open()) {
            LogLine(LogLevel::kError, "proxy") << "cannot open usage log " << path_;
            return;
        }
        out << trialbench::gateway::SerializeUsageRecord(record) << "\n";
    }

private:
    std::string path_;
    std::mutex mutex_;
};

bool IsMeteredPath(const std::string& path) {
    return path.find("/v1/messages") != std::string::npos ||
        path.find("/chat/completions") != std::string::npos;
}

}  // namespace

int main(int argc, char** argv) {
    ProxyArgs args{};
    try {
        if (!ParseArgs(argc, argv, args)) {
            std::cerr << "Usage: trialbench-proxy --port N --log PATH [--upstream URL] [--host H]" << std::endl;
            return 2;
        }
    } catch (const std::exception& ex) {
        std::cerr << "invalid arguments: " << ex.what() << std::endl;
        return 2;
    }

    const auto upstream = trialbench::utils::ParseUrl(args.upstream);
    UsageWriter writer(args.log_path);

    httplib::Server server;
    server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(nlohmann::json{{"status", "ok"}}.dump(), "application/json");
    });

    server.Post(".*", [&upstream, &writer](const httplib::Request& req, httplib::Response& res) {
        const std::string target = req.target.empty() ? req.path : req.target;
        httplib::Client client(upstream.SchemeHostPort());
        client.set_connection_timeout(30);
        client.set_read_timeout(600);
        client.set_write_timeout(60);

        httplib::Headers headers;
        for (const auto& [name, value] : req.headers) {
            if (!IsDroppedRequestHeader(name)) {
                headers.emplace(name, value);
            }
        }

        const auto content_type = req.get_header_value("Content-Type");
        auto response = client.Post(upstream.base_path + target, headers, req.body,
                                    content_type.empty() ? "application/json" : content_type);
        if (!response) {
            const auto err = httplib::to_string(response.error());
            LogLine(LogLevel::kError, "proxy") << "upstream request " << req.path << " failed: " << err;
            res.status = 502;
            res.set_content(nlohmann::json{{"error", "upstream request failed: " + err}}.dump(),
                            "application/json");
            return;
        }

        res.status = response->status;
        for (const auto& [name, value] : response->headers) {
            if (!IsDroppedResponseHeader(name)) {
                res.headers.emplace(name, value);
            }
        }
        const auto response_type = response->get_header_value("Content-Type");
        res.set_content(response->body, response_type.empty() ? "application/json" : response_type);

        if (response->status < 200 || response->status >= 300 || !IsMeteredPath(req.path)) {
            return;
        }
        try {
            const std::string provider =
                req.path.find("/chat/completions") != std::string::npos ? "openai" : "anthropic";
            auto record = trialbench::gateway::ExtractUsage(response->body, response_type, provider);
            if (!record) {
                LogLine(LogLevel::kWarn, "proxy") << "no usage in response to " << req.path;
                return;
            }
            record->timestamp = trialbench::utils::ToEpochSeconds(trialbench::utils::Now());
            writer.Append(*record);
        } catch (const std::exception& ex) {
            LogLine(LogLevel::kError, "proxy") << "recording usage: " << ex.what();
        }
    });

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listening_done{false};
    std::thread watcher([&server, &listening_done]() {
        while (!listening_done.load() && g_signal == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        server.stop();
    });

    LogLine(LogLevel::kInfo, "proxy") << "listening on " << args.host << ":" << args.port
                                      << " upstream=" << args.upstream;
    const bool ok = server.listen(args.host, args.port);
    listening_done.store(true);
    watcher.join();
    if (!ok && g_signal == 0) {
        LogLine(LogLevel::kError, "proxy") << "failed to listen on " << args.host << ":" << args.port;
        return 1;
    }
    return 0;
}
