#include "gateway/cost_gateway.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>
#include <signal.h>

#include "sandbox/container_runner.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace trialbench::gateway {
namespace bp = boost::process;
namespace {

using boost::asio::ip::tcp;
using utils::LogLevel;
using utils::LogLine;

std::string ReadTail(const std::filesystem::path& path, std::size_t lines) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return "";
    }
    std::ostringstream stream;
    stream << input.rdbuf();
    return utils::TailLines(stream.str(), lines);
}

}  // namespace

int FindFreePort() {
    try {
        boost::asio::io_context io;
        tcp::acceptor acceptor(io, tcp::endpoint(tcp::v4(), 0));
        return acceptor.local_endpoint().port();
    } catch (const boost::system::system_error& ex) {
        throw std::runtime_error(std::string("finding free port: ") + ex.what());
    }
}

bool WaitForPort(int port, int attempts, std::chrono::milliseconds interval, std::stop_token stop) {
    const tcp::endpoint endpoint(boost::asio::ip::make_address("127.0.0.1"), static_cast<unsigned short>(port));
    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (stop.stop_requested()) {
            return false;
        }
        boost::asio::io_context io;
        tcp::socket socket(io);
        boost::system::error_code ec;
        socket.connect(endpoint, ec);
        if (!ec) {
            socket.close(ec);
            return true;
        }
        std::this_thread::sleep_for(interval);
    }
    return false;
}

std::string RewriteForContainer(const std::string& url) {
    const auto scheme_end = url.find("://");
    const auto host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    for (const std::string host : {"localhost", "127.0.0.1"}) {
        if (url.compare(host_start, host.size(), host) == 0) {
            return url.substr(0, host_start) + sandbox::kHostGatewayAlias +
                url.substr(host_start + host.size());
        }
    }
    return url;
}

CostGateway::CostGateway(PrivateTag, int port, std::filesystem::path usage_log_path, std::filesystem::path server_log_path)
    : port_(port)
    , usage_log_path_(std::move(usage_log_path))
    , server_log_path_(std::move(server_log_path)) {}

CostGateway::~CostGateway() {
    Stop();
}

std::unique_ptr<CostGateway> CostGateway::Start(const StartOpts& opts, std::stop_token stop) {
    const int port = FindFreePort();

    std::filesystem::create_directories(opts.log_dir);
    const auto log_dir = std::filesystem::absolute(opts.log_dir);
    auto gateway = std::make_unique<CostGateway>(
        PrivateTag{},
        port,
        log_dir / ("proxy-usage-" + std::to_string(port) + ".jsonl"),
        log_dir / ("proxy-server-" + std::to_string(port) + ".log"));

    FILE* log_file = std::fopen(gateway->server_log_path_.c_str(), "w");
    if (!log_file) {
        throw std::runtime_error("creating proxy log file " + gateway->server_log_path_.string());
    }
    gateway->log_file_.reset(log_file);

    boost::filesystem::path exe = opts.proxy_command;
    if (opts.proxy_command.find('/') == std::string::npos) {
        exe = bp::search_path(opts.proxy_command);
        if (exe.empty()) {
            throw std::runtime_error("starting proxy: " + opts.proxy_command + " not found in PATH");
        }
    }

    std::vector<std::string> args{
        "--port", std::to_string(port),
        "--log", gateway->usage_log_path_.string()};
    if (!opts.upstream.empty()) {
        args.insert(args.end(), {"--upstream", opts.upstream});
    }

    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : opts.env) {
        env[key] = value;
    }

    try {
        gateway->child_ = std::make_unique<bp::child>(
            exe, bp::args(args), env,
            bp::std_in < bp::null,
            bp::std_out > log_file,
            bp::std_err > log_file);
    } catch (const bp::process_error& ex) {
        throw std::runtime_error(std::string("starting proxy: ") + ex.what());
    }

    for (int attempt = 0; attempt < opts.ready_attempts; ++attempt) {
        std::error_code ec;
        if (!gateway->child_->running(ec)) {
            std::fflush(log_file);
            throw std::runtime_error("proxy exited during startup:\n" +
                                     ReadTail(gateway->server_log_path_, 20));
        }
        if (WaitForPort(port, 1, opts.ready_interval, stop)) {
            LogLine(LogLevel::kInfo, "gateway") << "proxy ready on port " << port
                                                << " usage_log=" << gateway->usage_log_path_.string();
            return gateway;
        }
        if (stop.stop_requested()) {
            throw std::runtime_error("proxy startup cancelled");
        }
    }
    throw std::runtime_error("proxy did not start: port " + std::to_string(port) + " not ready after " +
                             std::to_string(opts.ready_attempts) + " attempts");
}

void CostGateway::Stop() {
    if (child_) {
        std::error_code ec;
        if (child_->running(ec)) {
            ::kill(child_->id(), SIGTERM);
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            while (std::chrono::steady_clock::now() < deadline && child_->running(ec)) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (child_->running(ec)) {
                child_->terminate(ec);
            }
            if (ec) {
                LogLine(LogLevel::kWarn, "gateway") << "stopping proxy on port " << port_ << ": " << ec.message();
            }
        }
        child_.reset();
    }
    log_file_.reset();
}

std::string CostGateway::URL() const {
    return "http://localhost:" + std::to_string(port_);
}

}  // namespace trialbench::gateway
