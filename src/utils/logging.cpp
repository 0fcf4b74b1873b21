#include "utils/logging.hpp"

#include <iostream>
#include <mutex>

#include "utils/common.hpp"

namespace trialbench::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& MutableConfig() {
    static LogConfig config{};
    return config;
}

}  // namespace

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    MutableConfig() = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(LogMutex());
    return MutableConfig();
}

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    const auto lowered = ToLower(Trim(value));
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void Log(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(LogMutex());
    if (level < MutableConfig().min_level) {
        return;
    }
    std::cerr << "[" << component << "] ";
    if (level == LogLevel::kWarn) {
        std::cerr << "warning: ";
    } else if (level == LogLevel::kError) {
        std::cerr << "error: ";
    }
    std::cerr << message << std::endl;
}

LogLine::LogLine(LogLevel level, std::string component)
    : level_(level)
    , component_(std::move(component)) {}

LogLine::~LogLine() {
    Log(level_, component_, stream_.str());
}

}  // namespace trialbench::utils
