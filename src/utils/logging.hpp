#pragma once

#include <sstream>
#include <string>

namespace trialbench::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();
LogLevel ParseLogLevel(const std::string& value, LogLevel fallback);

// Writes "[component] message" to stderr as one line. Warnings and errors get
// a level marker after the tag.
void Log(LogLevel level, const std::string& component, const std::string& message);

// Stream-style single log line, emitted when the object goes out of scope:
//   LogLine(LogLevel::kWarn, "runner") << "lint failed: " << ex.what();
class LogLine {
public:
    LogLine(LogLevel level, std::string component);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    std::ostringstream stream_;
};

}  // namespace trialbench::utils
