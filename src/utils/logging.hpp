#pragma once

#include <string>
#include <unordered_map>

namespace klatsch::utils {

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

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Falls back to kInfo for unknown names.
LogLevel ParseLogLevel(const std::string& name);

void ConfigureLogging(const LogConfig& config);
bool IsEnabled(LogLevel level);

// Writes one line to stderr: "LEVEL [tag] message key=value ...".
void Log(const LogMessage& message);

void LogDebug(const std::string& tag, const std::string& message);
void LogInfo(const std::string& tag, const std::string& message);
void LogWarn(const std::string& tag, const std::string& message);
void LogError(const std::string& tag, const std::string& message);

}  // namespace klatsch::utils
