#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace klatsch::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_output_mutex;

}  // namespace

LogLevel ParseLogLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug" || lowered == "trace") {
        return LogLevel::kDebug;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

void ConfigureLogging(const LogConfig& config) {
    g_min_level.store(static_cast<int>(config.min_level));
}

bool IsEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Log(const LogMessage& message) {
    if (!IsEnabled(message.level)) {
        return;
    }
    std::ostringstream line;
    line << ToString(message.level) << " [" << message.tag << "] " << message.message;
    // Sorted so that lines are stable across runs.
    const std::map<std::string, std::string> sorted(message.fields.begin(), message.fields.end());
    for (const auto& [key, value] : sorted) {
        line << ' ' << key << '=' << value;
    }
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << line.str() << std::endl;
}

void LogDebug(const std::string& tag, const std::string& message) {
    Log(LogMessage{LogLevel::kDebug, tag, message, {}});
}

void LogInfo(const std::string& tag, const std::string& message) {
    Log(LogMessage{LogLevel::kInfo, tag, message, {}});
}

void LogWarn(const std::string& tag, const std::string& message) {
    Log(LogMessage{LogLevel::kWarn, tag, message, {}});
}

void LogError(const std::string& tag, const std::string& message) {
    Log(LogMessage{LogLevel::kError, tag, message, {}});
}

}  // namespace klatsch::utils
