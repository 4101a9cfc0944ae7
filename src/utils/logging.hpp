#pragma once

#include <map>
#include <optional>
#include <ostream>
#include <string>

namespace runbox::utils {

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

std::optional<LogLevel> ParseLogLevel(const std::string& text);

struct LogMessage {
    LogLevel level;
    std::string message;
    std::map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Sets the process-wide minimum level. Call once at start-up.
void ConfigureLogging(const LogConfig& config);
bool IsEnabled(LogLevel level);

// Writes "[tag] message key=value ..." to std::cerr. Warnings and errors
// carry their level after the tag.
void Log(const std::string& tag, const LogMessage& message);
void Log(LogLevel level, const std::string& tag, const std::string& message);

// Formatting used by Log, exposed for tests.
void FormatLine(std::ostream& out, const std::string& tag, const LogMessage& message);

}  // namespace runbox::utils
