#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>

namespace runbox::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_output_mutex;

}  // namespace

std::optional<LogLevel> ParseLogLevel(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
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
    return std::nullopt;
}

void ConfigureLogging(const LogConfig& config) {
    g_min_level.store(static_cast<int>(config.min_level));
}

bool IsEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void FormatLine(std::ostream& out, const std::string& tag, const LogMessage& message) {
    out << "[" << tag << "]";
    if (message.level == LogLevel::kWarn || message.level == LogLevel::kError) {
        out << " " << ToString(message.level);
    }
    out << " " << message.message;
    for (const auto& [key, value] : message.fields) {
        out << " " << key << "=" << value;
    }
}

void Log(const std::string& tag, const LogMessage& message) {
    if (!IsEnabled(message.level)) {
        return;
    }
    std::ostringstream line;
    FormatLine(line, tag, message);
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << line.str() << std::endl;
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    Log(tag, LogMessage{level, message, {}});
}

}  // namespace runbox::utils
