#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace minigpt::utils {

std::optional<LogLevel> ParseLogLevel(const std::string& value) {
    std::string lowered = value;
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

Logger::Logger(LogConfig config)
    : config_(config)
    , out_(std::cerr) {}

Logger::Logger(LogConfig config, std::ostream& out)
    : config_(config)
    , out_(out) {}

bool Logger::Enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(config_.min_level);
}

void Logger::Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (!Enabled(level)) {
        return;
    }
    out_ << "[" << tag << "] " << message << std::endl;
}

void Logger::Debug(const std::string& tag, const std::string& message) {
    Log(LogLevel::kDebug, tag, message);
}

void Logger::Info(const std::string& tag, const std::string& message) {
    Log(LogLevel::kInfo, tag, message);
}

void Logger::Warn(const std::string& tag, const std::string& message) {
    Log(LogLevel::kWarn, tag, message);
}

void Logger::Error(const std::string& tag, const std::string& message) {
    Log(LogLevel::kError, tag, message);
}

}  // namespace minigpt::utils
