#pragma once

#include <iosfwd>
#include <optional>
#include <string>

namespace minigpt::utils {

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

// Accepts "debug", "info", "warn"/"warning" and "error" in any case.
std::optional<LogLevel> ParseLogLevel(const std::string& value);

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Status channel for the knowledge store, conversation log and config loader.
// Lines are written as "[tag] message". Instances are passed by reference;
// callers sharing one Logger across threads must serialize access.
class Logger {
public:
    explicit Logger(LogConfig config = {});
    Logger(LogConfig config, std::ostream& out);

    void Log(LogLevel level, const std::string& tag, const std::string& message);
    void Debug(const std::string& tag, const std::string& message);
    void Info(const std::string& tag, const std::string& message);
    void Warn(const std::string& tag, const std::string& message);
    void Error(const std::string& tag, const std::string& message);

    bool Enabled(LogLevel level) const;

private:
    LogConfig config_;
    std::ostream& out_;
};

}  // namespace minigpt::utils
