#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include "utils/logging.hpp"

namespace minigpt::session {

struct LogRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string input;
    std::string output;
};

// "[YYYY-MM-DD HH:MM:SS] User: <input> | Bot: <output>" in local time.
std::string FormatRecord(const LogRecord& record);

// Exchanges of one run, in append order. Kept in memory only until Save.
class ConversationLog {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit ConversationLog(minigpt::utils::Logger& logger);
    ConversationLog(minigpt::utils::Logger& logger, Clock clock);

    void Append(const std::string& input, const std::string& output);
    const std::vector<LogRecord>& Records() const { return records_; }

    bool Save(const std::string& path) const;
    void Display(std::ostream& out) const;

    std::size_t Size() const { return records_.size(); }
    bool Empty() const { return records_.empty(); }

private:
    minigpt::utils::Logger& logger_;
    Clock clock_;
    std::vector<LogRecord> records_;
};

}  // namespace minigpt::session
