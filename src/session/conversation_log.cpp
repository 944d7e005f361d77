#include "session/conversation_log.hpp"

#include <fstream>
#include <ostream>
#include <utility>

#include "utils/common.hpp"

namespace minigpt::session {
namespace {

constexpr const char* kTag = "session";

}  // namespace

std::string FormatRecord(const LogRecord& record) {
    return "[" + minigpt::utils::FormatLocalTime(record.timestamp) + "] User: " + record.input
        + " | Bot: " + record.output;
}

ConversationLog::ConversationLog(minigpt::utils::Logger& logger)
    : ConversationLog(logger, &minigpt::utils::Now) {}

ConversationLog::ConversationLog(minigpt::utils::Logger& logger, Clock clock)
    : logger_(logger)
    , clock_(clock ? std::move(clock) : Clock(&minigpt::utils::Now)) {}

void ConversationLog::Append(const std::string& input, const std::string& output) {
    const auto now = std::chrono::time_point_cast<std::chrono::seconds>(clock_());
    records_.push_back(LogRecord{now, input, output});
    logger_.Debug(kTag, "record appended count=" + std::to_string(records_.size()));
}

bool ConversationLog::Save(const std::string& path) const {
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        logger_.Error(kTag, "Error saving logs to '" + path + "'. Please try again.");
        return false;
    }
    for (const auto& record : records_) {
        output << FormatRecord(record) << '\n';
    }
    output.flush();
    if (!output) {
        logger_.Error(kTag, "Error writing logs to '" + path + "'. Please try again.");
        return false;
    }
    logger_.Info(kTag, "Logs saved to '" + path + "' (" + std::to_string(records_.size())
        + " records).");
    return true;
}

void ConversationLog::Display(std::ostream& out) const {
    if (records_.empty()) {
        out << "No logs available." << std::endl;
        return;
    }
    out << "\nConversation Logs:" << std::endl;
    for (const auto& record : records_) {
        out << FormatRecord(record) << std::endl;
    }
}

}  // namespace minigpt::session
