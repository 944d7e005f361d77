#pragma once

#include <string>

#include "utils/logging.hpp"

namespace minigpt::config {

struct BotConfig {
    std::string name = "MiniGPT";
};

struct KnowledgeConfig {
    std::string file = "knowledge_base.json";
    bool load_on_start = true;
};

struct LogsConfig {
    std::string export_file = "conversation_logs.txt";
};

struct LoggingConfig {
    minigpt::utils::LogLevel level = minigpt::utils::LogLevel::kInfo;
};

struct Config {
    BotConfig bot;
    KnowledgeConfig knowledge;
    LogsConfig logs;
    LoggingConfig logging;
};

}  // namespace minigpt::config
