#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "nlohmann/json.hpp"

namespace minigpt::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("bot") && data["bot"].is_object()) {
        const auto& bot = data["bot"];
        if (bot.contains("name") && bot["name"].is_string()) {
            config.bot.name = bot["name"].get<std::string>();
        }
    }

    if (data.contains("knowledge") && data["knowledge"].is_object()) {
        const auto& knowledge = data["knowledge"];
        if (knowledge.contains("file") && knowledge["file"].is_string()) {
            config.knowledge.file = knowledge["file"].get<std::string>();
        }
        if (knowledge.contains("loadOnStart") && knowledge["loadOnStart"].is_boolean()) {
            config.knowledge.load_on_start = knowledge["loadOnStart"].get<bool>();
        }
    }

    if (data.contains("logs") && data["logs"].is_object()) {
        const auto& logs = data["logs"];
        if (logs.contains("exportFile") && logs["exportFile"].is_string()) {
            config.logs.export_file = logs["exportFile"].get<std::string>();
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            const auto level = minigpt::utils::ParseLogLevel(logging["level"].get<std::string>());
            if (level.has_value()) {
                config.logging.level = *level;
            }
        }
    }
}

}  // namespace

std::filesystem::path ConfigFilePath() {
    return GetHomePath() / ".minigpt" / "config.json";
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return config;
    }
    std::ifstream input(path);
    if (!input.is_open()) {
        return config;
    }
    // Keep defaults on parse errors
    const auto data = nlohmann::json::parse(input, nullptr, false);
    if (!data.is_discarded()) {
        ApplyConfigFromJson(config, data);
    }
    return config;
}

Config LoadConfig() {
    auto config = LoadConfigFromFile(ConfigFilePath());

    const auto bot_name = GetEnvFallback("MINIGPT_BOT__NAME", "MINIGPT_BOT_NAME");
    if (!bot_name.empty()) {
        config.bot.name = bot_name;
    }

    const auto knowledge_file = GetEnvFallback(
        "MINIGPT_KNOWLEDGE__FILE",
        "MINIGPT_KNOWLEDGE_FILE");
    if (!knowledge_file.empty()) {
        config.knowledge.file = knowledge_file;
    }

    const auto load_on_start = GetEnvFallback(
        "MINIGPT_KNOWLEDGE__LOAD_ON_START",
        "MINIGPT_KNOWLEDGE_LOAD_ON_START");
    if (!load_on_start.empty()) {
        config.knowledge.load_on_start = ParseBool(load_on_start);
    }

    const auto export_file = GetEnvFallback(
        "MINIGPT_LOGS__EXPORT_FILE",
        "MINIGPT_LOGS_EXPORT_FILE");
    if (!export_file.empty()) {
        config.logs.export_file = export_file;
    }

    const auto log_level = GetEnvFallback("MINIGPT_LOGGING__LEVEL", "MINIGPT_LOG_LEVEL");
    if (!log_level.empty()) {
        const auto level = minigpt::utils::ParseLogLevel(log_level);
        if (level.has_value()) {
            config.logging.level = *level;
        }
    }

    return config;
}

}  // namespace minigpt::config
