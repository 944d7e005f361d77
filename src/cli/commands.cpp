#include <iostream>
#include <string>

#include "agent/responder.hpp"
#include "cli/console.hpp"
#include "cli/menu_shell.hpp"
#include "config/config_loader.hpp"
#include "knowledge/knowledge_store.hpp"
#include "session/conversation_log.hpp"
#include "utils/logging.hpp"

namespace {

void PrintUsage() {
    std::cout << "Usage: minigpt_cli            interactive menu\n"
              << "       minigpt_cli \"message\"  answer one message and exit" << std::endl;
}

void LogEffectiveConfig(minigpt::utils::Logger& logger, const minigpt::config::Config& config) {
    logger.Debug("config", "file=" + minigpt::config::ConfigFilePath().string());
    logger.Debug("config", "bot.name=" + config.bot.name
        + " knowledge.file=" + config.knowledge.file
        + " knowledge.loadOnStart=" + (config.knowledge.load_on_start ? "true" : "false")
        + " logs.exportFile=" + config.logs.export_file
        + " logging.level=" + minigpt::utils::ToString(config.logging.level));
}

int RunMenu(const minigpt::config::Config& config, minigpt::utils::Logger& logger) {
    minigpt::knowledge::KnowledgeStore knowledge(config.knowledge.file, logger);
    if (config.knowledge.load_on_start) {
        const auto result = knowledge.Load();
        logger.Debug("cli", std::string("startup load result=") + minigpt::knowledge::ToString(result));
    }
    minigpt::session::ConversationLog log(logger);
    minigpt::agent::Responder responder(knowledge, log);

    minigpt::cli::StreamConsole console(std::cin, std::cout);
    minigpt::cli::MenuShell shell(console, responder, knowledge, log, config);
    shell.Run();
    logger.Debug("cli", "session ended records=" + std::to_string(log.Size()));
    return 0;
}

int RunOneShot(const minigpt::config::Config& config,
               minigpt::utils::Logger& logger,
               const std::string& message) {
    minigpt::knowledge::KnowledgeStore knowledge(config.knowledge.file, logger);
    const auto result = knowledge.Load();
    logger.Debug("cli", std::string("one-shot load result=") + minigpt::knowledge::ToString(result));
    minigpt::session::ConversationLog log(logger);
    minigpt::agent::Responder responder(knowledge, log);

    std::cout << responder.Ask(message) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2) {
        const std::string arg = argv[1];
        if (arg == "--help" || arg == "-h") {
            PrintUsage();
            return 0;
        }
    }
    if (argc > 2) {
        PrintUsage();
        return 1;
    }

    const auto config = minigpt::config::LoadConfig();
    minigpt::utils::Logger logger(minigpt::utils::LogConfig{config.logging.level});
    LogEffectiveConfig(logger, config);

    if (argc == 2) {
        return RunOneShot(config, logger, argv[1]);
    }
    return RunMenu(config, logger);
}
