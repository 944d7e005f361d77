#pragma once

#include <optional>
#include <string>

#include "agent/responder.hpp"
#include "cli/console.hpp"
#include "config/config_schema.hpp"
#include "knowledge/knowledge_store.hpp"
#include "session/conversation_log.hpp"

namespace minigpt::cli {

// Text menu over chat, knowledge administration and log review. Holds each
// component separately; nothing is reached through the responder.
class MenuShell {
public:
    MenuShell(Console& console,
              minigpt::agent::Responder& responder,
              minigpt::knowledge::KnowledgeStore& knowledge,
              minigpt::session::ConversationLog& log,
              minigpt::config::Config config);

    // Returns when the user picks Exit or input runs out.
    void Run();

private:
    Console& console_;
    minigpt::agent::Responder& responder_;
    minigpt::knowledge::KnowledgeStore& knowledge_;
    minigpt::session::ConversationLog& log_;
    minigpt::config::Config config_;

    // The bool-returning steps report false when input ran out mid-step.
    bool RunChat();
    bool AddKnowledge();
    bool LoadKnowledge();
    bool SaveKnowledge();
    void ViewKnowledge();
    void ViewLogs();
    bool SaveLogs();
    void ShowMenu();
};

}  // namespace minigpt::cli
