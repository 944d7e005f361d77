#pragma once

#include <string>

#include "knowledge/knowledge_store.hpp"
#include "session/conversation_log.hpp"

namespace minigpt::agent {

class Responder {
public:
    Responder(minigpt::knowledge::KnowledgeStore& knowledge,
              minigpt::session::ConversationLog& log);

    // Normalizes the input, looks it up and records the exchange.
    std::string Ask(const std::string& raw_input);

private:
    minigpt::knowledge::KnowledgeStore& knowledge_;
    minigpt::session::ConversationLog& log_;
};

}  // namespace minigpt::agent
