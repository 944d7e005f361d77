#include "agent/responder.hpp"

#include "nlp/normalizer.hpp"

namespace minigpt::agent {

Responder::Responder(minigpt::knowledge::KnowledgeStore& knowledge,
                     minigpt::session::ConversationLog& log)
    : knowledge_(knowledge)
    , log_(log) {}

std::string Responder::Ask(const std::string& raw_input) {
    const auto key = minigpt::nlp::Normalize(raw_input);
    auto response = knowledge_.Lookup(key);
    log_.Append(key, response);
    return response;
}

}  // namespace minigpt::agent
