#pragma once

#include "conversation_context.h"
#include "llm/reasoning_client.h"
#include <memory>
#include <string>

namespace viva {

/**
 * @brief Maps a candidate turn to an Intent with one reasoning call
 *
 * Never fails: a failed or unrecognizable reply is classified as AnsweringQuestion.
 */
class IntentClassifier {
public:
    explicit IntentClassifier(llm::IReasoningClient& client);
    ~IntentClassifier();

    IntentClassifier(const IntentClassifier&) = delete;
    IntentClassifier& operator=(const IntentClassifier&) = delete;

    Intent classify(const std::string& transcript, const ConversationContext& context);

    /**
     * @brief Keyword match on a free-text reply
     *
     * Priority: "asking" > "clarification" > "confused"/"stuck" > AnsweringQuestion.
     */
    static Intent parse_reply(const std::string& reply);

    static std::string build_prompt(const std::string& transcript, const ConversationContext& context);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
