#pragma once

#include "answer_evaluator.h"
#include "config.h"
#include "conversation_context.h"
#include "question_bank.h"
#include "llm/reasoning_client.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace viva {

enum class ActionKind {
    Question,           ///< New top-level question
    FollowUp,
    Clarification,
    Guidance,           ///< Reply to a candidate question, or a hint when stuck
    InterviewComplete,
    Error
};

/// "question", "follow_up", "clarification", "guidance", "interview_complete", "error"
const char* action_kind_name(ActionKind kind);

/**
 * @brief What the engine says next
 */
struct DialogueAction {
    ActionKind kind = ActionKind::Question;
    std::string text;
    bool speak = true;
    Intent intent = Intent::AnsweringQuestion;
    std::optional<Evaluation> evaluation;   ///< Set when the turn was scored
    std::string topic;                      ///< Topic of a newly asked question
};

/**
 * @brief Dialogue state machine
 *
 * One handle() call per candidate turn. Every reasoning call has a canned fallback, so a
 * turn always produces some utterance. The policy holds no per-session state; everything
 * lives in the ConversationContext passed in.
 */
class DialoguePolicy {
public:
    DialoguePolicy(llm::IReasoningClient& client,
                   std::shared_ptr<const QuestionBank> bank,
                   const InterviewConfig& config);
    ~DialoguePolicy();

    DialoguePolicy(const DialoguePolicy&) = delete;
    DialoguePolicy& operator=(const DialoguePolicy&) = delete;

    /**
     * @brief Classify the turn and choose the next action
     *
     * Appends one exchange to the context history (except for an empty transcript or a
     * finished interview).
     */
    DialogueAction handle(const std::string& transcript, ConversationContext& context);

    /// remaining time <= end buffer (1 minute by default)
    bool should_end_interview(const ConversationContext& context) const;

    /**
     * @brief Make a bank question the current question (resets follow-ups, counts its topic)
     */
    void set_current_question(ConversationContext& context, const Question& question) const;

    /**
     * @brief Least covered topic, ties broken alphabetically; "general" when none configured
     */
    static std::string least_covered_topic(const ConversationContext& context);

    /// True when the reply asks for a follow-up ("follow" anywhere in it)
    static bool parse_follow_up_decision(const std::string& reply);

    /// Fixed utterances the policy may speak without a reasoning call
    static std::vector<std::string> canned_utterances();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
