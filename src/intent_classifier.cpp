#include "intent_classifier.h"
#include "logger.h"
#include "utils.h"
#include <sstream>

namespace viva {

class IntentClassifier::Impl {
public:
    explicit Impl(llm::IReasoningClient& client) : client_(client) {}

    Intent classify(const std::string& transcript, const ConversationContext& context) {
        llm::GenerationOptions options;
        options.temperature = 0.0f;
        options.max_tokens = 16;

        Intent intent = Intent::AnsweringQuestion;
        try {
            auto reply = client_.complete(build_prompt(transcript, context), options);
            if (!reply) {
                LOG_ERROR("Error analyzing intent: " + reply.error().message);
                return Intent::AnsweringQuestion;
            }
            intent = parse_reply(reply.value());
        } catch (const std::exception& e) {
            LOG_ERROR("Error analyzing intent: " + std::string(e.what()));
            return Intent::AnsweringQuestion;
        }

        LOG_POLICY(std::string("Detected intent: ") + intent_name(intent) +
                   " for transcript: " + utils::preview(transcript));
        return intent;
    }

private:
    llm::IReasoningClient& client_;
};

IntentClassifier::IntentClassifier(llm::IReasoningClient& client)
    : pimpl_(std::make_unique<Impl>(client)) {}

IntentClassifier::~IntentClassifier() = default;

Intent IntentClassifier::classify(const std::string& transcript, const ConversationContext& context) {
    return pimpl_->classify(transcript, context);
}

Intent IntentClassifier::parse_reply(const std::string& reply) {
    std::string text = utils::normalize_copy(utils::trim_copy(reply));
    if (text.find("asking") != std::string::npos) {
        return Intent::AskingQuestion;
    }
    if (text.find("clarification") != std::string::npos) {
        return Intent::SeekingClarification;
    }
    if (text.find("confused") != std::string::npos || text.find("stuck") != std::string::npos) {
        return Intent::ConfusedOrStuck;
    }
    return Intent::AnsweringQuestion;
}

std::string IntentClassifier::build_prompt(const std::string& transcript, const ConversationContext& context) {
    std::ostringstream oss;
    oss << "Analyze this candidate speech in a technical interview.\n\n"
        << "Current state:\n"
        << "- Current question: \"" << context.current_question.value_or("None") << "\"\n"
        << "- Awaiting answer: " << (context.awaiting_answer() ? "true" : "false") << "\n"
        << "- Follow-ups asked: " << context.follow_up_count << "\n\n"
        << "Candidate said: \"" << transcript << "\"\n\n"
        << "Choose ONE intent:\n"
        << "- \"answering_question\": the candidate is answering the current question\n"
        << "- \"asking_question\": the candidate is asking the interviewer a question\n"
        << "- \"seeking_clarification\": the candidate wants the question clarified or repeated\n"
        << "- \"confused_or_stuck\": the candidate is confused, stuck or needs help\n\n"
        << "Hints: question words (what, how, why, can you) suggest asking_question; statements "
        << "about concepts suggest answering_question; \"I don't understand\" or \"can you repeat\" "
        << "suggest seeking_clarification; \"I'm not sure\" or \"I don't know\" suggest "
        << "confused_or_stuck.\n\n"
        << "Return ONLY the intent category.";
    return oss.str();
}

} // namespace viva
