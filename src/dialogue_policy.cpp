#include "dialogue_policy.h"
#include "intent_classifier.h"
#include "logger.h"
#include "utils.h"
#include <iomanip>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace viva {

namespace {

const char* OPENING_FALLBACK =
    "Let's start with a fundamental question: Can you tell me about your experience with "
    "programming and what languages you're most comfortable with?";
const char* NEXT_FALLBACK =
    "Let's move on to another topic. Can you explain a challenging problem you've solved recently?";
const char* FOLLOW_UP_FALLBACK = "Can you elaborate on that a bit more?";
const char* GUIDANCE_FALLBACK =
    "That's a good question. Let me continue with the interview and we can discuss that further "
    "at the end. Let's proceed with the next question.";
const char* CONFUSION_FALLBACK =
    "That's okay, take your time. Try to think about it step by step. "
    "What's the first thing that comes to mind?";
const char* PROCESSING_ERROR_TEXT =
    "I apologize, I had trouble processing your response. Could you please repeat that?";
const char* NOTHING_HEARD_TEXT = "I didn't catch that. Could you say it again?";
const char* TIME_UP_TEXT = "That's all the time we have. Thank you for your answers today.";

std::string format_minutes(double minutes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << minutes;
    return oss.str();
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out.empty() ? "none specified" : out;
}

// Drop one pair of wrapping quotes a model sometimes puts around generated text
std::string unquote(const std::string& text) {
    std::string out = utils::trim_copy(text);
    if (out.size() >= 2 && out.front() == '"' && out.back() == '"') {
        out = utils::trim_copy(out.substr(1, out.size() - 2));
    }
    return out;
}

} // namespace

const char* action_kind_name(ActionKind kind) {
    switch (kind) {
        case ActionKind::Question: return "question";
        case ActionKind::FollowUp: return "follow_up";
        case ActionKind::Clarification: return "clarification";
        case ActionKind::Guidance: return "guidance";
        case ActionKind::InterviewComplete: return "interview_complete";
        case ActionKind::Error: return "error";
    }
    return "error";
}

class DialoguePolicy::Impl {
public:
    Impl(llm::IReasoningClient& client, std::shared_ptr<const QuestionBank> bank, const InterviewConfig& config)
        : client_(client)
        , bank_(std::move(bank))
        , config_(config)
        , classifier_(client)
        , evaluator_(client) {}

    DialogueAction handle(const std::string& transcript, ConversationContext& context) {
        DialogueAction action;
        if (context.phase == Phase::Ended || should_end_interview(context)) {
            action.kind = ActionKind::InterviewComplete;
            action.text = TIME_UP_TEXT;
            return action;
        }

        std::string text = utils::trim_copy(transcript);
        if (text.empty()) {
            action.kind = ActionKind::Clarification;
            action.text = NOTHING_HEARD_TEXT;
            return action;
        }

        std::string question_in_play = context.pending_follow_up
            ? *context.pending_follow_up
            : context.current_question.value_or("");

        Intent intent = Intent::AnsweringQuestion;
        try {
            intent = classifier_.classify(text, context);
            switch (intent) {
                case Intent::AnsweringQuestion:
                    action = handle_answer(text, context);
                    break;
                case Intent::AskingQuestion:
                    action = handle_candidate_question(text, context);
                    break;
                case Intent::SeekingClarification:
                    action = handle_clarification(text, context);
                    break;
                case Intent::ConfusedOrStuck:
                    action = handle_confusion(text, context);
                    break;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Error processing candidate speech: " + std::string(e.what()));
            action = DialogueAction();
            action.kind = ActionKind::Error;
            action.text = PROCESSING_ERROR_TEXT;
        }
        action.intent = intent;

        context.add_exchange(text, action.text, intent, question_in_play);
        LOG_POLICY(std::string("Action: ") + action_kind_name(action.kind) +
                   " (follow-ups " + std::to_string(context.follow_up_count) + "/" +
                   std::to_string(context.max_follow_ups) + ", phase " + phase_name(context.phase) + ")");
        return action;
    }

    bool should_end_interview(const ConversationContext& context) const {
        return context.remaining_minutes() <= END_BUFFER_MINUTES;
    }

private:
    DialogueAction handle_answer(const std::string& answer, ConversationContext& context) {
        if (!context.has_question()) {
            return opening_question(context);
        }

        context.phase = Phase::Evaluating;
        Evaluation evaluation = evaluate(answer, context);

        context.phase = Phase::DecidingFollowUp;
        bool wants_follow_up = decide_follow_up(evaluation, context);

        DialogueAction action;
        if (wants_follow_up && context.follow_up_count < context.max_follow_ups) {
            action = follow_up(answer, evaluation, context);
        } else {
            if (wants_follow_up) {
                LOG_POLICY("Follow-up budget exhausted, moving to a new question");
            }
            context.follow_up_count = 0;
            action = next_question(context);
        }
        action.evaluation = evaluation;
        return action;
    }

    Evaluation evaluate(const std::string& answer, const ConversationContext& context) {
        EvaluationRequest request;
        request.answer = answer;
        request.topic = context.current_topic.empty() ? "general" : context.current_topic;
        request.difficulty = context.current_difficulty;
        if (context.pending_follow_up) {
            request.question = *context.pending_follow_up;
        } else {
            request.question = *context.current_question;
            request.expected_answer = context.current_expected_answer;
        }

        auto result = evaluator_.evaluate(request);
        if (result) {
            return result.value();
        }

        Evaluation evaluation;
        evaluation.score = 5;
        evaluation.feedback = "Answer received";
        evaluation.from_fallback = true;
        return evaluation;
    }

    bool decide_follow_up(const Evaluation& evaluation, const ConversationContext& context) {
        std::ostringstream prompt;
        prompt << "Decide whether to ask a follow-up question or move to a new question.\n\n"
               << "Answer evaluation:\n"
               << "- Score: " << evaluation.score << "/10\n"
               << "- Feedback: " << (evaluation.feedback.empty() ? "No feedback" : evaluation.feedback) << "\n\n"
               << "Context:\n"
               << "- Follow-ups asked so far: " << context.follow_up_count << "\n"
               << "- Time remaining: " << format_minutes(context.remaining_minutes()) << " minutes\n"
               << "- Questions asked: " << context.questions_asked << "\n\n"
               << "Guidelines:\n"
               << "- Follow up if the answer shows understanding but could go deeper\n"
               << "- Follow up if the answer is incomplete but promising\n"
               << "- Move on if the answer is complete or the candidate seems stuck\n"
               << "- Move on if two or more follow-ups were already asked\n"
               << "- Consider the time remaining\n\n"
               << "Return ONLY: \"follow_up\" or \"new_question\"";

        llm::GenerationOptions options;
        options.temperature = 0.0f;
        options.max_tokens = 16;
        auto reply = client_.complete(prompt.str(), options);
        if (!reply) {
            LOG_ERROR("Error deciding follow-up: " + reply.error().message);
            return false;
        }
        return parse_follow_up_decision(reply.value());
    }

    DialogueAction follow_up(const std::string& answer, const Evaluation& evaluation, ConversationContext& context) {
        context.follow_up_count++;

        std::ostringstream prompt;
        prompt << "Generate a natural follow-up question based on the candidate's answer.\n\n"
               << "Original question: \"" << *context.current_question << "\"\n"
               << "Candidate's answer: \"" << answer << "\"\n"
               << "Evaluation: " << (evaluation.feedback.empty() ? "No feedback" : evaluation.feedback) << "\n\n"
               << "The follow-up should explore deeper into their answer, test practical application "
               << "or understanding, feel conversational, be answerable in 2-3 minutes and build on "
               << "what they said.\n\n"
               << "Return just the follow-up question text.";

        DialogueAction action;
        action.kind = ActionKind::FollowUp;
        action.text = generate(prompt.str(), "follow-up", FOLLOW_UP_FALLBACK);
        action.topic = context.current_topic;
        context.pending_follow_up = action.text;
        context.phase = Phase::AwaitingAnswer;
        return action;
    }

    DialogueAction opening_question(ConversationContext& context) {
        std::string topic = least_covered_topic(context);

        std::ostringstream prompt;
        prompt << "Generate the opening question for a technical interview.\n\n"
               << "Context:\n"
               << "- Topics: " << join(context.topic_names()) << "\n"
               << "- Focus topic for this question: " << topic << "\n"
               << "- Interview duration: " << format_minutes(context.clock.duration_minutes()) << " minutes\n"
               << "- This is the first question\n\n"
               << "Question bank examples (style reference):\n"
               << bank_examples(config_.opening_examples) << "\n\n"
               << "The question should open the interview, cover the focus topic, be difficulty "
               << context.difficulty << "/5, be answerable in 3-5 minutes and set a welcoming tone.\n\n"
               << "Return just the question text.";

        return ask(context, topic, generate(prompt.str(), "first question", OPENING_FALLBACK));
    }

    DialogueAction next_question(ConversationContext& context) {
        std::string topic = least_covered_topic(context);

        std::ostringstream prompt;
        prompt << "Generate the next question for this technical interview.\n\n"
               << "Interview context:\n"
               << context.summary_json().dump(2) << "\n\n"
               << "Topics to cover: " << join(context.topic_names()) << "\n"
               << "Focus topic for this question: " << topic << "\n\n"
               << "Question bank examples (style reference):\n"
               << bank_examples(config_.next_examples) << "\n\n"
               << "The question should cover new ground, fit the remaining time, build naturally on "
               << "the conversation and test a different aspect of the candidate's knowledge.\n\n"
               << "Return just the question text.";

        return ask(context, topic, generate(prompt.str(), "next question", NEXT_FALLBACK));
    }

    DialogueAction ask(ConversationContext& context, const std::string& topic, const std::string& text) {
        std::string id = "conv-" + std::to_string(context.questions_asked + 1);
        context.begin_question(id, text, topic, context.difficulty);

        DialogueAction action;
        action.kind = ActionKind::Question;
        action.text = text;
        action.topic = topic;
        return action;
    }

    DialogueAction handle_candidate_question(const std::string& question, const ConversationContext& context) {
        std::ostringstream prompt;
        prompt << "You are an experienced technical interviewer. The candidate asked:\n"
               << "\"" << question << "\"\n\n"
               << "Interview context:\n"
               << "- Current question: " << context.current_question.value_or("Starting interview") << "\n"
               << "- Topics: " << join(context.topic_names()) << "\n"
               << "- Time remaining: " << format_minutes(context.remaining_minutes()) << " minutes\n\n"
               << "Answer their question appropriately without giving away answers, keep a professional "
               << "tone and encourage them to continue. Keep it to 2-3 sentences and end by returning "
               << "to the interview.";

        DialogueAction action;
        action.kind = ActionKind::Guidance;
        action.text = generate(prompt.str(), "guidance", GUIDANCE_FALLBACK);
        return action;
    }

    DialogueAction handle_clarification(const std::string& transcript, ConversationContext& context) {
        if (!context.has_question()) {
            return opening_question(context);
        }

        std::string question = context.pending_follow_up ? *context.pending_follow_up : *context.current_question;

        std::ostringstream prompt;
        prompt << "The candidate asked for clarification about this question:\n"
               << "\"" << question << "\"\n\n"
               << "They said: \"" << transcript << "\"\n\n"
               << "Rephrase or explain the question differently, give helpful context without revealing "
               << "the answer, and encourage them to attempt an answer. Keep it concise and supportive.";

        DialogueAction action;
        action.kind = ActionKind::Clarification;
        action.text = generate(prompt.str(), "clarification",
                               "Let me rephrase that question: " + question + ". Take your time to think about it.");
        return action;
    }

    DialogueAction handle_confusion(const std::string& transcript, const ConversationContext& context) {
        std::ostringstream prompt;
        prompt << "The candidate seems confused or stuck. They said:\n"
               << "\"" << transcript << "\"\n\n"
               << "Current question: \"" << context.current_question.value_or("None") << "\"\n\n"
               << "Acknowledge their difficulty, offer a hint or a different approach, and encourage "
               << "them without giving away the answer. Be empathetic and constructive.";

        DialogueAction action;
        action.kind = ActionKind::Guidance;
        action.text = generate(prompt.str(), "confusion guidance", CONFUSION_FALLBACK);
        return action;
    }

    std::string generate(const std::string& prompt, const char* what, const std::string& fallback) {
        auto reply = client_.complete(prompt);
        if (!reply) {
            LOG_ERROR(std::string("Error generating ") + what + ": " + reply.error().message);
            return fallback;
        }
        std::string text = unquote(reply.value());
        if (text.empty()) {
            LOG_WARN(std::string("Empty ") + what + " from reasoning client, using fallback");
            return fallback;
        }
        return text;
    }

    std::string bank_examples(size_t n) const {
        if (!bank_) return "[]";
        return bank_->examples(n).dump(2);
    }

    llm::IReasoningClient& client_;
    std::shared_ptr<const QuestionBank> bank_;
    InterviewConfig config_;
    IntentClassifier classifier_;
    AnswerEvaluator evaluator_;
};

DialoguePolicy::DialoguePolicy(llm::IReasoningClient& client,
                               std::shared_ptr<const QuestionBank> bank,
                               const InterviewConfig& config)
    : pimpl_(std::make_unique<Impl>(client, std::move(bank), config)) {}

DialoguePolicy::~DialoguePolicy() = default;

DialogueAction DialoguePolicy::handle(const std::string& transcript, ConversationContext& context) {
    return pimpl_->handle(transcript, context);
}

bool DialoguePolicy::should_end_interview(const ConversationContext& context) const {
    return pimpl_->should_end_interview(context);
}

void DialoguePolicy::set_current_question(ConversationContext& context, const Question& question) const {
    context.begin_question(question.id, question.text, question.topic, question.difficulty,
                           question.expected_answer);
    LOG_POLICY("Current question set from bank: " + question.id);
}

std::string DialoguePolicy::least_covered_topic(const ConversationContext& context) {
    std::string best;
    int best_count = std::numeric_limits<int>::max();
    for (const auto& entry : context.topics_covered) {
        if (entry.second < best_count) {
            best = entry.first;
            best_count = entry.second;
        }
    }
    return best.empty() ? "general" : best;
}

std::vector<std::string> DialoguePolicy::canned_utterances() {
    return {OPENING_FALLBACK, NEXT_FALLBACK, FOLLOW_UP_FALLBACK, GUIDANCE_FALLBACK,
            CONFUSION_FALLBACK, PROCESSING_ERROR_TEXT, NOTHING_HEARD_TEXT, TIME_UP_TEXT};
}

bool DialoguePolicy::parse_follow_up_decision(const std::string& reply) {
    return utils::normalize_copy(reply).find("follow") != std::string::npos;
}

} // namespace viva
