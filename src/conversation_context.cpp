#include "conversation_context.h"
#include "utils.h"
#include <algorithm>
#include <chrono>

using json = nlohmann::json;

namespace viva {

const char* intent_name(Intent intent) {
    switch (intent) {
        case Intent::AnsweringQuestion: return "answering_question";
        case Intent::AskingQuestion: return "asking_question";
        case Intent::SeekingClarification: return "seeking_clarification";
        case Intent::ConfusedOrStuck: return "confused_or_stuck";
    }
    return "answering_question";
}

const char* phase_name(Phase phase) {
    switch (phase) {
        case Phase::NoQuestion: return "no_question";
        case Phase::AwaitingAnswer: return "awaiting_answer";
        case Phase::Evaluating: return "evaluating";
        case Phase::DecidingFollowUp: return "deciding_follow_up";
        case Phase::Ended: return "ended";
    }
    return "no_question";
}

SessionClock::SessionClock(double duration_minutes, NowFn now)
    : now_(now ? std::move(now) : NowFn([] { return Clock::now(); }))
    , start_(now_())
    , duration_minutes_(duration_minutes) {}

TimePoint SessionClock::now() const {
    return now_();
}

double SessionClock::elapsed_seconds() const {
    return std::chrono::duration<double>(now_() - start_).count();
}

double SessionClock::elapsed_minutes() const {
    return elapsed_seconds() / 60.0;
}

double SessionClock::remaining_minutes() const {
    return std::max(0.0, duration_minutes_ - elapsed_minutes());
}

json Exchange::to_json() const {
    json j;
    j["timestamp"] = timestamp;
    j["user_input"] = user_text;
    j["ai_response"] = system_text;
    j["intent"] = intent_name(intent);
    j["question_number"] = question_number;
    j["question"] = question;
    return j;
}

ConversationContext::ConversationContext(SessionClock session_clock)
    : clock(std::move(session_clock)) {}

std::vector<std::string> ConversationContext::topic_names() const {
    std::vector<std::string> names;
    for (const auto& entry : topics_covered) {
        names.push_back(entry.first);
    }
    return names;
}

void ConversationContext::add_exchange(const std::string& user_text, const std::string& system_text,
                                       Intent intent, const std::string& question) {
    Exchange exchange;
    exchange.timestamp = utils::iso_timestamp();
    exchange.user_text = user_text;
    exchange.system_text = system_text;
    exchange.intent = intent;
    exchange.question_number = questions_asked;
    exchange.question = question;
    history.push_back(std::move(exchange));
}

void ConversationContext::begin_question(const std::string& id, const std::string& text,
                                         const std::string& topic, int question_difficulty,
                                         const std::string& expected_answer) {
    current_question = text;
    current_question_id = id;
    current_topic = topic;
    current_difficulty = question_difficulty;
    current_expected_answer = expected_answer;
    pending_follow_up.reset();
    follow_up_count = 0;
    ++questions_asked;
    topics_covered[topic]++;
    phase = Phase::AwaitingAnswer;
}

json ConversationContext::summary_json() const {
    json recent = json::array();
    size_t first = history.size() > 5 ? history.size() - 5 : 0;
    for (size_t i = first; i < history.size(); ++i) {
        recent.push_back(history[i].to_json());
    }

    json j;
    j["questions_asked"] = questions_asked;
    j["follow_up_count"] = follow_up_count;
    j["remaining_time"] = utils::round_to(remaining_minutes(), 1);
    j["recent_conversation"] = recent;
    j["topics_covered"] = topic_names();
    j["current_question"] = current_question ? json(*current_question) : json(nullptr);
    return j;
}

json ConversationContext::history_json() const {
    json out = json::array();
    for (const auto& exchange : history) {
        out.push_back(exchange.to_json());
    }
    return out;
}

} // namespace viva
