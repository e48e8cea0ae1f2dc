#pragma once

#include "common.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace viva {

/**
 * @brief Classified purpose of one candidate turn
 */
enum class Intent {
    AnsweringQuestion,
    AskingQuestion,
    SeekingClarification,
    ConfusedOrStuck
};

/// Wire/log name: "answering_question", "asking_question", ...
const char* intent_name(Intent intent);

/**
 * @brief Conversation phase
 *
 * NoQuestion -> AwaitingAnswer (question asked)
 * AwaitingAnswer -> Evaluating -> DecidingFollowUp -> AwaitingAnswer
 * any -> Ended (session end)
 */
enum class Phase {
    NoQuestion,
    AwaitingAnswer,
    Evaluating,
    DecidingFollowUp,
    Ended
};

const char* phase_name(Phase phase);

/**
 * @brief Monotonic interview clock with an injectable time source
 */
class SessionClock {
public:
    using NowFn = std::function<TimePoint()>;

    explicit SessionClock(double duration_minutes = DEFAULT_INTERVIEW_MINUTES, NowFn now = nullptr);

    TimePoint now() const;
    TimePoint started_at() const { return start_; }

    double duration_minutes() const { return duration_minutes_; }
    void set_duration_minutes(double minutes) { duration_minutes_ = minutes; }

    double elapsed_seconds() const;
    double elapsed_minutes() const;

    /// max(0, duration - elapsed)
    double remaining_minutes() const;

private:
    NowFn now_;
    TimePoint start_;
    double duration_minutes_;
};

struct Exchange {
    std::string timestamp;     ///< ISO wall-clock time
    std::string user_text;
    std::string system_text;
    Intent intent = Intent::AnsweringQuestion;
    int question_number = 0;   ///< questions_asked when the exchange happened
    std::string question;      ///< Question in play when the candidate spoke (empty if none)

    nlohmann::json to_json() const;
};

/**
 * @brief Per-session dialogue state, owned by one session and handed to the policy by reference
 *
 * current_question is the top-level question. A pending follow-up is tracked separately so
 * the answer to it can be attributed correctly; it is cleared when a new top-level
 * question is asked.
 */
struct ConversationContext {
    explicit ConversationContext(SessionClock session_clock = SessionClock());

    SessionClock clock;
    Phase phase = Phase::NoQuestion;

    std::optional<std::string> current_question;
    std::string current_question_id;
    std::string current_topic;
    std::string current_expected_answer;   ///< Known only for bank questions
    int current_difficulty = DEFAULT_DIFFICULTY;
    std::optional<std::string> pending_follow_up;

    int difficulty = DEFAULT_DIFFICULTY;   ///< Requested interview difficulty
    int follow_up_count = 0;
    int max_follow_ups = DEFAULT_MAX_FOLLOW_UPS;
    int questions_asked = 0;

    std::vector<Exchange> history;
    std::map<std::string, int> topics_covered;

    bool has_question() const { return current_question.has_value(); }
    bool awaiting_answer() const { return phase == Phase::AwaitingAnswer; }
    double remaining_minutes() const { return clock.remaining_minutes(); }

    /// Topic names in map order
    std::vector<std::string> topic_names() const;

    /**
     * @brief Append one turn
     * @param question Question in play when the candidate spoke
     */
    void add_exchange(const std::string& user_text, const std::string& system_text, Intent intent,
                      const std::string& question);

    /**
     * @brief Install a new top-level question; resets the follow-up budget
     */
    void begin_question(const std::string& id, const std::string& text, const std::string& topic,
                        int question_difficulty, const std::string& expected_answer = "");

    /// questions_asked, follow_up_count, remaining_time, last 5 exchanges, topics, current question
    nlohmann::json summary_json() const;

    nlohmann::json history_json() const;
};

} // namespace viva
