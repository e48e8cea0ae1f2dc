#pragma once

#include "answer_evaluator.h"
#include "common.h"
#include "errors.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace viva {

struct FollowUpExchange {
    std::string question;
    std::string answer;
    std::optional<int> score;
};

/**
 * @brief One asked top-level question and what happened to it
 */
struct RecordEntry {
    std::string question_id;
    std::string question_text;
    std::string topic;
    int difficulty = DEFAULT_DIFFICULTY;
    std::string answer;
    double confidence = 0.0;
    std::optional<Evaluation> evaluation;
    std::vector<FollowUpExchange> follow_ups;
    std::string timestamp;                    ///< ISO time the question was asked
    std::optional<double> response_seconds;   ///< Question to first answer

    nlohmann::json to_json() const;
};

struct UserPreferences {
    std::vector<std::string> topics;
    int difficulty = DEFAULT_DIFFICULTY;
    int interview_duration = DEFAULT_INTERVIEW_MINUTES;
    std::string timestamp;
};

/**
 * @brief Append-only interview record, sealed once at session end
 *
 * Every mutator returns InvalidState after seal(). Answers, evaluations and follow-ups
 * attach to the most recently added question; NotFound if none was added yet.
 */
class SessionRecord {
public:
    using NowFn = std::function<TimePoint()>;

    explicit SessionRecord(const std::string& session_id, NowFn now = nullptr);
    ~SessionRecord();

    SessionRecord(const SessionRecord&) = delete;
    SessionRecord& operator=(const SessionRecord&) = delete;

    const std::string& session_id() const;

    Result<void> set_preferences(const UserPreferences& preferences);
    Result<void> add_question(const std::string& id, const std::string& text,
                              const std::string& topic, int difficulty);
    Result<void> record_answer(const std::string& answer, double confidence);
    Result<void> record_evaluation(const Evaluation& evaluation);
    Result<void> add_follow_up(const std::string& question);

    /// Answer to the latest follow-up of the current question
    Result<void> record_follow_up_answer(const std::string& answer, std::optional<int> score);

    /**
     * @brief Freeze the record and compute the summary (first call only)
     * @param conversation_history Stored alongside the entries for persistence
     * @return The summary; the same object on every call
     */
    const nlohmann::json& seal(const nlohmann::json& conversation_history = nlohmann::json::array());

    bool is_sealed() const;

    /// InvalidState until sealed
    Result<nlohmann::json> summary() const;

    std::vector<RecordEntry> entries() const;
    std::vector<Evaluation> evaluations() const;

    nlohmann::json to_json() const;

    /**
     * @brief Write session_<id>.json into dir (created if missing)
     * @return Path written
     */
    Result<std::string> save_to_file(const std::string& dir) const;

    /// Plain-text report of the sealed summary
    std::string text_summary() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
