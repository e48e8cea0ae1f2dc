#pragma once

#include "config.h"
#include "dialogue_policy.h"
#include "question_bank.h"
#include "session_lifecycle.h"
#include "llm/reasoning_client.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace viva {

struct SessionOptions {
    SessionSettings settings;
    InterviewConfig interview;
    std::string owner_connection;     ///< Transport connection that started the session
    std::string log_dir;              ///< Where the record is saved on end; empty = not saved
    SessionClock::NowFn now;          ///< Time source; steady_clock when empty
    std::optional<uint32_t> seed;     ///< Question selection seed; random when empty
};

struct ServedQuestion {
    const Question* question = nullptr;
    int number = 0;                   ///< 1-based, counts every top-level question
    double remaining_seconds = 0.0;
};

/**
 * @brief One running interview
 *
 * Every public call takes the session mutex, so turns are processed one at a time and
 * end() waits for an in-flight turn to finish before sealing the record.
 */
class InterviewSession {
public:
    InterviewSession(const std::string& id,
                     const SessionOptions& options,
                     std::shared_ptr<const QuestionBank> bank,
                     llm::IReasoningClient& reasoning);
    ~InterviewSession();

    InterviewSession(const InterviewSession&) = delete;
    InterviewSession& operator=(const InterviewSession&) = delete;

    const std::string& id() const;
    const std::string& owner() const;
    const SessionSettings& settings() const;

    /**
     * @brief Serve an unused bank question matching the session's topics and difficulty
     * @return nullopt once elapsed >= duration; NotFound when nothing is left;
     *         InvalidState after end()
     */
    Result<std::optional<ServedQuestion>> next_question();

    /**
     * @brief Run one candidate turn through the dialogue policy and record it
     * @return InterviewComplete action once the time budget is spent; InvalidState after end()
     */
    Result<DialogueAction> handle_utterance(const Transcript& transcript);

    /// remaining time <= end buffer
    bool should_end() const;

    double remaining_minutes() const;

    /**
     * @brief End the session (first call seals and persists the record)
     * @return session_ended reply body; identical on every call
     */
    nlohmann::json end();

    bool is_ended() const;

    std::string text_summary() const;

    std::set<std::string> used_question_ids() const;

    /// Snapshot of the conversation state (for tests and diagnostics)
    int follow_up_count() const;
    int questions_asked() const;
    std::optional<std::string> current_question() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
