#pragma once

#include "conversation_context.h"
#include "errors.h"
#include "session_record.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace viva {

/**
 * @brief Parameters fixed at session start
 */
struct SessionSettings {
    std::vector<std::string> topics;
    int difficulty = DEFAULT_DIFFICULTY;
    int duration_minutes = DEFAULT_INTERVIEW_MINUTES;
    int max_follow_ups = DEFAULT_MAX_FOLLOW_UPS;
};

/**
 * @brief One session's identity, clock, conversation state and record
 *
 * Not internally synchronized; the owning InterviewSession serializes access.
 * After end() the context is in Phase::Ended, the record is sealed and every
 * further end() returns the same summary object.
 */
class SessionLifecycle {
public:
    SessionLifecycle(const std::string& id, const SessionSettings& settings,
                     SessionClock::NowFn now = nullptr);
    ~SessionLifecycle();

    SessionLifecycle(const SessionLifecycle&) = delete;
    SessionLifecycle& operator=(const SessionLifecycle&) = delete;

    const std::string& id() const;
    const SessionSettings& settings() const;

    ConversationContext& context();
    const ConversationContext& context() const;

    SessionRecord& record();
    const SessionRecord& record() const;

    double elapsed_minutes() const;
    double remaining_minutes() const;

    bool is_ended() const;

    /**
     * @brief Freeze the session and compute the summary once
     * @return Reference to the stored summary (identical on repeated calls)
     */
    const nlohmann::json& end();

    /// InvalidState while the session is running
    Result<nlohmann::json> summary() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
