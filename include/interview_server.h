#pragma once

#include "config.h"
#include "question_bank.h"
#include "session_registry.h"
#include "llm/reasoning_client.h"
#include "stt/transcriber.h"
#include "tts/tts_interface.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace viva {

/**
 * @brief Tagged request/response protocol over the session registry
 *
 * Transport-agnostic: one inbound JSON record in, one reply record out. Every failure
 * becomes an {"type": "error", "message": ...} reply; nothing thrown escapes.
 *
 * Inbound tags: start_session, get_question, submit_audio (alias process_audio),
 * text_to_speech, get_topics, end_session.
 */
class InterviewServer {
public:
    InterviewServer(const Config& config,
                    std::shared_ptr<const QuestionBank> bank,
                    llm::IReasoningClient& reasoning,
                    stt::ITranscriber& transcriber,
                    tts::ITTS& synthesizer);
    ~InterviewServer();

    InterviewServer(const InterviewServer&) = delete;
    InterviewServer& operator=(const InterviewServer&) = delete;

    nlohmann::json handle_message(const nlohmann::json& message, const std::string& connection_id);

    /// Parse, dispatch, serialize; malformed JSON yields "Invalid JSON format"
    std::string handle_payload(const std::string& payload, const std::string& connection_id);

    /// End and retire every unfinished session started on this connection
    void on_disconnect(const std::string& connection_id);

    /// Connections that started a session and have not disconnected
    size_t connection_count() const;

    /// End every active session (shutdown)
    void end_all();

    SessionRegistry& registry();

    /// Time source for new sessions (tests)
    void set_clock(SessionClock::NowFn now);

    static nlohmann::json error_reply(const std::string& message);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
