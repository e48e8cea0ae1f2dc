#include "interview_server.h"
#include "audio/wav_io.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <mutex>
#include <set>

using json = nlohmann::json;

namespace viva {

namespace {

std::string session_id_of(const json& message) {
    if (message.contains("session_id") && message["session_id"].is_string()) {
        return message["session_id"].get<std::string>();
    }
    return "";
}

// Integer within [lo, hi], compared at full width before any narrowing
bool integer_in_range(const json& value, int64_t lo, int64_t hi) {
    if (!value.is_number_integer()) return false;
    if (value.is_number_unsigned()) {
        uint64_t v = value.get<uint64_t>();
        return v <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) &&
               static_cast<int64_t>(v) >= lo && static_cast<int64_t>(v) <= hi;
    }
    int64_t v = value.get<int64_t>();
    return v >= lo && v <= hi;
}

json interview_complete_reply() {
    return json{{"type", "interview_complete"}, {"message", "Interview time completed"}};
}

} // namespace

class InterviewServer::Impl {
public:
    Impl(const Config& config, std::shared_ptr<const QuestionBank> bank,
         llm::IReasoningClient& reasoning, stt::ITranscriber& transcriber, tts::ITTS& synthesizer)
        : registry_(config.server.retained_ended_sessions)
        , config_(config)
        , bank_(std::move(bank))
        , reasoning_(reasoning)
        , transcriber_(transcriber)
        , synthesizer_(synthesizer) {}

    json handle_message(const json& message, const std::string& connection_id) {
        if (!message.is_object()) {
            return error_reply("Invalid message format");
        }
        if (!message.contains("type") || !message["type"].is_string()) {
            return error_reply("Missing message type");
        }
        std::string type = message["type"].get<std::string>();

        try {
            if (type == "start_session") return start_session(message, connection_id);
            if (type == "get_question") return get_question(message);
            if (type == "submit_audio" || type == "process_audio") return submit_audio(message);
            if (type == "text_to_speech") return text_to_speech(message);
            if (type == "get_topics") return get_topics();
            if (type == "end_session") return end_session(message);
        } catch (const std::exception& e) {
            LOG_ERROR("Error processing " + type + ": " + e.what());
            return error_reply(e.what());
        }
        return error_reply("Unknown message type: " + type);
    }

    void on_disconnect(const std::string& connection_id) {
        {
            std::lock_guard<std::mutex> lock(owners_mutex_);
            owners_.erase(connection_id);
        }
        for (const auto& id : registry_.sessions_owned_by(connection_id)) {
            LOG_SERVER("Connection " + connection_id + " closed, ending session " + id);
            end_and_retire(id);
        }
    }

    void end_all() {
        for (const auto& id : registry_.sessions_owned_by("")) {
            end_and_retire(id);
        }
        std::set<std::string> owners;
        {
            std::lock_guard<std::mutex> lock(owners_mutex_);
            owners = owners_;
        }
        for (const auto& owner : owners) {
            on_disconnect(owner);
        }
    }

    size_t connection_count() const {
        std::lock_guard<std::mutex> lock(owners_mutex_);
        return owners_.size();
    }

    void set_clock(SessionClock::NowFn now) {
        std::lock_guard<std::mutex> lock(owners_mutex_);
        now_ = std::move(now);
    }

    SessionRegistry registry_;

private:
    json start_session(const json& message, const std::string& connection_id) {
        SessionSettings settings;
        settings.difficulty = config_.interview.default_difficulty;
        settings.duration_minutes = config_.interview.default_duration_minutes;
        settings.max_follow_ups = config_.interview.max_follow_ups;

        if (message.contains("topics") && !message["topics"].is_null()) {
            if (!message["topics"].is_array()) {
                return error_reply("Failed to start session: topics must be a list of strings");
            }
            for (const auto& topic : message["topics"]) {
                if (!topic.is_string()) {
                    return error_reply("Failed to start session: topics must be a list of strings");
                }
                settings.topics.push_back(topic.get<std::string>());
            }
        }
        if (message.contains("difficulty") && !message["difficulty"].is_null()) {
            const json& d = message["difficulty"];
            if (!integer_in_range(d, MIN_DIFFICULTY, MAX_DIFFICULTY)) {
                return error_reply("Failed to start session: difficulty must be an integer from 1 to 5");
            }
            settings.difficulty = d.get<int>();
        }
        if (message.contains("interview_duration") && !message["interview_duration"].is_null()) {
            const json& d = message["interview_duration"];
            if (!integer_in_range(d, 1, std::numeric_limits<int>::max())) {
                return error_reply("Failed to start session: interview_duration must be a positive number of minutes");
            }
            settings.duration_minutes = d.get<int>();
        }

        SessionOptions options;
        options.settings = settings;
        options.interview = config_.interview;
        options.owner_connection = connection_id;
        options.log_dir = config_.session_log_dir;
        {
            std::lock_guard<std::mutex> lock(owners_mutex_);
            options.now = now_;
            owners_.insert(connection_id);
        }

        auto session = registry_.create([&](const std::string& id) {
            return std::make_shared<InterviewSession>(id, options, bank_, reasoning_);
        });
        if (!session) {
            return error_reply("Failed to start session");
        }

        LOG_SERVER("Started session " + session->id() + " with difficulty " +
                   std::to_string(settings.difficulty) + ", duration " +
                   std::to_string(settings.duration_minutes) + "min");

        json reply;
        reply["type"] = "session_started";
        reply["session_id"] = session->id();
        reply["topics"] = settings.topics;
        reply["difficulty"] = settings.difficulty;
        reply["interview_duration"] = settings.duration_minutes;
        return reply;
    }

    json get_question(const json& message) {
        auto session = registry_.find(session_id_of(message));
        if (!session) {
            return error_reply("Session not found");
        }

        auto served = session->next_question();
        if (!served) {
            return error_reply(served.error().message);
        }
        if (!served.value()) {
            return interview_complete_reply();
        }

        const ServedQuestion& q = *served.value();
        double remaining = std::max(0.0, q.remaining_seconds);

        json reply;
        reply["type"] = "question";
        reply["question_id"] = q.question->id;
        reply["question_text"] = q.question->text;
        reply["question_topic"] = q.question->topic;
        reply["question_difficulty"] = q.question->difficulty;
        reply["question_number"] = q.number;
        reply["remaining_time_minutes"] = static_cast<int>(remaining / 60.0);
        reply["remaining_time_seconds"] = static_cast<int>(std::fmod(remaining, 60.0));
        reply["interview_duration"] = session->settings().duration_minutes;
        return reply;
    }

    json submit_audio(const json& message) {
        auto session = registry_.find(session_id_of(message));
        if (!session) {
            return error_reply("Session not found");
        }
        if (!message.contains("audio_data") || !message["audio_data"].is_string()) {
            return error_reply("Invalid audio payload");
        }

        auto bytes = utils::base64_decode(message["audio_data"].get<std::string>());
        if (!bytes || bytes->empty()) {
            return error_reply("Invalid audio payload");
        }

        AudioFormat declared;
        if (message.contains("sample_rate") && message["sample_rate"].is_number_integer()) {
            declared.sample_rate = message["sample_rate"].get<int>();
        }
        if (message.contains("channels") && message["channels"].is_number_integer()) {
            declared.channels = message["channels"].get<int>();
        }
        if (message.contains("encoding") && message["encoding"].is_string()) {
            declared.encoding = message["encoding"].get<std::string>();
        }
        auto samples = audio::decode_payload(*bytes, declared, DEFAULT_SAMPLE_RATE);
        if (!samples || samples.value().empty()) {
            LOG_WARN("Undecodable audio payload: " + (samples ? std::string("no samples") : samples.error().message));
            return error_reply("Invalid audio payload");
        }

        if (session->should_end()) {
            return interview_complete_reply();
        }

        AudioFormat format;
        format.sample_rate = DEFAULT_SAMPLE_RATE;
        format.channels = 1;
        auto transcript = transcriber_.transcribe(samples.value(), format);
        if (!transcript) {
            LOG_ERROR("Transcription failed: " + transcript.error().message);
            return error_reply("Failed to transcribe audio");
        }
        if (utils::is_empty_or_whitespace(transcript.value().text)) {
            return error_reply("Failed to transcribe audio");
        }

        auto action = session->handle_utterance(transcript.value());
        if (!action) {
            return error_reply(action.error().message);
        }
        const DialogueAction& a = action.value();
        if (a.kind == ActionKind::InterviewComplete) {
            return interview_complete_reply();
        }

        json reply;
        reply["type"] = "ai_conversation";
        reply["transcript"] = transcript.value().text;
        reply["response_text"] = a.text;
        reply["response_type"] = action_kind_name(a.kind);
        reply["auto_play"] = a.speak;
        if (a.speak) {
            reply["response_audio"] = synthesize_base64(a.text);
        }
        if (a.evaluation) {
            reply["evaluation"] = a.evaluation->to_json();
        }
        return reply;
    }

    json text_to_speech(const json& message) {
        std::string text;
        if (message.contains("text") && message["text"].is_string()) {
            text = message["text"].get<std::string>();
        }
        if (utils::is_empty_or_whitespace(text)) {
            return error_reply("No text provided for speech synthesis");
        }

        auto result = synthesizer_.synth(text);
        if (!result.ok()) {
            LOG_ERROR("Error in text-to-speech: " + (result.error.empty() ? std::string("empty audio") : result.error));
            return error_reply("Failed to generate speech");
        }
        return json{{"type", "audio"},
                    {"audio_data", utils::base64_encode(audio::encode_wav(result.audio, result.sample_rate))}};
    }

    json get_topics() {
        json reply;
        reply["type"] = "topics";
        if (bank_) {
            auto range = bank_->difficulty_range();
            reply["topics"] = bank_->topics();
            reply["difficulty_range"] = {range.first, range.second};
        } else {
            reply["topics"] = json::array();
            reply["difficulty_range"] = {MIN_DIFFICULTY, MAX_DIFFICULTY};
        }
        return reply;
    }

    json end_session(const json& message) {
        std::string id = session_id_of(message);
        if (auto previous = registry_.find_ended(id)) {
            return *previous;
        }
        auto session = registry_.find(id);
        if (!session) {
            return error_reply("Session not found");
        }
        return end_and_retire(id, session);
    }

    json end_and_retire(const std::string& id, std::shared_ptr<InterviewSession> session = nullptr) {
        if (!session) session = registry_.find(id);
        if (!session) return error_reply("Session not found");

        json reply = session->end();
        registry_.retire(id, reply);
        LOG_SERVER("Ended session " + id);
        return reply;
    }

    // Empty string when synthesis fails; the text reply still goes out
    std::string synthesize_base64(const std::string& text) {
        auto result = synthesizer_.synth(text);
        if (!result.ok()) {
            LOG_ERROR("Error in direct text-to-speech: " + (result.error.empty() ? std::string("empty audio") : result.error));
            return "";
        }
        return utils::base64_encode(audio::encode_wav(result.audio, result.sample_rate));
    }

    Config config_;
    std::shared_ptr<const QuestionBank> bank_;
    llm::IReasoningClient& reasoning_;
    stt::ITranscriber& transcriber_;
    tts::ITTS& synthesizer_;
    SessionClock::NowFn now_;
    std::set<std::string> owners_;
    mutable std::mutex owners_mutex_;
};

InterviewServer::InterviewServer(const Config& config,
                                 std::shared_ptr<const QuestionBank> bank,
                                 llm::IReasoningClient& reasoning,
                                 stt::ITranscriber& transcriber,
                                 tts::ITTS& synthesizer)
    : pimpl_(std::make_unique<Impl>(config, std::move(bank), reasoning, transcriber, synthesizer)) {}

InterviewServer::~InterviewServer() = default;

json InterviewServer::handle_message(const json& message, const std::string& connection_id) {
    return pimpl_->handle_message(message, connection_id);
}

std::string InterviewServer::handle_payload(const std::string& payload, const std::string& connection_id) {
    json message;
    try {
        message = json::parse(payload);
    } catch (const json::exception&) {
        return error_reply("Invalid JSON format").dump();
    }
    return handle_message(message, connection_id).dump();
}

void InterviewServer::on_disconnect(const std::string& connection_id) {
    pimpl_->on_disconnect(connection_id);
}

size_t InterviewServer::connection_count() const {
    return pimpl_->connection_count();
}

void InterviewServer::end_all() {
    pimpl_->end_all();
}

SessionRegistry& InterviewServer::registry() {
    return pimpl_->registry_;
}

void InterviewServer::set_clock(SessionClock::NowFn now) {
    pimpl_->set_clock(std::move(now));
}

json InterviewServer::error_reply(const std::string& message) {
    return json{{"type", "error"}, {"message", message}};
}

} // namespace viva
