#include "interview_session.h"
#include "logger.h"
#include <mutex>
#include <random>

using json = nlohmann::json;

namespace viva {

class InterviewSession::Impl {
public:
    Impl(const std::string& id, const SessionOptions& options,
         std::shared_ptr<const QuestionBank> bank, llm::IReasoningClient& reasoning)
        : options_(options)
        , bank_(bank)
        , lifecycle_(id, options.settings, options.now)
        , policy_(reasoning, bank, options.interview)
        , rng_(options.seed ? *options.seed : std::random_device{}()) {}

    Result<std::optional<ServedQuestion>> next_question() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lifecycle_.is_ended()) return ended_error();

        ConversationContext& context = lifecycle_.context();
        double elapsed_seconds = context.clock.elapsed_seconds();
        double budget_seconds = context.clock.duration_minutes() * 60.0;
        if (elapsed_seconds >= budget_seconds) {
            LOG_SESSION("Interview time completed for session " + lifecycle_.id());
            return std::optional<ServedQuestion>();
        }

        if (!bank_) {
            return make_not_found_error("No more questions available");
        }

        QuestionFilter criteria;
        criteria.topics = options_.settings.topics;
        criteria.difficulty = options_.settings.difficulty;
        const Question* question = bank_->select(criteria, used_ids_, &rng_);
        if (!question) {
            return make_not_found_error("No more questions available");
        }

        used_ids_.insert(question->id);
        policy_.set_current_question(context, *question);
        log_if_failed(lifecycle_.record().add_question(question->id, question->text,
                                                       question->topic, question->difficulty));

        ServedQuestion served;
        served.question = question;
        served.number = context.questions_asked;
        served.remaining_seconds = budget_seconds - elapsed_seconds;
        return std::optional<ServedQuestion>(served);
    }

    Result<DialogueAction> handle_utterance(const Transcript& transcript) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lifecycle_.is_ended()) return ended_error();

        ConversationContext& context = lifecycle_.context();
        bool answering_follow_up = context.pending_follow_up.has_value();

        DialogueAction action = policy_.handle(transcript.text, context);
        record(action, transcript, answering_follow_up);
        return action;
    }

    bool should_end() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return policy_.should_end_interview(lifecycle_.context());
    }

    double remaining_minutes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lifecycle_.remaining_minutes();
    }

    json end() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lifecycle_.is_ended()) {
            return ended_reply_;
        }

        const json& summary = lifecycle_.end();
        const ConversationContext& context = lifecycle_.context();

        json evaluations = json::array();
        for (size_t i = 0; i < context.history.size(); ++i) {
            const Exchange& exchange = context.history[i];
            if (exchange.intent != Intent::AnsweringQuestion) continue;
            evaluations.push_back({
                {"question_number", i + 1},
                {"question_text", exchange.question},
                {"transcript", exchange.user_text},
                {"ai_response", exchange.system_text},
                {"timestamp", exchange.timestamp}
            });
        }

        ended_reply_ = json::object();
        ended_reply_["type"] = "session_ended";
        ended_reply_["session_id"] = lifecycle_.id();
        ended_reply_["summary"] = summary;
        ended_reply_["conversation_history"] = context.history_json();
        ended_reply_["evaluations"] = evaluations;
        ended_reply_["total_questions"] = evaluations.size();

        if (!options_.log_dir.empty()) {
            auto saved = lifecycle_.record().save_to_file(options_.log_dir);
            if (!saved) {
                LOG_ERROR("Error saving session data: " + saved.error().message);
            }
        }
        return ended_reply_;
    }

    bool is_ended() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lifecycle_.is_ended();
    }

    std::string text_summary() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lifecycle_.record().text_summary();
    }

    std::set<std::string> used_question_ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return used_ids_;
    }

    int follow_up_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lifecycle_.context().follow_up_count;
    }

    int questions_asked() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lifecycle_.context().questions_asked;
    }

    std::optional<std::string> current_question() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lifecycle_.context().current_question;
    }

    SessionOptions options_;
    std::shared_ptr<const QuestionBank> bank_;
    SessionLifecycle lifecycle_;

private:
    // Mirror one turn into the session record
    void record(const DialogueAction& action, const Transcript& transcript, bool answering_follow_up) {
        SessionRecord& rec = lifecycle_.record();
        const ConversationContext& context = lifecycle_.context();

        if (action.evaluation) {
            if (answering_follow_up) {
                log_if_failed(rec.record_follow_up_answer(transcript.text, action.evaluation->score));
            } else {
                log_if_failed(rec.record_answer(transcript.text, transcript.confidence));
                log_if_failed(rec.record_evaluation(*action.evaluation));
            }
        }

        if (action.kind == ActionKind::Question && context.current_question) {
            log_if_failed(rec.add_question(context.current_question_id, *context.current_question,
                                           context.current_topic, context.current_difficulty));
        } else if (action.kind == ActionKind::FollowUp) {
            log_if_failed(rec.add_follow_up(action.text));
        }
    }

    static void log_if_failed(const Result<void>& result) {
        if (!result) {
            LOG_WARN("Session record not updated: " + result.error().message);
        }
    }

    Error ended_error() const {
        return make_invalid_state_error("Session " + lifecycle_.id() + " has ended");
    }

    DialoguePolicy policy_;
    std::mt19937 rng_;
    std::set<std::string> used_ids_;
    json ended_reply_;
    mutable std::mutex mutex_;
};

InterviewSession::InterviewSession(const std::string& id,
                                   const SessionOptions& options,
                                   std::shared_ptr<const QuestionBank> bank,
                                   llm::IReasoningClient& reasoning)
    : pimpl_(std::make_unique<Impl>(id, options, std::move(bank), reasoning)) {}

InterviewSession::~InterviewSession() = default;

const std::string& InterviewSession::id() const {
    return pimpl_->lifecycle_.id();
}

const std::string& InterviewSession::owner() const {
    return pimpl_->options_.owner_connection;
}

const SessionSettings& InterviewSession::settings() const {
    return pimpl_->options_.settings;
}

Result<std::optional<ServedQuestion>> InterviewSession::next_question() {
    return pimpl_->next_question();
}

Result<DialogueAction> InterviewSession::handle_utterance(const Transcript& transcript) {
    return pimpl_->handle_utterance(transcript);
}

bool InterviewSession::should_end() const {
    return pimpl_->should_end();
}

double InterviewSession::remaining_minutes() const {
    return pimpl_->remaining_minutes();
}

json InterviewSession::end() {
    return pimpl_->end();
}

bool InterviewSession::is_ended() const {
    return pimpl_->is_ended();
}

std::string InterviewSession::text_summary() const {
    return pimpl_->text_summary();
}

std::set<std::string> InterviewSession::used_question_ids() const {
    return pimpl_->used_question_ids();
}

int InterviewSession::follow_up_count() const {
    return pimpl_->follow_up_count();
}

int InterviewSession::questions_asked() const {
    return pimpl_->questions_asked();
}

std::optional<std::string> InterviewSession::current_question() const {
    return pimpl_->current_question();
}

} // namespace viva
