#include "session_lifecycle.h"
#include "logger.h"
#include <sstream>

using json = nlohmann::json;

namespace viva {

class SessionLifecycle::Impl {
public:
    Impl(const std::string& id, const SessionSettings& settings, SessionClock::NowFn now)
        : id_(id)
        , settings_(settings)
        , context_(SessionClock(settings.duration_minutes, now))
        , record_(id, now)
    {
        context_.difficulty = settings.difficulty;
        context_.max_follow_ups = settings.max_follow_ups;
        for (const auto& topic : settings.topics) {
            context_.topics_covered.emplace(topic, 0);
        }

        UserPreferences preferences;
        preferences.topics = settings.topics;
        preferences.difficulty = settings.difficulty;
        preferences.interview_duration = settings.duration_minutes;
        auto stored = record_.set_preferences(preferences);
        if (!stored) {
            LOG_WARN("Could not store preferences: " + stored.error().message);
        }

        std::ostringstream oss;
        oss << "Session " << id_ << " started: " << settings.topics.size() << " topics, difficulty "
            << settings.difficulty << ", " << settings.duration_minutes << " min";
        LOG_SESSION(oss.str());
    }

    const json& end() {
        if (ended_) {
            LOG_SESSION("Session " + id_ + " already ended");
            return summary_;
        }
        context_.phase = Phase::Ended;
        summary_ = record_.seal(context_.history_json());
        ended_ = true;
        LOG_SESSION("Session " + id_ + " ended after " +
                    std::to_string(context_.clock.elapsed_minutes()) + " min");
        return summary_;
    }

    std::string id_;
    SessionSettings settings_;
    ConversationContext context_;
    SessionRecord record_;
    json summary_;
    bool ended_ = false;
};

SessionLifecycle::SessionLifecycle(const std::string& id, const SessionSettings& settings,
                                   SessionClock::NowFn now)
    : pimpl_(std::make_unique<Impl>(id, settings, std::move(now))) {}

SessionLifecycle::~SessionLifecycle() = default;

const std::string& SessionLifecycle::id() const {
    return pimpl_->id_;
}

const SessionSettings& SessionLifecycle::settings() const {
    return pimpl_->settings_;
}

ConversationContext& SessionLifecycle::context() {
    return pimpl_->context_;
}

const ConversationContext& SessionLifecycle::context() const {
    return pimpl_->context_;
}

SessionRecord& SessionLifecycle::record() {
    return pimpl_->record_;
}

const SessionRecord& SessionLifecycle::record() const {
    return pimpl_->record_;
}

double SessionLifecycle::elapsed_minutes() const {
    return pimpl_->context_.clock.elapsed_minutes();
}

double SessionLifecycle::remaining_minutes() const {
    return pimpl_->context_.clock.remaining_minutes();
}

bool SessionLifecycle::is_ended() const {
    return pimpl_->ended_;
}

const json& SessionLifecycle::end() {
    return pimpl_->end();
}

Result<json> SessionLifecycle::summary() const {
    if (!pimpl_->ended_) {
        return make_invalid_state_error("Session " + pimpl_->id_ + " is still running");
    }
    return pimpl_->summary_;
}

} // namespace viva
