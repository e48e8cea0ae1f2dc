#include "session_registry.h"
#include "logger.h"
#include <cstdio>
#include <deque>
#include <map>
#include <mutex>

using json = nlohmann::json;

namespace viva {

class SessionRegistry::Impl {
public:
    explicit Impl(size_t retained_ended)
        : retained_ended_(retained_ended)
        , rng_(std::random_device{}()) {}

    std::shared_ptr<InterviewSession> create(const Factory& factory) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string id;
        do {
            id = generate_id(rng_);
        } while (active_.count(id) || ended_.count(id));

        auto session = factory(id);
        if (!session) {
            return nullptr;
        }
        active_[id] = session;
        LOG_SERVER("Registered session " + id + " (" + std::to_string(active_.size()) + " active)");
        return session;
    }

    std::shared_ptr<InterviewSession> find(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(id);
        return it == active_.end() ? nullptr : it->second;
    }

    void retire(const std::string& id, const json& final_reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(id);
        if (retained_ended_ == 0) return;

        if (!ended_.count(id)) {
            ended_order_.push_back(id);
        }
        ended_[id] = final_reply;
        while (ended_order_.size() > retained_ended_) {
            ended_.erase(ended_order_.front());
            ended_order_.pop_front();
        }
    }

    std::optional<json> find_ended(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = ended_.find(id);
        if (it == ended_.end()) return std::nullopt;
        return it->second;
    }

    bool remove(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_.erase(id) > 0;
    }

    std::vector<std::string> sessions_owned_by(const std::string& connection_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        for (const auto& entry : active_) {
            if (entry.second->owner() == connection_id) {
                ids.push_back(entry.first);
            }
        }
        return ids;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_.size();
    }

    size_t ended_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ended_.size();
    }

private:
    size_t retained_ended_;
    std::mt19937_64 rng_;
    std::map<std::string, std::shared_ptr<InterviewSession>> active_;
    std::map<std::string, json> ended_;
    std::deque<std::string> ended_order_;
    mutable std::mutex mutex_;
};

SessionRegistry::SessionRegistry(size_t retained_ended)
    : pimpl_(std::make_unique<Impl>(retained_ended)) {}

SessionRegistry::~SessionRegistry() = default;

std::shared_ptr<InterviewSession> SessionRegistry::create(const Factory& factory) {
    return pimpl_->create(factory);
}

std::shared_ptr<InterviewSession> SessionRegistry::find(const std::string& id) const {
    return pimpl_->find(id);
}

void SessionRegistry::retire(const std::string& id, const json& final_reply) {
    pimpl_->retire(id, final_reply);
}

std::optional<json> SessionRegistry::find_ended(const std::string& id) const {
    return pimpl_->find_ended(id);
}

bool SessionRegistry::remove(const std::string& id) {
    return pimpl_->remove(id);
}

std::vector<std::string> SessionRegistry::sessions_owned_by(const std::string& connection_id) const {
    return pimpl_->sessions_owned_by(connection_id);
}

size_t SessionRegistry::size() const {
    return pimpl_->size();
}

size_t SessionRegistry::ended_count() const {
    return pimpl_->ended_count();
}

std::string SessionRegistry::generate_id(std::mt19937_64& rng) {
    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;   // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;   // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

} // namespace viva
