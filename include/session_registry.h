#pragma once

#include "interview_session.h"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace viva {

/**
 * @brief Process-wide table of sessions (thread-safe)
 *
 * Active sessions are shared_ptr so a caller can keep working on one after another
 * thread retires it. Ended sessions leave behind their final reply in a bounded cache
 * (oldest evicted first) so a repeated end is answered identically.
 */
class SessionRegistry {
public:
    using Factory = std::function<std::shared_ptr<InterviewSession>(const std::string& id)>;

    explicit SessionRegistry(size_t retained_ended = 64);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Draw a fresh id, build the session and insert it atomically
     * @return nullptr if the factory returned nullptr
     */
    std::shared_ptr<InterviewSession> create(const Factory& factory);

    std::shared_ptr<InterviewSession> find(const std::string& id) const;

    /// Remove from the active table and cache its final reply
    void retire(const std::string& id, const nlohmann::json& final_reply);

    std::optional<nlohmann::json> find_ended(const std::string& id) const;

    /// Drop an active session without caching anything
    bool remove(const std::string& id);

    std::vector<std::string> sessions_owned_by(const std::string& connection_id) const;

    size_t size() const;
    size_t ended_count() const;

    /// Random RFC 4122 version 4 UUID string
    static std::string generate_id(std::mt19937_64& rng);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
