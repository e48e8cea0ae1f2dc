#pragma once

#include "errors.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace viva {

struct Question {
    std::string id;
    std::string text;
    std::string topic;
    int difficulty = 3;
    std::string expected_answer;
    std::vector<std::string> follow_up_questions;
};

/**
 * @brief Selection criteria; empty topics / unset difficulty match everything
 */
struct QuestionFilter {
    std::vector<std::string> topics;
    std::optional<int> difficulty;
};

/**
 * @brief Validated, read-only question bank
 *
 * Loaded once and shared by all sessions. Every accessor is const, so concurrent reads
 * need no locking. Which questions a session has already served is tracked by the
 * session and passed in as excluded ids.
 */
class QuestionBank {
public:
    QuestionBank();
    ~QuestionBank();

    QuestionBank(const QuestionBank&) = delete;
    QuestionBank& operator=(const QuestionBank&) = delete;
    QuestionBank(QuestionBank&&) noexcept;
    QuestionBank& operator=(QuestionBank&&) noexcept;

    /**
     * @brief Load and validate a bank file
     * @return IOError if unreadable, ParseError on malformed JSON, ValidationError on
     *         missing fields, duplicate ids, empty text/answer or difficulty outside 1-5
     */
    static Result<std::shared_ptr<const QuestionBank>> load_from_file(const std::string& path);

    /**
     * @brief Load and validate from an in-memory JSON document (same rules as load_from_file)
     */
    static Result<std::shared_ptr<const QuestionBank>> load_from_json(const std::string& text);

    /// Unique topics, sorted
    std::vector<std::string> topics() const;

    /// (min, max) difficulty present; (1, 5) when empty
    std::pair<int, int> difficulty_range() const;

    std::vector<const Question*> filter(const QuestionFilter& criteria,
                                        const std::set<std::string>& excluded_ids = {}) const;

    /**
     * @brief Pick one matching question not in excluded_ids
     * @param rng Random choice when given, first match otherwise
     */
    const Question* select(const QuestionFilter& criteria,
                           const std::set<std::string>& excluded_ids,
                           std::mt19937* rng = nullptr) const;

    const Question* find(const std::string& id) const;

    size_t size() const;

    /// First n questions as a JSON array (text, topic, difficulty) for prompt examples
    nlohmann::json examples(size_t n) const;

    /**
     * @brief Coverage statistics for one session's served ids
     */
    nlohmann::json usage_stats(const std::set<std::string>& used_ids) const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
