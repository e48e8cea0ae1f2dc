#pragma once

#include "errors.h"
#include "llm/reasoning_client.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace viva {

struct Evaluation {
    int score = 5;                       ///< 1-10
    std::string feedback;
    std::string suggestions;
    std::optional<std::string> follow_up;
    std::vector<std::string> strengths;
    std::vector<std::string> weaknesses;
    bool from_fallback = false;          ///< Synthesized from an unparsable reply

    nlohmann::json to_json() const;
};

/**
 * @brief What the evaluator needs to know about one answer
 */
struct EvaluationRequest {
    std::string question;
    std::string expected_answer;   ///< May be empty for generated questions
    std::string answer;
    std::string topic = "general";
    int difficulty = 3;
};

/**
 * @brief Scores answers through the reasoning collaborator
 *
 * The reply is expected to be a JSON object. When it is not (or the score is missing
 * or out of range) a best-effort evaluation is synthesized from the answer length and
 * the raw reply. Only a failed reasoning call is reported as an error.
 */
class AnswerEvaluator {
public:
    explicit AnswerEvaluator(llm::IReasoningClient& client);
    ~AnswerEvaluator();

    AnswerEvaluator(const AnswerEvaluator&) = delete;
    AnswerEvaluator& operator=(const AnswerEvaluator&) = delete;

    Result<Evaluation> evaluate(const EvaluationRequest& request);

    /**
     * @brief Parse a reasoning reply; fallback evaluation when it is not usable
     */
    static Evaluation parse_reply(const std::string& reply, const std::string& answer);

    /**
     * @brief Fallback evaluation: score = clamp(words / 5, 1, 10)
     */
    static Evaluation fallback(const std::string& answer, const std::string& raw_reply);

    static std::string build_prompt(const EvaluationRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/// "Excellent" (>= 8), "Good" (>= 6), "Average" (>= 4), else "Needs Improvement"
std::string performance_level(double average_score);

/**
 * @brief Aggregate statistics over a set of evaluations
 * @return total_questions, average_score, max_score, min_score, performance_level,
 *         score_distribution, common_strengths, common_weaknesses, recommendations;
 *         InvalidState when evaluations is empty
 */
Result<nlohmann::json> summarize_evaluations(const std::vector<Evaluation>& evaluations);

} // namespace viva
