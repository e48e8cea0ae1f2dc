#include "answer_evaluator.h"
#include "common.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

using json = nlohmann::json;

namespace viva {

namespace {

const char* EVALUATOR_SYSTEM_PROMPT =
    "You are an expert technical interviewer evaluating candidate responses. "
    "Provide fair, constructive, and detailed feedback on interview answers.\n\n"
    "Evaluation criteria: accuracy, completeness, clarity, depth, and relevant examples.\n\n"
    "Scoring guidelines:\n"
    "- 9-10: Excellent - comprehensive, accurate, clear with good examples\n"
    "- 7-8: Good - mostly accurate and complete with minor gaps\n"
    "- 5-6: Average - basic understanding but missing key details\n"
    "- 3-4: Below average - some understanding but significant gaps\n"
    "- 1-2: Poor - major inaccuracies or very incomplete";

// Strip a ```json ... ``` fence if the reply is wrapped in one, on one line or several
std::string strip_code_fence(const std::string& reply) {
    std::string text = utils::trim_copy(reply);
    if (text.compare(0, 3, "```") != 0) return text;

    size_t closing = text.rfind("```");
    if (closing < 3) return text;
    size_t body = 3;
    size_t first_newline = text.find('\n');
    if (first_newline != std::string::npos && first_newline < closing) {
        body = first_newline + 1;
    } else {
        // single line: skip a language tag such as "json" up to the payload
        while (body < closing && std::isalpha(static_cast<unsigned char>(text[body]))) body++;
    }
    return utils::trim_copy(text.substr(body, closing - body));
}

std::vector<std::string> string_list(const json& j, const char* key) {
    std::vector<std::string> out;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            if (item.is_string()) out.push_back(item.get<std::string>());
        }
    }
    return out;
}

std::string string_field(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return "";
}

// (item, count) pairs, most frequent first; ties keep first-seen order
json most_common(const std::vector<std::string>& items, size_t limit) {
    std::vector<std::pair<std::string, int>> counts;
    for (const auto& item : items) {
        auto it = std::find_if(counts.begin(), counts.end(),
                               [&](const std::pair<std::string, int>& p) { return p.first == item; });
        if (it == counts.end()) {
            counts.emplace_back(item, 1);
        } else {
            it->second++;
        }
    }
    std::stable_sort(counts.begin(), counts.end(),
                     [](const std::pair<std::string, int>& a, const std::pair<std::string, int>& b) {
                         return a.second > b.second;
                     });

    json out = json::array();
    for (size_t i = 0; i < counts.size() && i < limit; ++i) {
        out.push_back(json::array({counts[i].first, counts[i].second}));
    }
    return out;
}

} // namespace

json Evaluation::to_json() const {
    json j;
    j["score"] = score;
    j["feedback"] = feedback;
    j["suggestions"] = suggestions;
    j["follow_up"] = follow_up ? json(*follow_up) : json(nullptr);
    j["strengths"] = strengths;
    j["weaknesses"] = weaknesses;
    return j;
}

class AnswerEvaluator::Impl {
public:
    explicit Impl(llm::IReasoningClient& client) : client_(client) {}

    Result<Evaluation> evaluate(const EvaluationRequest& request) {
        LOG_POLICY("Evaluating answer for question: " + utils::preview(request.question));

        llm::GenerationOptions options;
        options.system_prompt = EVALUATOR_SYSTEM_PROMPT;
        auto reply = client_.complete(build_prompt(request), options);
        if (!reply) {
            LOG_ERROR("Error in answer evaluation: " + reply.error().message);
            return reply.error();
        }

        Evaluation evaluation = parse_reply(reply.value(), request.answer);
        LOG_POLICY("Answer evaluated - Score: " + std::to_string(evaluation.score) + "/10" +
                   (evaluation.from_fallback ? " (fallback)" : ""));
        return evaluation;
    }

private:
    llm::IReasoningClient& client_;
};

AnswerEvaluator::AnswerEvaluator(llm::IReasoningClient& client)
    : pimpl_(std::make_unique<Impl>(client)) {}

AnswerEvaluator::~AnswerEvaluator() = default;

Result<Evaluation> AnswerEvaluator::evaluate(const EvaluationRequest& request) {
    return pimpl_->evaluate(request);
}

std::string AnswerEvaluator::build_prompt(const EvaluationRequest& request) {
    std::ostringstream oss;
    oss << "Please evaluate the following interview answer:\n\n"
        << "Question: " << request.question << "\n\n"
        << "Expected Answer: " << (request.expected_answer.empty() ? "(not provided, judge on merit)"
                                                                    : request.expected_answer) << "\n\n"
        << "Candidate's Answer: " << request.answer << "\n\n"
        << "Question Topic: " << request.topic << "\n"
        << "Question Difficulty: " << request.difficulty << "/5\n\n"
        << "Please provide your evaluation in the following JSON format:\n"
        << "{\n"
        << "  \"score\": <integer from 1-10>,\n"
        << "  \"feedback\": \"<detailed feedback on accuracy and completeness>\",\n"
        << "  \"suggestions\": \"<specific improvement suggestions>\",\n"
        << "  \"follow_up\": \"<optional follow-up question if answer needs clarification, or null>\",\n"
        << "  \"strengths\": [\"<strength1>\", \"<strength2>\"],\n"
        << "  \"weaknesses\": [\"<weakness1>\", \"<weakness2>\"]\n"
        << "}\n\n"
        << "Ensure your response is valid JSON and provide constructive, helpful feedback.";
    return oss.str();
}

Evaluation AnswerEvaluator::parse_reply(const std::string& reply, const std::string& answer) {
    json j;
    try {
        j = json::parse(strip_code_fence(reply));
    } catch (const json::exception& e) {
        LOG_WARN("Failed to parse evaluation as JSON: " + std::string(e.what()));
        return fallback(answer, reply);
    }

    if (!j.is_object() || !j.contains("score") || !j["score"].is_number()) {
        LOG_WARN("Evaluation reply has no numeric score");
        return fallback(answer, reply);
    }
    double raw_score = j["score"].get<double>();
    if (raw_score < MIN_SCORE || raw_score > MAX_SCORE) {
        LOG_WARN("Evaluation score out of range: " + std::to_string(raw_score));
        return fallback(answer, reply);
    }

    Evaluation evaluation;
    evaluation.score = static_cast<int>(raw_score);
    evaluation.feedback = string_field(j, "feedback");
    evaluation.suggestions = string_field(j, "suggestions");
    std::string follow_up = string_field(j, "follow_up");
    if (!utils::is_empty_or_whitespace(follow_up)) {
        evaluation.follow_up = follow_up;
    }
    evaluation.strengths = string_list(j, "strengths");
    evaluation.weaknesses = string_list(j, "weaknesses");
    return evaluation;
}

Evaluation AnswerEvaluator::fallback(const std::string& answer, const std::string& raw_reply) {
    Evaluation evaluation;
    int words = static_cast<int>(utils::word_count(answer));
    evaluation.score = std::min(std::max(words / 5, MIN_SCORE), MAX_SCORE);
    evaluation.feedback = "Evaluation completed. " + utils::truncate(raw_reply, 200) + "...";
    evaluation.suggestions = "Please provide more detailed explanations and examples.";
    evaluation.strengths = {"Provided an answer"};
    evaluation.weaknesses = {"Could be more detailed"};
    evaluation.from_fallback = true;
    return evaluation;
}

std::string performance_level(double average_score) {
    if (average_score >= 8) return "Excellent";
    if (average_score >= 6) return "Good";
    if (average_score >= 4) return "Average";
    return "Needs Improvement";
}

Result<json> summarize_evaluations(const std::vector<Evaluation>& evaluations) {
    if (evaluations.empty()) {
        return make_invalid_state_error("No evaluations provided");
    }

    int total = 0;
    int max_score = MIN_SCORE;
    int min_score = MAX_SCORE;
    std::vector<std::string> strengths;
    std::vector<std::string> weaknesses;
    json distribution = {
        {"excellent (9-10)", 0},
        {"good (7-8)", 0},
        {"average (5-6)", 0},
        {"below_average (3-4)", 0},
        {"poor (1-2)", 0}
    };

    for (const auto& e : evaluations) {
        total += e.score;
        max_score = std::max(max_score, e.score);
        min_score = std::min(min_score, e.score);
        strengths.insert(strengths.end(), e.strengths.begin(), e.strengths.end());
        weaknesses.insert(weaknesses.end(), e.weaknesses.begin(), e.weaknesses.end());

        const char* bucket = e.score >= 9 ? "excellent (9-10)"
                           : e.score >= 7 ? "good (7-8)"
                           : e.score >= 5 ? "average (5-6)"
                           : e.score >= 3 ? "below_average (3-4)"
                                          : "poor (1-2)";
        distribution[bucket] = distribution[bucket].get<int>() + 1;
    }

    double average = static_cast<double>(total) / evaluations.size();

    std::vector<std::string> recommendations;
    if (average < 5) {
        recommendations.push_back("Focus on fundamental concepts and basic understanding");
        recommendations.push_back("Practice explaining technical concepts clearly");
    } else if (average < 7) {
        recommendations.push_back("Work on providing more detailed explanations");
        recommendations.push_back("Include practical examples in your answers");
    } else {
        recommendations.push_back("Continue building on your strong foundation");
        recommendations.push_back("Focus on advanced topics and edge cases");
    }
    for (const auto& entry : most_common(weaknesses, 3)) {
        if (entry[1].get<int>() > 1) {
            recommendations.push_back("Address recurring issue: " + entry[0].get<std::string>());
        }
    }

    json summary;
    summary["total_questions"] = evaluations.size();
    summary["average_score"] = utils::round_to(average, 2);
    summary["max_score"] = max_score;
    summary["min_score"] = min_score;
    summary["performance_level"] = performance_level(average);
    summary["score_distribution"] = distribution;
    summary["common_strengths"] = most_common(strengths, 5);
    summary["common_weaknesses"] = most_common(weaknesses, 5);
    summary["recommendations"] = recommendations;
    return summary;
}

} // namespace viva
