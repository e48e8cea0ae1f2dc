/**
 * Answer evaluation: well-formed replies, code-fenced replies, fallback scoring on
 * unusable replies, reasoning failures, and summary statistics.
 *
 * Run from build dir: ./test_answer_evaluator
 */

#include "answer_evaluator.h"
#include "fakes.h"
#include "llm_client.h"
#include "logger.h"
#include <iostream>
#include <nlohmann/json.hpp>

using namespace viva;
using namespace viva::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static Evaluation scored(int score, std::vector<std::string> strengths, std::vector<std::string> weaknesses) {
    Evaluation e;
    e.score = score;
    e.strengths = std::move(strengths);
    e.weaknesses = std::move(weaknesses);
    return e;
}

int main() {
    Logger::initialize(LogLevel::ERROR);

    EvaluationRequest request;
    request.question = "What is a hash table?";
    request.expected_answer = "An array of buckets indexed by a hash of the key.";
    request.answer = "It hashes keys into buckets so lookups are constant time on average.";
    request.topic = "data_structures";
    request.difficulty = 2;

    // --- well-formed reply ---
    {
        ScriptedReasoningClient client;
        client.reply(R"({"score": 8, "feedback": "Accurate.", "suggestions": "Mention collisions.",
                         "follow_up": "How are collisions handled?",
                         "strengths": ["correct idea"], "weaknesses": ["no collision handling"]})");
        AnswerEvaluator evaluator(client);
        auto result = evaluator.evaluate(request);
        ASSERT(result);
        const Evaluation& e = result.value();
        ASSERT(e.score == 8);
        ASSERT(e.feedback == "Accurate.");
        ASSERT(e.follow_up.has_value() && *e.follow_up == "How are collisions handled?");
        ASSERT(e.strengths.size() == 1);
        ASSERT(!e.from_fallback);

        ASSERT(client.calls() == 1);
        ASSERT(client.prompt(0).find("What is a hash table?") != std::string::npos);
        ASSERT(client.prompt(0).find("Expected Answer: An array of buckets") != std::string::npos);
        ASSERT(client.prompt(0).find("Question Difficulty: 2/5") != std::string::npos);
        ASSERT(!client.options(0).system_prompt.empty());

        auto j = e.to_json();
        ASSERT(j["score"] == 8);
        ASSERT(j["follow_up"] == "How are collisions handled?");
    }

    // --- fenced JSON and null follow-up ---
    {
        Evaluation e = AnswerEvaluator::parse_reply(
            "```json\n{\"score\": 6, \"feedback\": \"Partial.\", \"follow_up\": null}\n```", "x");
        ASSERT(e.score == 6);
        ASSERT(!e.follow_up.has_value());
        ASSERT(!e.from_fallback);
        ASSERT(e.to_json()["follow_up"].is_null());
    }

    // --- multi-line fenced reply through the HTTP client keeps its line breaks ---
    {
        LLMConfig llm_config;
        llm_config.endpoint = "http://localhost:8080/v1/chat/completions";
        LLMClient client(llm_config);
        nlohmann::json choice;
        choice["message"]["content"] = "```json\n{\n  \"score\": 8,\n  \"feedback\": \"good\"\n}\n```\n";
        nlohmann::json body;
        body["choices"] = nlohmann::json::array({choice});
        auto content = client.parse_response(body.dump());
        ASSERT(content);
        if (content) {
            ASSERT(content.value().find('\n') != std::string::npos);
            Evaluation e = AnswerEvaluator::parse_reply(content.value(), "x");
            ASSERT(!e.from_fallback);
            ASSERT(e.score == 8);
            ASSERT(e.feedback == "good");
        }
    }

    // --- fence on a single line ---
    {
        Evaluation e = AnswerEvaluator::parse_reply("```json {\"score\": 7, \"feedback\": \"fine\"} ```", "x");
        ASSERT(!e.from_fallback);
        ASSERT(e.score == 7);
        Evaluation bare = AnswerEvaluator::parse_reply("``` {\"score\": 4} ```", "x");
        ASSERT(!bare.from_fallback);
        ASSERT(bare.score == 4);
    }

    // --- malformed JSON falls back to a length-based score ---
    {
        ScriptedReasoningClient client;
        client.reply("The candidate did well, I'd say about 7 out of 10.");
        AnswerEvaluator evaluator(client);
        auto result = evaluator.evaluate(request);
        ASSERT(result);
        const Evaluation& e = result.value();
        ASSERT(e.from_fallback);
        ASSERT(e.score == 2);  // 12 words / 5
        ASSERT(e.feedback.find("Evaluation completed.") == 0);
        ASSERT(e.suggestions == "Please provide more detailed explanations and examples.");
        ASSERT(e.strengths == std::vector<std::string>{"Provided an answer"});
    }

    // --- fallback score bounds ---
    {
        ASSERT(AnswerEvaluator::fallback("", "r").score == 1);
        ASSERT(AnswerEvaluator::fallback("one two three", "r").score == 1);
        std::string long_answer;
        for (int i = 0; i < 80; ++i) long_answer += "word ";
        ASSERT(AnswerEvaluator::fallback(long_answer, "r").score == 10);
    }

    // --- missing or out-of-range scores fall back ---
    {
        ASSERT(AnswerEvaluator::parse_reply(R"({"feedback": "ok"})", "a b c").from_fallback);
        ASSERT(AnswerEvaluator::parse_reply(R"({"score": "high"})", "a b c").from_fallback);
        ASSERT(AnswerEvaluator::parse_reply(R"({"score": 0})", "a b c").from_fallback);
        ASSERT(AnswerEvaluator::parse_reply(R"({"score": 11})", "a b c").from_fallback);
        ASSERT(AnswerEvaluator::parse_reply("[8]", "a b c").from_fallback);
        ASSERT(!AnswerEvaluator::parse_reply(R"({"score": 10})", "a b c").from_fallback);
        ASSERT(!AnswerEvaluator::parse_reply(R"({"score": 1})", "a b c").from_fallback);
    }

    // --- reasoning failure is reported, not hidden ---
    {
        ScriptedReasoningClient client;
        client.fail("timed out");
        AnswerEvaluator evaluator(client);
        auto result = evaluator.evaluate(request);
        ASSERT(!result);
        ASSERT(result.error().type == ErrorType::NetworkError);
    }

    // --- prompt for a generated question ---
    {
        EvaluationRequest generated = request;
        generated.expected_answer.clear();
        ASSERT(AnswerEvaluator::build_prompt(generated).find("not provided") != std::string::npos);
    }

    // --- performance levels ---
    ASSERT(performance_level(8.0) == "Excellent");
    ASSERT(performance_level(7.99) == "Good");
    ASSERT(performance_level(6.0) == "Good");
    ASSERT(performance_level(4.0) == "Average");
    ASSERT(performance_level(3.9) == "Needs Improvement");

    // --- summary statistics ---
    {
        ASSERT(!summarize_evaluations({}));

        std::vector<Evaluation> evaluations = {
            scored(9, {"clear"}, {"too brief"}),
            scored(6, {"clear"}, {"too brief"}),
            scored(3, {}, {"wrong complexity"}),
        };
        auto summary = summarize_evaluations(evaluations);
        ASSERT(summary);
        const auto& s = summary.value();
        ASSERT(s["total_questions"] == 3);
        ASSERT(s["average_score"] == 6.0);
        ASSERT(s["max_score"] == 9);
        ASSERT(s["min_score"] == 3);
        ASSERT(s["performance_level"] == "Good");
        ASSERT(s["score_distribution"]["excellent (9-10)"] == 1);
        ASSERT(s["score_distribution"]["average (5-6)"] == 1);
        ASSERT(s["score_distribution"]["below_average (3-4)"] == 1);
        ASSERT(s["common_weaknesses"][0][0] == "too brief");
        ASSERT(s["common_weaknesses"][0][1] == 2);
        ASSERT(s["common_strengths"][0][0] == "clear");

        bool recurring = false;
        for (const auto& r : s["recommendations"]) {
            if (r.get<std::string>() == "Address recurring issue: too brief") recurring = true;
        }
        ASSERT(recurring);
    }

    Logger::shutdown();
    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All answer evaluator tests passed.\n";
    return 0;
}
