/**
 * Session lifecycle, interview record, registry and the per-session turn loop.
 * - end() is idempotent and seals the record
 * - sealed records refuse further writes
 * - the registry issues unique ids and answers repeated ends from its cache
 *
 * Run from build dir: ./test_session_lifecycle
 */

#include "fakes.h"
#include "interview_session.h"
#include "logger.h"
#include "session_lifecycle.h"
#include "session_record.h"
#include "session_registry.h"
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <set>

using namespace viva;
using namespace viva::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static const char* BANK = R"({
  "questions": [
    {"id": "a1", "text": "What is a mutex?", "topic": "concurrency", "difficulty": 3,
     "expected_answer": "A lock that gives one thread exclusive access."},
    {"id": "a2", "text": "Explain a condition variable.", "topic": "concurrency", "difficulty": 3,
     "expected_answer": "Lets threads wait until notified that a predicate may hold."},
    {"id": "b1", "text": "What is a B-tree?", "topic": "databases", "difficulty": 4,
     "expected_answer": "A balanced search tree with wide nodes."}
  ]
})";

static Evaluation evaluation_with(int score) {
    Evaluation e;
    e.score = score;
    e.feedback = "ok";
    return e;
}

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- record: writes attach to the latest question ---
    {
        ManualClock clock;
        SessionRecord record("rec-1", clock.fn());
        auto orphan = record.record_answer("too early", 0.5);
        ASSERT(!orphan);
        ASSERT(orphan.error().type == ErrorType::NotFound);
        ASSERT(!record.summary());

        ASSERT(record.add_question("q1", "What is a mutex?", "concurrency", 3));
        clock.advance_seconds(42);
        ASSERT(record.record_answer("A lock.", 0.8));
        ASSERT(record.record_evaluation(evaluation_with(6)));
        ASSERT(record.add_follow_up("What is a deadlock?"));
        ASSERT(record.record_follow_up_answer("Two threads waiting on each other.", 7));
        ASSERT(record.add_question("q2", "What is a B-tree?", "databases", 4));
        ASSERT(record.record_answer("A tree.", 0.9));
        ASSERT(record.record_evaluation(evaluation_with(9)));

        auto entries = record.entries();
        ASSERT(entries.size() == 2);
        ASSERT(entries[0].response_seconds.has_value());
        ASSERT(entries[0].response_seconds && *entries[0].response_seconds == 42.0);
        ASSERT(entries[0].follow_ups.size() == 1);
        ASSERT(entries[0].follow_ups[0].score == std::optional<int>(7));
        ASSERT(record.evaluations().size() == 2);

        clock.advance_minutes(3);
        const nlohmann::json& summary = record.seal();
        ASSERT(record.is_sealed());
        ASSERT(summary["questions_asked"] == 2);
        ASSERT(summary["questions_evaluated"] == 2);
        ASSERT(summary["score_statistics"]["average"] == 7.5);
        ASSERT(summary["score_statistics"]["highest"] == 9);
        ASSERT(summary["performance_level"] == "Good");
        ASSERT(summary["topics_covered"]["concurrency"]["count"] == 1);
        ASSERT(summary["topics_covered"]["databases"]["avg_score"] == 9.0);
        ASSERT(summary["follow_ups_generated"] == 1);
        ASSERT(summary["follow_ups_answered"] == 1);
        ASSERT(summary["session_duration_minutes"] == 3.7);

        // sealed: same summary, no more writes
        ASSERT(&record.seal() == &summary);
        auto late = record.add_question("q3", "Late?", "x", 1);
        ASSERT(!late);
        ASSERT(late.error().type == ErrorType::InvalidState);
        ASSERT(!record.record_evaluation(evaluation_with(1)));
        ASSERT(record.summary());
        ASSERT(record.summary().value() == summary);

        auto j = record.to_json();
        ASSERT(j["session_id"] == "rec-1");
        ASSERT(j["questions_asked"].size() == 2);
        ASSERT(!j["end_time"].is_null());
        ASSERT(record.text_summary().find("Viva Interview - Session Summary") == 0);
    }

    // --- empty record summary ---
    {
        SessionRecord record("rec-2");
        ASSERT(record.seal()["error"] == "No questions were asked in this session");
    }

    // --- lifecycle ---
    {
        ManualClock clock;
        SessionSettings settings;
        settings.topics = {"concurrency", "databases"};
        settings.difficulty = 4;
        settings.duration_minutes = 20;
        settings.max_follow_ups = 2;
        SessionLifecycle lifecycle("life-1", settings, clock.fn());

        ASSERT(lifecycle.context().difficulty == 4);
        ASSERT(lifecycle.context().max_follow_ups == 2);
        ASSERT(lifecycle.context().topics_covered.size() == 2);
        ASSERT(lifecycle.context().clock.duration_minutes() == 20);
        ASSERT(!lifecycle.is_ended());
        ASSERT(!lifecycle.summary());

        clock.advance_minutes(5);
        ASSERT(lifecycle.elapsed_minutes() == 5.0);
        ASSERT(lifecycle.remaining_minutes() == 15.0);

        const nlohmann::json& first = lifecycle.end();
        ASSERT(lifecycle.is_ended());
        ASSERT(lifecycle.context().phase == Phase::Ended);
        ASSERT(lifecycle.record().is_sealed());
        const nlohmann::json& second = lifecycle.end();
        ASSERT(&first == &second);
        ASSERT(lifecycle.summary());
    }

    // --- registry ---
    {
        std::mt19937_64 rng(99);
        std::set<std::string> ids;
        for (int i = 0; i < 200; ++i) {
            std::string id = SessionRegistry::generate_id(rng);
            ASSERT(id.size() == 36);
            ASSERT(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
            ASSERT(id[14] == '4');
            ASSERT(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
            ids.insert(id);
        }
        ASSERT(ids.size() == 200);

        auto bank = QuestionBank::load_from_json(BANK);
        ASSERT(bank);
        ScriptedReasoningClient client;
        SessionRegistry registry(2);

        auto factory_for = [&](const std::string& owner) {
            return [&, owner](const std::string& id) {
                SessionOptions options;
                options.owner_connection = owner;
                return std::make_shared<InterviewSession>(id, options, bank.value(), client);
            };
        };

        auto s1 = registry.create(factory_for("conn-1"));
        auto s2 = registry.create(factory_for("conn-1"));
        auto s3 = registry.create(factory_for("conn-2"));
        ASSERT(s1 && s2 && s3);
        ASSERT(s1->id() != s2->id());
        ASSERT(registry.size() == 3);
        ASSERT(registry.find(s1->id()) == s1);
        ASSERT(registry.find("missing") == nullptr);
        ASSERT(registry.sessions_owned_by("conn-1").size() == 2);
        ASSERT(registry.create([](const std::string&) { return std::shared_ptr<InterviewSession>(); }) == nullptr);
        ASSERT(registry.size() == 3);

        std::string id1 = s1->id();
        registry.retire(id1, s1->end());
        ASSERT(registry.find(id1) == nullptr);
        ASSERT(registry.find_ended(id1).has_value());
        ASSERT((*registry.find_ended(id1))["type"] == "session_ended");

        // bounded cache: oldest ended session is evicted
        registry.retire(s2->id(), s2->end());
        registry.retire(s3->id(), s3->end());
        ASSERT(registry.ended_count() == 2);
        ASSERT(!registry.find_ended(id1).has_value());
        ASSERT(registry.size() == 0);
        ASSERT(!registry.remove("missing"));
    }

    // --- interview session: bank questions, recorded turns, idempotent end ---
    {
        auto bank = QuestionBank::load_from_json(BANK);
        ASSERT(bank);
        ManualClock clock;
        ScriptedReasoningClient client;

        std::string log_dir = "test_session_logs";
        SessionOptions options;
        options.settings.topics = {"concurrency"};
        options.settings.difficulty = 3;
        options.settings.duration_minutes = 10;
        options.settings.max_follow_ups = 1;
        options.log_dir = log_dir;
        options.now = clock.fn();
        options.seed = 1234;
        InterviewSession session("sess-1", options, bank.value(), client);

        auto first = session.next_question();
        ASSERT(first);
        ASSERT(first.value().has_value());
        const Question* q1 = first.value()->question;
        ASSERT(q1 != nullptr && q1->topic == "concurrency");
        ASSERT(first.value()->number == 1);
        ASSERT(first.value()->remaining_seconds == 600.0);
        ASSERT(session.current_question() == std::optional<std::string>(q1->text));

        client.reply("answering_question");
        client.reply(R"({"score": 7, "feedback": "Good.", "strengths": ["clear"], "weaknesses": []})");
        client.reply("follow_up");
        client.reply("What happens if a thread forgets to unlock?");
        Transcript answer;
        answer.text = "It makes sure only one thread runs the critical section.";
        answer.confidence = 0.85f;
        auto turn = session.handle_utterance(answer);
        ASSERT(turn);
        ASSERT(turn.value().kind == ActionKind::FollowUp);
        ASSERT(session.follow_up_count() == 1);

        client.reply("answering_question");
        client.reply(R"({"score": 5, "feedback": "Partly."})");
        Transcript follow_answer;
        follow_answer.text = "Other threads block forever.";
        auto second_turn = session.handle_utterance(follow_answer);
        ASSERT(second_turn);
        ASSERT(second_turn.value().kind == ActionKind::Question);  // decision and text fell back
        ASSERT(session.follow_up_count() == 0);

        auto second = session.next_question();
        ASSERT(second);
        ASSERT(second.value().has_value());
        ASSERT(second.value()->question->id != q1->id);
        ASSERT(session.used_question_ids().size() == 2);

        auto exhausted = session.next_question();
        ASSERT(!exhausted);
        ASSERT(exhausted.error().type == ErrorType::NotFound);
        ASSERT(exhausted.error().message == "No more questions available");

        clock.advance_minutes(4);
        nlohmann::json ended = session.end();
        ASSERT(session.is_ended());
        ASSERT(ended["type"] == "session_ended");
        ASSERT(ended["session_id"] == "sess-1");
        ASSERT(ended["total_questions"] == 2);
        ASSERT(ended["evaluations"][0]["question_text"] == q1->text);
        ASSERT(ended["conversation_history"].size() == 2);
        ASSERT(ended["summary"]["questions_asked"] == 3);
        ASSERT(ended["summary"]["follow_ups_answered"] == 1);
        ASSERT(ended["summary"]["user_preferences"]["difficulty"] == 3);
        ASSERT(session.end() == ended);

        auto after = session.handle_utterance(answer);
        ASSERT(!after);
        ASSERT(after.error().type == ErrorType::InvalidState);
        ASSERT(!session.next_question());

        std::string saved = log_dir + "/session_sess-1.json";
        ASSERT(std::filesystem::exists(saved));
        std::error_code ec;
        std::filesystem::remove_all(log_dir, ec);
        ASSERT(session.text_summary().find("Session ID: sess-1") != std::string::npos);
    }

    // --- time budget ---
    {
        auto bank = QuestionBank::load_from_json(BANK);
        ASSERT(bank);
        ManualClock clock;
        ScriptedReasoningClient client;
        SessionOptions options;
        options.settings.duration_minutes = 5;
        options.now = clock.fn();
        InterviewSession session("sess-2", options, bank.value(), client);

        clock.advance_minutes(3.5);
        ASSERT(!session.should_end());
        clock.advance_minutes(0.5);
        ASSERT(session.should_end());

        Transcript late;
        late.text = "Still answering...";
        auto action = session.handle_utterance(late);
        ASSERT(action);
        ASSERT(action.value().kind == ActionKind::InterviewComplete);
        ASSERT(client.calls() == 0);

        clock.advance_minutes(1);
        auto none = session.next_question();
        ASSERT(none);
        ASSERT(!none.value().has_value());
    }

    Logger::shutdown();
    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All session lifecycle tests passed.\n";
    return 0;
}
