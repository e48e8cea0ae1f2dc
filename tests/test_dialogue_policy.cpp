/**
 * Dialogue state machine driven by a scripted reasoning client.
 * Each answering turn costs: intent, evaluation, follow-up decision, question text.
 *
 * Run from build dir: ./test_dialogue_policy
 */

#include "dialogue_policy.h"
#include "fakes.h"
#include "logger.h"
#include <iostream>

using namespace viva;
using namespace viva::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static ConversationContext make_context(const ManualClock& clock, std::vector<std::string> topics,
                                        int max_follow_ups = DEFAULT_MAX_FOLLOW_UPS) {
    ConversationContext context(SessionClock(30, clock.fn()));
    for (const auto& topic : topics) context.topics_covered[topic] = 0;
    context.max_follow_ups = max_follow_ups;
    return context;
}

static const char* GOOD_EVALUATION =
    R"({"score": 9, "feedback": "Strong answer.", "suggestions": "", "strengths": ["depth"], "weaknesses": []})";

int main() {
    Logger::initialize(LogLevel::ERROR);

    InterviewConfig config;
    ManualClock clock;

    // --- opening question, then a follow-up on a strong answer ---
    {
        ScriptedReasoningClient client;
        DialoguePolicy policy(client, nullptr, config);
        ConversationContext context = make_context(clock, {"databases", "algorithms"});

        client.reply("answering_question");
        client.reply("\"What is Big-O notation?\"");
        DialogueAction opening = policy.handle("Hi, I'm ready to start.", context);
        ASSERT(opening.kind == ActionKind::Question);
        ASSERT(opening.text == "What is Big-O notation?");
        ASSERT(opening.topic == "algorithms");
        ASSERT(opening.speak);
        ASSERT(!opening.evaluation);
        ASSERT(context.current_question == std::optional<std::string>("What is Big-O notation?"));
        ASSERT(context.current_question_id == "conv-1");
        ASSERT(context.questions_asked == 1);
        ASSERT(context.topics_covered["algorithms"] == 1);
        ASSERT(context.phase == Phase::AwaitingAnswer);
        ASSERT(context.history.size() == 1);
        ASSERT(context.history[0].question.empty());
        ASSERT(client.calls() == 2);
        ASSERT(contains(client.prompt(1), "difficulty 3/5"));

        client.reply("answering_question");
        client.reply(GOOD_EVALUATION);
        client.reply("follow_up");
        client.reply("How would you compare O(n log n) and O(n^2) in practice?");
        DialogueAction follow = policy.handle("It describes how running time grows with input size.", context);
        ASSERT(follow.kind == ActionKind::FollowUp);
        ASSERT(follow.text == "How would you compare O(n log n) and O(n^2) in practice?");
        ASSERT(follow.evaluation.has_value());
        ASSERT(follow.evaluation->score == 9);
        ASSERT(context.follow_up_count == 1);
        ASSERT(context.pending_follow_up == std::optional<std::string>(follow.text));
        ASSERT(context.current_question == std::optional<std::string>("What is Big-O notation?"));
        ASSERT(context.phase == Phase::AwaitingAnswer);
        ASSERT(context.history.size() == 2);
        ASSERT(context.history[1].question == "What is Big-O notation?");
        ASSERT(context.history[1].intent == Intent::AnsweringQuestion);
        ASSERT(client.calls() == 6);
        ASSERT(contains(client.prompt(3), "Question: What is Big-O notation?"));
        ASSERT(contains(client.prompt(4), "Score: 9/10"));
        ASSERT(client.options(4).temperature == 0.0f);

        // the answer to the follow-up is judged against the follow-up
        client.reply("answering_question");
        client.reply(GOOD_EVALUATION);
        client.reply("new_question");
        client.reply("How does an index speed up a database query?");
        DialogueAction next = policy.handle("n log n wins for large inputs.", context);
        ASSERT(next.kind == ActionKind::Question);
        ASSERT(next.topic == "databases");
        ASSERT(contains(client.prompt(7), "Question: How would you compare"));
        ASSERT(contains(client.prompt(7), "not provided"));
        ASSERT(context.history[2].question == "How would you compare O(n log n) and O(n^2) in practice?");
        ASSERT(context.follow_up_count == 0);
        ASSERT(!context.pending_follow_up);
        ASSERT(context.questions_asked == 2);
        ASSERT(context.current_question_id == "conv-2");
    }

    // --- follow-up budget forces a new question ---
    {
        ScriptedReasoningClient client;
        DialoguePolicy policy(client, nullptr, config);
        ConversationContext context = make_context(clock, {"networking"}, 1);
        context.begin_question("q012", "What happens during a TCP handshake?", "networking", 3,
                               "SYN, SYN-ACK, ACK");

        client.reply("answering_question");
        client.reply(GOOD_EVALUATION);
        client.reply("follow_up");
        client.reply("Why three steps rather than two?");
        ASSERT(policy.handle("Client sends SYN, server SYN-ACK, client ACK.", context).kind == ActionKind::FollowUp);
        ASSERT(contains(client.prompt(1), "Expected Answer: SYN, SYN-ACK, ACK"));
        ASSERT(context.follow_up_count == 1);

        client.reply("answering_question");
        client.reply(GOOD_EVALUATION);
        client.reply("follow_up");
        client.reply("What is the difference between TCP and UDP?");
        DialogueAction action = policy.handle("Both sides must confirm their sequence numbers.", context);
        ASSERT(action.kind == ActionKind::Question);
        ASSERT(action.text == "What is the difference between TCP and UDP?");
        ASSERT(context.follow_up_count == 0);
        ASSERT(!context.pending_follow_up);
        ASSERT(client.pending() == 0);
    }

    // --- every reasoning call failing still yields an utterance ---
    {
        ScriptedReasoningClient client;
        DialoguePolicy policy(client, nullptr, config);
        ConversationContext context = make_context(clock, {});

        DialogueAction opening = policy.handle("hello", context);
        ASSERT(opening.kind == ActionKind::Question);
        ASSERT(contains(opening.text, "Let's start with a fundamental question"));
        ASSERT(opening.topic == "general");
        ASSERT(context.has_question());

        DialogueAction next = policy.handle("I mostly write C++ and Python.", context);
        ASSERT(next.kind == ActionKind::Question);
        ASSERT(next.text == "Let's move on to another topic. Can you explain a challenging problem you've solved recently?");
        ASSERT(next.evaluation.has_value());
        ASSERT(next.evaluation->score == 5);
        ASSERT(next.evaluation->feedback == "Answer received");
        ASSERT(context.history.size() == 2);
    }

    // --- non-answer intents ---
    {
        ScriptedReasoningClient client;
        DialoguePolicy policy(client, nullptr, config);
        ConversationContext context = make_context(clock, {"algorithms"});
        context.begin_question("q003", "What is binary search?", "algorithms", 2, "Halving a sorted range.");

        client.reply("asking_question");
        client.reply("Good question. You may assume the input is sorted. Please continue.");
        DialogueAction guidance = policy.handle("Can I assume the array is sorted?", context);
        ASSERT(guidance.kind == ActionKind::Guidance);
        ASSERT(guidance.intent == Intent::AskingQuestion);
        ASSERT(!guidance.evaluation);
        ASSERT(context.questions_asked == 1);

        client.reply("seeking_clarification");
        client.fail();
        DialogueAction clarification = policy.handle("Sorry, what do you mean?", context);
        ASSERT(clarification.kind == ActionKind::Clarification);
        ASSERT(clarification.text ==
               "Let me rephrase that question: What is binary search?. Take your time to think about it.");

        client.reply("confused_or_stuck");
        client.reply("Think about what happens when you look at the middle element.");
        DialogueAction hint = policy.handle("I'm not sure where to begin.", context);
        ASSERT(hint.kind == ActionKind::Guidance);
        ASSERT(hint.intent == Intent::ConfusedOrStuck);
        ASSERT(hint.text == "Think about what happens when you look at the middle element.");

        ASSERT(context.history.size() == 3);
        ASSERT(context.follow_up_count == 0);
        ASSERT(context.phase == Phase::AwaitingAnswer);
    }

    // --- empty transcript asks again without touching the history ---
    {
        ScriptedReasoningClient client;
        DialoguePolicy policy(client, nullptr, config);
        ConversationContext context = make_context(clock, {});
        DialogueAction action = policy.handle("   ", context);
        ASSERT(action.kind == ActionKind::Clarification);
        ASSERT(action.text == "I didn't catch that. Could you say it again?");
        ASSERT(context.history.empty());
        ASSERT(client.calls() == 0);
    }

    // --- end of interview at the one-minute buffer ---
    {
        ManualClock session_clock;
        ScriptedReasoningClient client;
        DialoguePolicy policy(client, nullptr, config);
        ConversationContext context = make_context(session_clock, {"algorithms"});

        session_clock.advance_minutes(28.5);
        ASSERT(!policy.should_end_interview(context));

        session_clock.advance_minutes(0.5);
        ASSERT(context.remaining_minutes() == 1.0);
        ASSERT(policy.should_end_interview(context));

        DialogueAction done = policy.handle("One more thing...", context);
        ASSERT(done.kind == ActionKind::InterviewComplete);
        ASSERT(client.calls() == 0);
        ASSERT(context.history.empty());

        session_clock.advance_minutes(10);
        ASSERT(context.remaining_minutes() == 0.0);
    }

    // --- helpers ---
    {
        ASSERT(DialoguePolicy::parse_follow_up_decision("follow_up"));
        ASSERT(DialoguePolicy::parse_follow_up_decision("FOLLOW UP please"));
        ASSERT(!DialoguePolicy::parse_follow_up_decision("new_question"));
        ASSERT(!DialoguePolicy::parse_follow_up_decision(""));

        ConversationContext context;
        ASSERT(DialoguePolicy::least_covered_topic(context) == "general");
        context.topics_covered = {{"c", 1}, {"a", 2}, {"b", 1}};
        ASSERT(DialoguePolicy::least_covered_topic(context) == "b");

        ASSERT(std::string(action_kind_name(ActionKind::FollowUp)) == "follow_up");
        ASSERT(std::string(action_kind_name(ActionKind::InterviewComplete)) == "interview_complete");

        Question q;
        q.id = "q007";
        q.text = "What is a stack?";
        q.topic = "data_structures";
        q.difficulty = 1;
        q.expected_answer = "A LIFO collection.";
        ScriptedReasoningClient client;
        DialoguePolicy policy(client, nullptr, config);
        context.follow_up_count = 2;
        policy.set_current_question(context, q);
        ASSERT(context.current_question_id == "q007");
        ASSERT(context.current_expected_answer == "A LIFO collection.");
        ASSERT(context.follow_up_count == 0);
        ASSERT(context.topics_covered["data_structures"] == 1);
    }

    Logger::shutdown();
    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All dialogue policy tests passed.\n";
    return 0;
}
