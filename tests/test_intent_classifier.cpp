/**
 * Intent classification from free-text reasoning replies.
 *
 * Run from build dir: ./test_intent_classifier
 */

#include "fakes.h"
#include "intent_classifier.h"
#include "logger.h"
#include <iostream>

using namespace viva;
using namespace viva::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- reply parsing ---
    ASSERT(IntentClassifier::parse_reply("answering_question") == Intent::AnsweringQuestion);
    ASSERT(IntentClassifier::parse_reply("asking_question") == Intent::AskingQuestion);
    ASSERT(IntentClassifier::parse_reply("\"seeking_clarification\"") == Intent::SeekingClarification);
    ASSERT(IntentClassifier::parse_reply("confused_or_stuck") == Intent::ConfusedOrStuck);
    ASSERT(IntentClassifier::parse_reply("  CONFUSED_OR_STUCK\n") == Intent::ConfusedOrStuck);
    ASSERT(IntentClassifier::parse_reply("They seem stuck.") == Intent::ConfusedOrStuck);
    ASSERT(IntentClassifier::parse_reply("asking for clarification") == Intent::AskingQuestion);
    ASSERT(IntentClassifier::parse_reply("no idea") == Intent::AnsweringQuestion);
    ASSERT(IntentClassifier::parse_reply("") == Intent::AnsweringQuestion);

    ASSERT(std::string(intent_name(Intent::AnsweringQuestion)) == "answering_question");
    ASSERT(std::string(intent_name(Intent::ConfusedOrStuck)) == "confused_or_stuck");

    ConversationContext context;
    context.begin_question("q1", "What is a deadlock?", "concurrency", 3);

    // --- one deterministic reasoning call per turn ---
    {
        ScriptedReasoningClient client;
        client.reply("seeking_clarification");
        IntentClassifier classifier(client);
        ASSERT(classifier.classify("Could you repeat that?", context) == Intent::SeekingClarification);
        ASSERT(client.calls() == 1);
        ASSERT(client.options(0).temperature == 0.0f);
        ASSERT(client.prompt(0).find("What is a deadlock?") != std::string::npos);
        ASSERT(client.prompt(0).find("Could you repeat that?") != std::string::npos);
        ASSERT(client.prompt(0).find("Awaiting answer: true") != std::string::npos);
    }

    // --- failures default to answering ---
    {
        ScriptedReasoningClient client;
        client.fail();
        IntentClassifier classifier(client);
        ASSERT(classifier.classify("I think it is a cycle of waits", context) == Intent::AnsweringQuestion);
    }

    // --- prompt without a question ---
    {
        ConversationContext fresh;
        std::string prompt = IntentClassifier::build_prompt("hello", fresh);
        ASSERT(prompt.find("Current question: \"None\"") != std::string::npos);
        ASSERT(prompt.find("Awaiting answer: false") != std::string::npos);
    }

    Logger::shutdown();
    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All intent classifier tests passed.\n";
    return 0;
}
