/**
 * Configuration loading: partial files, wrong types, out-of-range values,
 * malformed files, save/load, and the fixed end-of-interview buffer.
 *
 * Run from build dir: ./test_config
 */

#include "config.h"
#include "dialogue_policy.h"
#include "fakes.h"
#include "logger.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>

using namespace viva;
using namespace viva::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

int main() {
    Logger::initialize(LogLevel::ERROR);
    unsetenv("OPENAI_API_KEY");
    const std::string path = "test_config_tmp.json";

    // --- missing file keeps every default ---
    {
        Config cfg = Config::load_from_file("does_not_exist.json");
        ASSERT(cfg.audio.sample_rate == 16000);
        ASSERT(cfg.audio.chunk_size == 1024);
        ASSERT(cfg.audio.silence_duration_s == 2.0);
        ASSERT(cfg.audio.max_duration_s == 60.0);
        ASSERT(cfg.interview.default_duration_minutes == 30);
        ASSERT(cfg.interview.default_difficulty == 3);
        ASSERT(cfg.interview.max_follow_ups == 3);
        ASSERT(cfg.server.port == 8765);
        ASSERT(cfg.question_bank_path == "data/question_bank.json");
        ASSERT(cfg.llm.api_key.empty());
    }

    // --- partial file: given keys override, the rest stay default ---
    {
        write_file(path, R"({
            "audio": {"silence_duration_s": 1.5},
            "interview": {"default_difficulty": 4, "max_follow_ups": 1},
            "server": {"port": 9000},
            "logging": {"level": "debug"},
            "session_log_dir": "/tmp/viva_sessions"
        })");
        Config cfg = Config::load_from_file(path);
        ASSERT(cfg.audio.silence_duration_s == 1.5);
        ASSERT(cfg.audio.sample_rate == 16000);
        ASSERT(cfg.interview.default_difficulty == 4);
        ASSERT(cfg.interview.max_follow_ups == 1);
        ASSERT(cfg.interview.default_duration_minutes == 30);
        ASSERT(cfg.server.port == 9000);
        ASSERT(cfg.server.host == "127.0.0.1");
        ASSERT(cfg.logging.level == "debug");
        ASSERT(cfg.session_log_dir == "/tmp/viva_sessions");
    }

    // --- the interview always ends one minute before the budget, whatever the file says ---
    {
        for (const char* buffer : {"-1", "5"}) {
            write_file(path, std::string(R"({"interview": {"default_duration_minutes": 10, "end_buffer_minutes": )") +
                             buffer + "}}");
            Config cfg = Config::load_from_file(path);
            ASSERT(cfg.interview.default_duration_minutes == 10);

            ManualClock clock;
            ScriptedReasoningClient client;
            DialoguePolicy policy(client, nullptr, cfg.interview);
            ConversationContext context(SessionClock(cfg.interview.default_duration_minutes, clock.fn()));

            clock.advance_minutes(8.5);
            ASSERT(!policy.should_end_interview(context));
            clock.advance_minutes(0.5);
            ASSERT(policy.should_end_interview(context));
            clock.advance_minutes(5);
            ASSERT(policy.should_end_interview(context));
        }
    }

    // --- wrong types and out-of-range values fall back per field ---
    {
        write_file(path, R"({
            "audio": {"sample_rate": "fast", "chunk_size": 512},
            "interview": {"default_difficulty": 9, "default_duration_minutes": 45},
            "server": {"port": 70000},
            "tts": "piper"
        })");
        Config cfg = Config::load_from_file(path);
        ASSERT(cfg.audio.sample_rate == 16000);
        ASSERT(cfg.audio.chunk_size == 512);
        ASSERT(cfg.interview.default_difficulty == 3);
        ASSERT(cfg.interview.default_duration_minutes == 45);
        ASSERT(cfg.server.port == 8765);
        ASSERT(cfg.tts.max_cache_entries == 32);
    }

    // --- malformed JSON returns defaults ---
    {
        write_file(path, "{ \"audio\": { \"sample_rate\": 8000, ");
        Config cfg = Config::load_from_file(path);
        ASSERT(cfg.audio.sample_rate == 16000);

        write_file(path, "[1, 2, 3]");
        ASSERT(Config::load_from_file(path).audio.sample_rate == 16000);
    }

    // --- api key from the environment, never written back ---
    {
        write_file(path, R"({"llm": {"model_name": "llama3"}})");
        setenv("OPENAI_API_KEY", "sk-test", 1);
        Config cfg = Config::load_from_file(path);
        ASSERT(cfg.llm.api_key == "sk-test");
        ASSERT(cfg.llm.model_name == "llama3");

        cfg.interview.max_follow_ups = 2;
        cfg.save_to_file(path);
        unsetenv("OPENAI_API_KEY");

        std::ifstream in(path);
        std::string saved((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        ASSERT(saved.find("sk-test") == std::string::npos);

        Config reloaded = Config::load_from_file(path);
        ASSERT(reloaded.interview.max_follow_ups == 2);
        ASSERT(reloaded.llm.model_name == "llama3");
        ASSERT(reloaded.llm.api_key.empty());
    }

    std::remove(path.c_str());
    Logger::shutdown();
    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
