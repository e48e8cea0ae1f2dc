#include "audio/buffered_frame_source.h"
#include "audio_io.h"
#include "audio_session.h"
#include "config.h"
#include "dialogue_policy.h"
#include "interview_server.h"
#include "interview_session.h"
#include "llm_client.h"
#include "logger.h"
#include "question_bank.h"
#include "stt_engine.h"
#include "tcp_transport.h"
#include "tts/piper_tts.h"
#include "utils.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace viva {

static std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown = true;
}

namespace {

void start_synthesis(tts::PiperTTS& tts) {
    auto ready = tts.warmup();
    if (!ready) {
        LOG_WARN("Speech synthesis unavailable, replies will be text only: " + ready.error().message);
        return;
    }
    tts.preload(DialoguePolicy::canned_utterances());
}

// Bias recognition toward the bank's topic vocabulary
void prime_transcriber(WhisperTranscriber& transcriber, const QuestionBank& bank) {
    std::string vocabulary;
    for (const auto& topic : bank.topics()) {
        if (!vocabulary.empty()) vocabulary += ", ";
        vocabulary += topic;
    }
    if (!vocabulary.empty()) {
        transcriber.set_initial_prompt("A technical interview answer about " + vocabulary + ".");
    }
}

void log_synthesis_stats(const tts::PiperTTS& tts) {
    tts::CacheStats stats = tts.cache_stats();
    LOG_TTS("Cache " + std::to_string(stats.entries) + " entries, " + std::to_string(stats.hits) +
            " hits, " + std::to_string(stats.misses) + " misses, avg " +
            std::to_string(stats.avg_synthesis_ms) + "ms per synthesis");
}

// Speak through Piper and the output device; the text is always printed
void speak(tts::ITTS& tts, AudioIO* audio, const std::string& text) {
    std::cout << "\nInterviewer: " << text << std::endl;
    if (!audio) return;
    auto result = tts.synth(text);
    if (!result.ok()) {
        LOG_WARN("Cannot speak reply: " + result.error);
        return;
    }
    if (!audio->play(result.audio)) {
        LOG_WARN("Playback failed");
        return;
    }
    int remaining_ms = static_cast<int>(result.audio.size() * 1000 / result.sample_rate) + 2000;
    while (remaining_ms > 0 && !audio->wait_playback(100)) {
        if (g_shutdown) {
            audio->stop_playback();
            return;
        }
        remaining_ms -= 100;
    }
}

// Record one utterance; nullopt when nothing usable was captured or on shutdown
std::optional<AudioBuffer> record_answer(audio::IFrameSource& source, const AudioConfig& config) {
    AudioSession recording(source, config);
    auto started = recording.start();
    if (!started) {
        LOG_ERROR("Cannot start recording: " + started.error().message);
        return std::nullopt;
    }

    std::cout << "(listening...)" << std::endl;
    auto done = recording.completion();
    while (done.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (g_shutdown) break;
    }

    auto captured = recording.stop();
    if (!captured) {
        LOG_WARN("Recording produced nothing: " + captured.error().message);
        return std::nullopt;
    }
    if (done.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        LOG_AUDIO(std::string("Capture ended: ") + capture_end_name(done.get().reason));
    }
    return captured.value();
}

// Answers come from the microphone, or from replay_path when given (one WAV holding
// every answer, separated by pauses); replies are then printed without playback
int run_local(const Config& config, std::shared_ptr<const QuestionBank> bank,
              const std::string& replay_path) {
    AudioIO device(config.audio);
    std::unique_ptr<audio::BufferedFrameSource> replay;
    if (replay_path.empty()) {
        auto audio_ready = device.initialize();
        if (!audio_ready) {
            LOG_ERROR("Audio initialization failed: " + audio_ready.error().message);
            return 1;
        }
    } else {
        auto loaded = audio::BufferedFrameSource::from_wav_file(replay_path, config.audio.chunk_size);
        if (!loaded) {
            LOG_ERROR("Cannot replay " + replay_path + ": " + loaded.error().message);
            return 1;
        }
        replay = loaded.take();
        replay->keep_position_on_open(true);
        LOG_INFO("Replaying answers from " + replay_path);
    }
    AudioIO* speaker = replay ? nullptr : &device;
    audio::IFrameSource& input = replay ? static_cast<audio::IFrameSource&>(*replay) : device;

    WhisperTranscriber transcriber(config.stt);
    if (!transcriber.is_ready()) {
        LOG_ERROR("Whisper model not loaded: " + config.stt.model_path);
        return 1;
    }
    prime_transcriber(transcriber, *bank);
    tts::PiperTTS tts(config.tts);
    start_synthesis(tts);
    LLMClient reasoning(config.llm);

    SessionOptions options;
    options.settings.difficulty = config.interview.default_difficulty;
    options.settings.duration_minutes = config.interview.default_duration_minutes;
    options.settings.max_follow_ups = config.interview.max_follow_ups;
    options.interview = config.interview;
    options.log_dir = config.session_log_dir;

    std::mt19937_64 rng(std::random_device{}());
    InterviewSession session(SessionRegistry::generate_id(rng), options, bank, reasoning);

    auto first = session.next_question();
    if (first && first.value()) {
        speak(tts, speaker, first.value()->question->text);
    } else {
        speak(tts, speaker, "Welcome to your technical interview. Say hello when you are ready to begin.");
    }

    while (!g_shutdown && !session.should_end()) {
        if (replay && replay->exhausted()) break;
        auto answer = record_answer(input, config.audio);
        if (g_shutdown) break;
        if (!answer) continue;

        auto transcript = transcriber.transcribe(*answer, input.format());
        if (!transcript) {
            LOG_ERROR("Transcription failed: " + transcript.error().message);
            continue;
        }
        if (utils::is_empty_or_whitespace(transcript.value().text)) {
            LOG_INFO("No speech recognized, listening again");
            continue;
        }
        std::cout << "You: " << transcript.value().text << std::endl;

        auto action = session.handle_utterance(transcript.value());
        if (!action) {
            LOG_ERROR(action.error().message);
            break;
        }
        speak(tts, speaker, action.value().text);
        if (action.value().kind == ActionKind::InterviewComplete) break;
    }

    session.end();
    std::cout << "\n" << session.text_summary() << std::endl;
    log_synthesis_stats(tts);
    device.shutdown();
    return 0;
}

int run_server(const Config& config, std::shared_ptr<const QuestionBank> bank) {
    LLMClient reasoning(config.llm);
    WhisperTranscriber transcriber(config.stt);
    if (!transcriber.is_ready()) {
        LOG_WARN("Whisper model not loaded; submit_audio requests will fail: " + config.stt.model_path);
    }
    prime_transcriber(transcriber, *bank);
    tts::PiperTTS tts(config.tts);
    start_synthesis(tts);

    InterviewServer server(config, bank, reasoning, transcriber, tts);
    TcpTransport transport(
        config.server,
        [&server](const std::string& payload, const std::string& connection_id) {
            return server.handle_payload(payload, connection_id);
        },
        [&server](const std::string& connection_id) {
            server.on_disconnect(connection_id);
        });

    auto started = transport.start();
    if (!started) {
        LOG_ERROR("Cannot start server: " + started.error().message);
        return 1;
    }
    LOG_INFO("Viva interview server ready on " + config.server.host + ":" + std::to_string(transport.port()) +
             " (Ctrl+C to stop)");

    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Shutting down...");
    transport.stop();
    server.end_all();
    log_synthesis_stats(tts);
    return 0;
}

std::string default_config_path() {
    // config/config.json next to the executable's parent directory, else the working directory
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len != -1) {
        buf[len] = '\0';
        std::string exe_dir(buf);
        size_t pos = exe_dir.find_last_of('/');
        if (pos != std::string::npos) {
            std::string candidate = exe_dir.substr(0, pos) + "/../config/config.json";
            std::ifstream test(candidate);
            if (test.good()) return candidate;
        }
    }
    return "config/config.json";
}

} // namespace

} // namespace viva

int main(int argc, char* argv[]) {
    viva::Logger::initialize(viva::LogLevel::INFO);

    std::string config_path;
    std::string replay_path;
    bool local_mode = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--list-devices") {
            viva::AudioIO::list_devices();
            viva::Logger::shutdown();
            return 0;
        }
        if (arg == "--local") {
            local_mode = true;
        } else if (arg == "--replay" && i + 1 < argc) {
            replay_path = argv[++i];
            local_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0]
                      << " [config.json] [--local] [--replay answers.wav] [--list-devices]" << std::endl;
            return 0;
        } else {
            config_path = arg;
        }
    }
    if (config_path.empty()) {
        config_path = viva::default_config_path();
    }

    viva::Config config = viva::Config::load_from_file(config_path);
    viva::Logger::shutdown();
    viva::Logger::initialize(viva::parse_log_level(config.logging.level), config.logging.file);
    if (viva::parse_log_level(config.logging.level, viva::LogLevel::DEBUG) !=
        viva::parse_log_level(config.logging.level, viva::LogLevel::ERROR)) {
        LOG_WARN("Unknown logging.level \"" + config.logging.level + "\", using INFO");
    }

    auto bank = viva::QuestionBank::load_from_file(config.question_bank_path);
    if (!bank) {
        LOG_ERROR("Cannot start without a valid question bank: " + bank.error().message);
        viva::Logger::shutdown();
        return 1;
    }

    std::signal(SIGINT, viva::signal_handler);
    std::signal(SIGTERM, viva::signal_handler);

    int result = local_mode ? viva::run_local(config, bank.value(), replay_path)
                            : viva::run_server(config, bank.value());

    viva::Logger::shutdown();
    return result;
}
