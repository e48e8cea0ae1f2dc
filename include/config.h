#pragma once

#include "common.h"
#include <string>
#include <cstdint>
#include <vector>

namespace viva {

struct AudioConfig {
    std::string input_device = "default";
    std::string output_device = "default";
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int channels = DEFAULT_CHANNELS;
    int chunk_size = DEFAULT_CHUNK_SIZE;                      ///< Samples per captured frame
    double silence_duration_s = DEFAULT_SILENCE_DURATION_S;   ///< Trailing silence that ends an utterance
    double max_duration_s = DEFAULT_MAX_RECORDING_S;          ///< Hard cap on one recording
};

struct STTConfig {
    std::string model_path;
    std::string language = "en";
    std::string blank_sentinel = "[BLANK_AUDIO]";  ///< Treat this exact string (after trim) as blank
    bool use_gpu = true;
    int threads = 4;
};

struct LLMConfig {
    /// Dialect is chosen from the path: /api/chat (Ollama), /v1/chat/completions (OpenAI-compatible), else llama.cpp /completion
    std::string endpoint = "http://localhost:11434/api/chat";
    std::string api_key;  ///< Bearer token; empty = read OPENAI_API_KEY from the environment
    std::string model_name = "gpt-3.5-turbo";
    float temperature = 0.7f;
    int max_tokens = 500;
    int timeout_ms = 30000;
    int connect_timeout_ms = 2000;
    std::string system_prompt = "You are an experienced, friendly technical interviewer running a spoken interview. "
                                "Keep replies short enough to be read aloud and never reveal model answers.";
};

struct TTSConfig {
    std::string voice_path;         ///< Piper voice model (.onnx)
    std::string piper_path;         ///< Piper binary path (empty = auto-detect)
    std::string espeak_data_path;   ///< espeak-ng data dir (empty = Piper default)
    float output_gain = 1.0f;
    size_t max_cache_entries = 32;
    size_t max_cache_text_length = 200;
};

struct InterviewConfig {
    int default_duration_minutes = DEFAULT_INTERVIEW_MINUTES;
    int default_difficulty = DEFAULT_DIFFICULTY;
    int max_follow_ups = DEFAULT_MAX_FOLLOW_UPS;
    size_t opening_examples = 3;   ///< Bank questions shown as style reference for the opening question
    size_t next_examples = 5;      ///< ... and for later questions
};

struct ServerConfig {
    std::string host = "127.0.0.1";
    int port = 8765;
    size_t max_message_bytes = 16 * 1024 * 1024;
    size_t retained_ended_sessions = 64;
};

struct LoggingConfig {
    std::string level = "INFO";
    std::string file;
};

struct Config {
    AudioConfig audio;
    STTConfig stt;
    LLMConfig llm;
    TTSConfig tts;
    InterviewConfig interview;
    ServerConfig server;
    LoggingConfig logging;

    std::string question_bank_path = "data/question_bank.json";
    std::string session_log_dir = "logs/sessions";

    static Config load_from_file(const std::string& path);
    void save_to_file(const std::string& path) const;
};

} // namespace viva
