#include "config.h"
#include "logger.h"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace viva {

namespace {

/// Copy j[key] into field when present; a value of the wrong type is logged and skipped
template<typename T>
void read_field(const json& section, const char* section_name, const char* key, T& field) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return;
    try {
        field = it->get<T>();
    } catch (const json::exception&) {
        Logger::warn(std::string("Config ") + section_name + "." + key + " has the wrong type (" +
                     it->type_name() + "), keeping default");
    }
}

const json& section_of(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end()) return empty;
    if (!it->is_object()) {
        Logger::warn(std::string("Config section \"") + name + "\" is not an object, ignored");
        return empty;
    }
    return *it;
}

void apply_json(Config& cfg, const json& root) {
    const json& audio = section_of(root, "audio");
    read_field(audio, "audio", "input_device", cfg.audio.input_device);
    read_field(audio, "audio", "output_device", cfg.audio.output_device);
    read_field(audio, "audio", "sample_rate", cfg.audio.sample_rate);
    read_field(audio, "audio", "channels", cfg.audio.channels);
    read_field(audio, "audio", "chunk_size", cfg.audio.chunk_size);
    read_field(audio, "audio", "silence_duration_s", cfg.audio.silence_duration_s);
    read_field(audio, "audio", "max_duration_s", cfg.audio.max_duration_s);

    const json& stt = section_of(root, "stt");
    read_field(stt, "stt", "model_path", cfg.stt.model_path);
    read_field(stt, "stt", "language", cfg.stt.language);
    read_field(stt, "stt", "blank_sentinel", cfg.stt.blank_sentinel);
    read_field(stt, "stt", "use_gpu", cfg.stt.use_gpu);
    read_field(stt, "stt", "threads", cfg.stt.threads);

    const json& llm = section_of(root, "llm");
    read_field(llm, "llm", "endpoint", cfg.llm.endpoint);
    read_field(llm, "llm", "api_key", cfg.llm.api_key);
    read_field(llm, "llm", "model_name", cfg.llm.model_name);
    read_field(llm, "llm", "temperature", cfg.llm.temperature);
    read_field(llm, "llm", "max_tokens", cfg.llm.max_tokens);
    read_field(llm, "llm", "timeout_ms", cfg.llm.timeout_ms);
    read_field(llm, "llm", "connect_timeout_ms", cfg.llm.connect_timeout_ms);
    read_field(llm, "llm", "system_prompt", cfg.llm.system_prompt);

    const json& tts = section_of(root, "tts");
    read_field(tts, "tts", "piper_path", cfg.tts.piper_path);
    read_field(tts, "tts", "voice_path", cfg.tts.voice_path);
    read_field(tts, "tts", "espeak_data_path", cfg.tts.espeak_data_path);
    read_field(tts, "tts", "output_gain", cfg.tts.output_gain);
    read_field(tts, "tts", "max_cache_entries", cfg.tts.max_cache_entries);
    read_field(tts, "tts", "max_cache_text_length", cfg.tts.max_cache_text_length);

    const json& interview = section_of(root, "interview");
    read_field(interview, "interview", "default_duration_minutes", cfg.interview.default_duration_minutes);
    read_field(interview, "interview", "default_difficulty", cfg.interview.default_difficulty);
    read_field(interview, "interview", "max_follow_ups", cfg.interview.max_follow_ups);
    read_field(interview, "interview", "opening_examples", cfg.interview.opening_examples);
    read_field(interview, "interview", "next_examples", cfg.interview.next_examples);

    const json& server = section_of(root, "server");
    read_field(server, "server", "host", cfg.server.host);
    read_field(server, "server", "port", cfg.server.port);
    read_field(server, "server", "max_message_bytes", cfg.server.max_message_bytes);
    read_field(server, "server", "retained_ended_sessions", cfg.server.retained_ended_sessions);

    const json& logging = section_of(root, "logging");
    read_field(logging, "logging", "level", cfg.logging.level);
    read_field(logging, "logging", "file", cfg.logging.file);

    read_field(root, "config", "question_bank_path", cfg.question_bank_path);
    read_field(root, "config", "session_log_dir", cfg.session_log_dir);
}

// Values the engine cannot run with fall back to their defaults
void validate(Config& cfg) {
    const Config defaults;
    auto reject = [](const std::string& what) {
        Logger::warn("Config " + what + " is out of range, using default");
    };

    if (cfg.audio.sample_rate <= 0) { reject("audio.sample_rate"); cfg.audio.sample_rate = defaults.audio.sample_rate; }
    if (cfg.audio.channels < 1 || cfg.audio.channels > 2) { reject("audio.channels"); cfg.audio.channels = defaults.audio.channels; }
    if (cfg.audio.chunk_size <= 0) { reject("audio.chunk_size"); cfg.audio.chunk_size = defaults.audio.chunk_size; }
    if (cfg.audio.silence_duration_s <= 0) {
        reject("audio.silence_duration_s");
        cfg.audio.silence_duration_s = defaults.audio.silence_duration_s;
    }
    if (cfg.audio.max_duration_s < cfg.audio.silence_duration_s) {
        reject("audio.max_duration_s");
        cfg.audio.max_duration_s = defaults.audio.max_duration_s;
    }
    if (cfg.interview.default_difficulty < 1 || cfg.interview.default_difficulty > 5) {
        reject("interview.default_difficulty");
        cfg.interview.default_difficulty = defaults.interview.default_difficulty;
    }
    if (cfg.interview.default_duration_minutes <= 0) {
        reject("interview.default_duration_minutes");
        cfg.interview.default_duration_minutes = defaults.interview.default_duration_minutes;
    }
    if (cfg.interview.max_follow_ups < 0) {
        reject("interview.max_follow_ups");
        cfg.interview.max_follow_ups = defaults.interview.max_follow_ups;
    }
    if (cfg.server.port < 0 || cfg.server.port > 65535) { reject("server.port"); cfg.server.port = defaults.server.port; }
}

void apply_environment(Config& cfg) {
    if (!cfg.llm.api_key.empty()) return;
    if (const char* key = std::getenv("OPENAI_API_KEY")) cfg.llm.api_key = key;
}

} // namespace

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Config file " + path + " not found, using defaults");
    } else {
        try {
            json root = json::parse(file);
            if (root.is_object()) {
                apply_json(cfg, root);
                validate(cfg);
            } else {
                Logger::error("Config " + path + " is not a JSON object, using defaults");
            }
        } catch (const json::exception& e) {
            Logger::error("Cannot parse config " + path + ": " + e.what() + ", using defaults");
            cfg = Config();
        }
    }

    apply_environment(cfg);
    return cfg;
}

void Config::save_to_file(const std::string& path) const {
    json root;
    root["audio"] = {
        {"input_device", audio.input_device},
        {"output_device", audio.output_device},
        {"sample_rate", audio.sample_rate},
        {"channels", audio.channels},
        {"chunk_size", audio.chunk_size},
        {"silence_duration_s", audio.silence_duration_s},
        {"max_duration_s", audio.max_duration_s},
    };
    root["stt"] = {
        {"model_path", stt.model_path},
        {"language", stt.language},
        {"blank_sentinel", stt.blank_sentinel},
        {"use_gpu", stt.use_gpu},
        {"threads", stt.threads},
    };
    // api_key stays out of files
    root["llm"] = {
        {"endpoint", llm.endpoint},
        {"model_name", llm.model_name},
        {"temperature", llm.temperature},
        {"max_tokens", llm.max_tokens},
        {"timeout_ms", llm.timeout_ms},
        {"connect_timeout_ms", llm.connect_timeout_ms},
        {"system_prompt", llm.system_prompt},
    };
    root["tts"] = {
        {"piper_path", tts.piper_path},
        {"voice_path", tts.voice_path},
        {"espeak_data_path", tts.espeak_data_path},
        {"output_gain", tts.output_gain},
        {"max_cache_entries", tts.max_cache_entries},
        {"max_cache_text_length", tts.max_cache_text_length},
    };
    root["interview"] = {
        {"default_duration_minutes", interview.default_duration_minutes},
        {"default_difficulty", interview.default_difficulty},
        {"max_follow_ups", interview.max_follow_ups},
        {"opening_examples", interview.opening_examples},
        {"next_examples", interview.next_examples},
    };
    root["server"] = {
        {"host", server.host},
        {"port", server.port},
        {"max_message_bytes", server.max_message_bytes},
        {"retained_ended_sessions", server.retained_ended_sessions},
    };
    root["logging"] = {{"level", logging.level}, {"file", logging.file}};
    root["question_bank_path"] = question_bank_path;
    root["session_log_dir"] = session_log_dir;

    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Cannot write config file " + path);
        return;
    }
    file << root.dump(2) << "\n";
}

} // namespace viva
