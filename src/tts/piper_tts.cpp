/**
 * @file piper_tts.cpp
 * @brief Piper speech synthesis
 */

#include "tts/piper_tts.h"
#include "audio/wav_io.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <list>
#include <mutex>
#include <optional>
#include <sstream>
#include <unistd.h>
#include <unordered_map>

namespace viva {
namespace tts {

namespace {

/// Least-recently-used map from utterance text to its audio
class PhraseCache {
public:
    explicit PhraseCache(size_t capacity) : capacity_(capacity) {}

    std::optional<AudioBuffer> lookup(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(text);
        if (it == index_.end()) return std::nullopt;
        order_.splice(order_.begin(), order_, it->second);
        return it->second->second;
    }

    void store(const std::string& text, const AudioBuffer& audio) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capacity_ == 0 || index_.count(text)) return;
        while (order_.size() >= capacity_) {
            index_.erase(order_.back().first);
            order_.pop_back();
        }
        order_.emplace_front(text, audio);
        index_[text] = order_.begin();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_.size();
    }

private:
    using Entry = std::pair<std::string, AudioBuffer>;

    size_t capacity_;
    std::list<Entry> order_;
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    mutable std::mutex mutex_;
};

/// Removes the per-utterance scratch files however synthesis exits
struct ScratchFiles {
    std::string text_path;
    std::string wav_path;

    ~ScratchFiles() {
        std::remove(text_path.c_str());
        std::remove(wav_path.c_str());
    }
};

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

bool readable(const std::string& path) {
    std::ifstream file(path);
    return file.good();
}

std::string which_piper() {
    FILE* pipe = popen("command -v piper 2>/dev/null", "r");
    if (!pipe) return "";
    char line[512];
    std::string found;
    if (fgets(line, sizeof(line), pipe)) found = line;
    pclose(pipe);
    return utils::trim_copy(found);
}

SynthResult failed(const std::string& error) {
    SynthResult result;
    result.error = error;
    return result;
}

} // namespace

class PiperTTS::Impl {
public:
    explicit Impl(const TTSConfig& config)
        : config_(config), cache_(config.max_cache_entries) {}

    Result<void> warmup() {
        auto located = locate_binary();
        if (!located) return located;
        if (!readable(config_.voice_path)) {
            return make_not_found_error("Voice model not found: " + config_.voice_path);
        }
        ready_ = true;
        LOG_TTS("Piper ready: " + binary_ + " voice=" + config_.voice_path);
        return Result<void>();
    }

    SynthResult synth(const std::string& text) {
        const std::string utterance = utils::trim_copy(text);
        if (utterance.empty()) return failed("No text to synthesize");

        if (auto cached = cache_.lookup(utterance)) {
            hits_++;
            SynthResult result;
            result.audio = std::move(*cached);
            return result;
        }
        misses_++;

        SynthResult result = run_piper(utterance);
        if (result.ok() && utterance.size() <= config_.max_cache_text_length) {
            cache_.store(utterance, result.audio);
        }
        return result;
    }

    void preload(const std::vector<std::string>& utterances) {
        size_t loaded = 0;
        for (const auto& utterance : utterances) {
            SynthResult result = synth(utterance);
            if (result.ok()) {
                loaded++;
            } else {
                LOG_TTS("Preload skipped \"" + utils::preview(utterance) + "\": " + result.error);
            }
        }
        LOG_TTS("Preloaded " + std::to_string(loaded) + "/" + std::to_string(utterances.size()) +
                " utterances");
    }

    bool is_ready() const { return ready_; }

    CacheStats cache_stats() const {
        CacheStats stats;
        stats.entries = cache_.size();
        stats.hits = hits_;
        stats.misses = misses_;
        int64_t runs = runs_;
        stats.avg_synthesis_ms = runs > 0 ? total_ms_ / runs : 0;
        return stats;
    }

private:
    Result<void> locate_binary() {
        std::lock_guard<std::mutex> lock(binary_mutex_);
        if (!binary_.empty()) return Result<void>();

        if (!config_.piper_path.empty()) {
            if (!readable(config_.piper_path)) {
                return make_not_found_error("Configured piper_path not found: " + config_.piper_path);
            }
            binary_ = config_.piper_path;
            return Result<void>();
        }

        for (const char* candidate : {"/usr/local/bin/piper", "/usr/bin/piper", "/opt/piper/piper"}) {
            if (readable(candidate)) {
                binary_ = candidate;
                return Result<void>();
            }
        }

        binary_ = which_piper();
        if (binary_.empty()) {
            return make_not_found_error("Piper binary not found; install piper or set tts.piper_path");
        }
        return Result<void>();
    }

    std::string command_for(const ScratchFiles& files) const {
        std::ostringstream cmd;
        cmd << shell_quote(binary_) << " --model " << shell_quote(config_.voice_path);
        if (!config_.espeak_data_path.empty()) {
            cmd << " --espeak_data " << shell_quote(config_.espeak_data_path);
        }
        cmd << " --output_file " << shell_quote(files.wav_path)
            << " < " << shell_quote(files.text_path) << " 2>/dev/null";
        return cmd.str();
    }

    SynthResult run_piper(const std::string& utterance) {
        auto located = locate_binary();
        if (!located) return failed(located.error().message);

        auto started = Clock::now();
        const std::string stem = "/tmp/viva_tts_" + std::to_string(getpid()) + "_" +
                                 std::to_string(scratch_counter_++);
        ScratchFiles files{stem + ".txt", stem + ".wav"};
        {
            std::ofstream input(files.text_path);
            if (!input.is_open()) return failed("Cannot write synthesis input " + files.text_path);
            input << utterance << "\n";
        }

        LOG_TTS("Synthesizing \"" + utils::preview(utterance) + "\"");
        int status = std::system(command_for(files).c_str());
        if (status != 0) {
            LOG_TTS("Piper exited with status " + std::to_string(status));
            return failed("Piper exited with status " + std::to_string(status));
        }

        auto decoded = audio::read_wav_file(files.wav_path, DEFAULT_SAMPLE_RATE);
        if (!decoded) return failed("Unreadable Piper output: " + decoded.error().message);

        SynthResult result;
        result.audio = decoded.take();
        if (result.audio.empty()) return failed("Piper produced no audio");
        scale(result.audio);

        result.synthesis_ms = ms_since(started);
        total_ms_ += result.synthesis_ms;
        runs_++;
        LOG_TTS(std::to_string(result.audio.size()) + " samples in " +
                std::to_string(result.synthesis_ms) + "ms");
        return result;
    }

    void scale(AudioBuffer& audio) const {
        const float gain = config_.output_gain;
        if (std::fabs(gain - 1.0f) < 0.001f) return;
        std::transform(audio.begin(), audio.end(), audio.begin(), [gain](Sample s) {
            return static_cast<Sample>(std::clamp(static_cast<float>(s) * gain, -32768.0f, 32767.0f));
        });
    }

    TTSConfig config_;
    PhraseCache cache_;
    std::mutex binary_mutex_;
    std::string binary_;
    std::atomic<bool> ready_{false};
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
    std::atomic<int64_t> total_ms_{0};
    std::atomic<int64_t> runs_{0};
    std::atomic<uint64_t> scratch_counter_{0};
};

PiperTTS::PiperTTS(const TTSConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

PiperTTS::~PiperTTS() = default;

SynthResult PiperTTS::synth(const std::string& text) {
    return pimpl_->synth(text);
}

Result<void> PiperTTS::warmup() {
    return pimpl_->warmup();
}

bool PiperTTS::is_ready() const {
    return pimpl_->is_ready();
}

void PiperTTS::preload(const std::vector<std::string>& utterances) {
    pimpl_->preload(utterances);
}

CacheStats PiperTTS::cache_stats() const {
    return pimpl_->cache_stats();
}

} // namespace tts
} // namespace viva
