#pragma once

/**
 * @file piper_tts.h
 * @brief Speech synthesis through the Piper command-line binary
 */

#include "tts_interface.h"
#include "config.h"
#include <memory>
#include <string>
#include <vector>

namespace viva {
namespace tts {

struct CacheStats {
    size_t entries = 0;
    size_t hits = 0;
    size_t misses = 0;
    int64_t avg_synthesis_ms = 0;
};

/**
 * @brief Runs Piper once per utterance and reads back the WAV it writes
 *
 * Output is resampled to 16 kHz and scaled by tts.output_gain. Utterances up to
 * tts.max_cache_text_length characters are kept in an LRU cache of
 * tts.max_cache_entries, so repeated interviewer phrases are synthesized once.
 */
class PiperTTS : public ITTS {
public:
    explicit PiperTTS(const TTSConfig& config);
    ~PiperTTS() override;

    PiperTTS(const PiperTTS&) = delete;
    PiperTTS& operator=(const PiperTTS&) = delete;

    SynthResult synth(const std::string& text) override;
    Result<void> warmup() override;
    bool is_ready() const override;

    /// Synthesize into the cache; failures are logged and skipped
    void preload(const std::vector<std::string>& utterances);

    CacheStats cache_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace tts
} // namespace viva
