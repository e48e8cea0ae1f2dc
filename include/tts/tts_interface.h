#pragma once

/**
 * @file tts_interface.h
 * @brief Speech synthesis seam used by the server and local mode
 */

#include "common.h"
#include "errors.h"
#include <string>

namespace viva {
namespace tts {

/**
 * @brief Synthesized speech for one utterance
 *
 * A failed synthesis carries an error and no audio; the server then replies
 * with an empty response_audio instead of failing the turn.
 */
struct SynthResult {
    AudioBuffer audio;          ///< Mono PCM16 at sample_rate
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int64_t synthesis_ms = 0;
    std::string error;

    bool ok() const { return error.empty() && !audio.empty(); }
};

/// synth() is called concurrently from connection threads
class ITTS {
public:
    virtual ~ITTS() = default;

    virtual SynthResult synth(const std::string& text) = 0;

    /// Locate the engine and voice; synth() still reports errors if this failed
    virtual Result<void> warmup() = 0;

    virtual bool is_ready() const = 0;
};

} // namespace tts
} // namespace viva
