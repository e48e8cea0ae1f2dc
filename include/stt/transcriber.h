#pragma once

/**
 * @file transcriber.h
 * @brief Speech-to-text collaborator interface
 */

#include "common.h"
#include "errors.h"

namespace viva {
namespace stt {

/**
 * @brief Abstract transcriber
 *
 * A blank result (silence, noise) is reported as a Transcript with empty text, not as
 * an error. Errors are reserved for engine failures.
 */
class ITranscriber {
public:
    virtual ~ITranscriber() = default;

    /**
     * @brief Transcribe one utterance
     * @param audio Mono PCM16 samples
     * @param format Sample rate and channel layout of audio
     */
    virtual Result<Transcript> transcribe(const AudioBuffer& audio, const AudioFormat& format) = 0;

    virtual bool is_ready() const = 0;
};

} // namespace stt
} // namespace viva
