#pragma once

#include "common.h"
#include "config.h"
#include "stt/transcriber.h"
#include <string>
#include <memory>

namespace viva {

/**
 * @brief whisper.cpp transcriber (greedy decoding, single segment)
 *
 * Confidence is the mean token probability. Calls are serialized on one whisper
 * context.
 */
class WhisperTranscriber : public stt::ITranscriber {
public:
    explicit WhisperTranscriber(const STTConfig& config);
    ~WhisperTranscriber() override;

    // Non-copyable
    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    Result<Transcript> transcribe(const AudioBuffer& audio, const AudioFormat& format) override;

    bool is_ready() const override;

    /// Bias decoding toward domain vocabulary (topic names, technical terms)
    void set_initial_prompt(const std::string& prompt);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
