#pragma once

#include "common.h"
#include "config.h"
#include <memory>

namespace viva {

enum class GateSignal {
    Continue,
    EndOfUtterance
};

enum class GateReason {
    None,
    Silence,       ///< Silent-frame counter reached the derived threshold
    MaxDuration    ///< Hard cap on frames observed
};

const char* gate_reason_name(GateReason reason);

/**
 * @brief Streaming peak-amplitude monitor that turns frames into an end-of-utterance signal
 *
 * A frame whose peak absolute amplitude is below SILENCE_AMPLITUDE_THRESHOLD increments
 * the silent-frame counter; any louder frame resets it. The gate fires once the counter
 * reaches floor(silence_duration_s * sample_rate / chunk_size), or once the total number
 * of frames observed reaches floor(max_duration_s * sample_rate / chunk_size).
 *
 * Silence is counted from the very first frame: a recording that opens with silence can
 * end before the speaker starts. There is no minimum-speech guard.
 *
 * Once fired the gate stays latched until reset().
 */
class SilenceGate {
public:
    explicit SilenceGate(const AudioConfig& config);
    ~SilenceGate();

    SilenceGate(const SilenceGate&) = delete;
    SilenceGate& operator=(const SilenceGate&) = delete;

    /**
     * @brief Observe one frame of signed 16-bit PCM
     * @return EndOfUtterance when the silence threshold or the hard cap is reached
     */
    GateSignal observe(const AudioFrame& frame);

    /// Why the gate fired (None while still open)
    GateReason reason() const;

    int silent_frames() const;
    int frames_observed() const;

    /// Derived consecutive-silent-frame threshold
    int silence_threshold_frames() const;

    /// Derived hard cap in frames
    int max_frames() const;

    void reset();

    /// Peak absolute amplitude of a frame (0 for an empty frame)
    static int peak_amplitude(const AudioFrame& frame);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
