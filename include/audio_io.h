#pragma once

#include "common.h"
#include "config.h"
#include "audio/frame_source.h"
#include <string>
#include <memory>

namespace viva {

/**
 * @brief PortAudio microphone and speaker for local mode
 *
 * Capture is an IFrameSource: a blocking input stream opened per recording and read
 * one chunk_size frame at a time by AudioSession's capture thread. Playback is a
 * single pending buffer drained by PortAudio's output callback.
 *
 * Devices are chosen by "default", a numeric index or an exact device name.
 * play(), wait_playback() and stop_playback() are safe from any thread.
 */
class AudioIO : public audio::IFrameSource {
public:
    explicit AudioIO(const AudioConfig& config);
    ~AudioIO() override;

    AudioIO(const AudioIO&) = delete;
    AudioIO& operator=(const AudioIO&) = delete;

    /**
     * @brief Initialize PortAudio, resolve both devices and start the output stream
     * @return NotFound for an unknown device, ResourceError when PortAudio fails
     */
    Result<void> initialize();

    Result<void> open() override;
    Result<void> read_frame(AudioFrame& frame) override;
    void close() override;

    AudioFormat format() const override;

    /// Start playing buffer (mono PCM16 at the configured rate), cutting off anything still playing
    bool play(const AudioBuffer& buffer);

    /**
     * @brief Block until playback drains or timeout_ms elapses
     * @return True if playback completed
     */
    bool wait_playback(int timeout_ms);

    void stop_playback();

    void shutdown();

    /// Log every device with its channel counts; usable without initialize()
    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
