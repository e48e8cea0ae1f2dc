#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include "audio/frame_source.h"
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace viva {

enum class RecordingState {
    Idle,
    Recording,
    Finished,
    Aborted
};

const char* recording_state_name(RecordingState state);

/**
 * @brief Why the capture loop exited
 */
enum class CaptureEnd {
    Silence,
    MaxDuration,
    Stopped,     ///< stop() or abort() requested
    ReadError    ///< A frame read failed; frames captured so far are kept
};

const char* capture_end_name(CaptureEnd reason);

struct CaptureOutcome {
    CaptureEnd reason = CaptureEnd::Stopped;
    size_t frames = 0;
    std::string error;  ///< Read error message when reason == ReadError
};

/**
 * @brief One recording lifecycle on a dedicated capture thread
 *
 * Idle -> Recording -> (Finished | Aborted). The capture loop reads frames from an
 * IFrameSource, appends them to the buffer and feeds them to a SilenceGate. The loop
 * exits on end-of-utterance, on a stop request or on the first read error, closes the
 * source and fulfils completion().
 *
 * The frame source is not owned and must outlive the session.
 */
class AudioSession {
public:
    AudioSession(audio::IFrameSource& source, const AudioConfig& config);
    ~AudioSession();

    AudioSession(const AudioSession&) = delete;
    AudioSession& operator=(const AudioSession&) = delete;

    /**
     * @brief Open the source and start the capture thread
     * @return AlreadyRecording unless Idle; the source's error if it cannot be opened
     */
    Result<void> start();

    /**
     * @brief Future fulfilled when the capture loop of the current recording exits
     *
     * Invalid (valid() == false) before the first start().
     */
    std::shared_future<CaptureOutcome> completion() const;

    /**
     * @brief Request the loop to exit at the next frame boundary, join it and hand off the buffer
     * @return The captured samples, nullopt when nothing was captured, or
     *         NoActiveRecording when Idle, Aborted or already handed off
     */
    Result<std::optional<AudioBuffer>> stop();

    /**
     * @brief Stop capture and discard the buffer (state becomes Aborted)
     */
    void abort();

    /**
     * @brief Return a Finished or Aborted session to Idle for the next recording
     * @return InvalidState while Recording
     */
    Result<void> reset();

    RecordingState state() const;

    /// Frames appended to the current buffer so far
    size_t frames_captured() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
