#pragma once

/**
 * @file buffered_frame_source.h
 * @brief Frame source backed by in-memory samples
 *
 * Serves a fixed sequence of frames, optionally failing at a chosen frame index.
 * Used to drive AudioSession deterministically and to replay a recorded WAV file.
 */

#include "frame_source.h"
#include <memory>
#include <string>
#include <vector>

namespace viva {
namespace audio {

class BufferedFrameSource : public IFrameSource {
public:
    /**
     * @param frames Frames served in order
     * @param format Format reported by format()
     */
    explicit BufferedFrameSource(std::vector<AudioFrame> frames,
                                 const AudioFormat& format = AudioFormat());
    ~BufferedFrameSource() override;

    BufferedFrameSource(const BufferedFrameSource&) = delete;
    BufferedFrameSource& operator=(const BufferedFrameSource&) = delete;

    /**
     * @brief Split a contiguous buffer into chunk_size frames (last frame zero-padded)
     */
    static std::vector<AudioFrame> split(const AudioBuffer& samples, int chunk_size);

    /**
     * @brief Load a WAV file (resampled to 16 kHz mono) as chunk_size frames
     */
    static Result<std::unique_ptr<BufferedFrameSource>> from_wav_file(const std::string& path,
                                                                      int chunk_size);

    /**
     * @brief open() continues after the last frame served instead of rewinding, so
     * consecutive recordings consume one long input answer by answer
     */
    void keep_position_on_open(bool keep);

    /// Every frame has been served and no repeat frame is set
    bool exhausted() const;

    /**
     * @brief Make read_frame() fail with IOError when the frame at index is requested
     */
    void fail_at(size_t index);

    /**
     * @brief When set, once frames run out read_frame() keeps returning copies of this frame
     * instead of failing (simulates an open microphone in a quiet room)
     */
    void repeat_after_end(const AudioFrame& frame);

    /**
     * @brief Sleep this long inside each read_frame() (simulates device pacing)
     */
    void set_frame_delay_ms(int delay_ms);

    bool is_open() const;
    size_t frames_served() const;
    int open_count() const;
    int close_count() const;

    Result<void> open() override;
    Result<void> read_frame(AudioFrame& frame) override;
    void close() override;
    AudioFormat format() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace audio
} // namespace viva
