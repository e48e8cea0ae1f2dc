#pragma once

/**
 * @file frame_source.h
 * @brief Audio frame source interface
 *
 * Abstracts where captured frames come from so the capture loop can be driven by a
 * live microphone (AudioIO) or by scripted frames (BufferedFrameSource).
 */

#include "common.h"
#include "errors.h"

namespace viva {
namespace audio {

/**
 * @brief Abstract frame source
 *
 * Calls arrive from a single capture thread; implementations need no internal locking
 * for read_frame().
 */
class IFrameSource {
public:
    virtual ~IFrameSource() = default;

    /**
     * @brief Acquire the underlying input (device stream, file, ...)
     */
    virtual Result<void> open() = 0;

    /**
     * @brief Read the next frame (blocking)
     * @param frame Output frame, resized to the source's chunk size
     * @return Error on I/O failure or end of input
     */
    virtual Result<void> read_frame(AudioFrame& frame) = 0;

    /**
     * @brief Release the underlying input; safe to call when not open
     */
    virtual void close() = 0;

    /**
     * @brief Format of the frames produced
     */
    virtual AudioFormat format() const = 0;
};

} // namespace audio
} // namespace viva
