#pragma once

/**
 * @file wav_io.h
 * @brief PCM16 WAV encoding and decoding
 *
 * All decoders return mono samples at the requested rate: stereo is downmixed by
 * averaging and other rates are linearly resampled.
 */

#include "common.h"
#include "errors.h"
#include <string>

namespace viva {
namespace audio {

/**
 * @brief Encode mono PCM16 samples as a canonical 44-byte-header WAV file image
 */
ByteBuffer encode_wav(const AudioBuffer& samples, int sample_rate = DEFAULT_SAMPLE_RATE);

/**
 * @brief Decode a RIFF/WAVE PCM16 file image
 * @param bytes File contents
 * @param target_rate Output sample rate
 * @return ParseError for anything other than 16-bit PCM with 1 or 2 channels
 */
Result<AudioBuffer> decode_wav(const ByteBuffer& bytes, int target_rate = DEFAULT_SAMPLE_RATE);

/**
 * @brief Decode a client audio payload
 *
 * A payload starting with "RIFF" is parsed as WAV; anything else is taken as raw
 * little-endian PCM16 in the declared format.
 */
Result<AudioBuffer> decode_payload(const ByteBuffer& bytes, const AudioFormat& declared,
                                   int target_rate = DEFAULT_SAMPLE_RATE);

/**
 * @brief Linear-interpolation resampler
 */
AudioBuffer resample(const AudioBuffer& input, int from_rate, int to_rate);

Result<AudioBuffer> read_wav_file(const std::string& path, int target_rate = DEFAULT_SAMPLE_RATE);
Result<void> write_wav_file(const std::string& path, const AudioBuffer& samples,
                            int sample_rate = DEFAULT_SAMPLE_RATE);

} // namespace audio
} // namespace viva
