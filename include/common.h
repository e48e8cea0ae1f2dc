#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>

namespace viva {

// Audio types
using Sample = int16_t;
using AudioFrame = std::vector<Sample>;
using AudioBuffer = std::vector<Sample>;
using ByteBuffer = std::vector<uint8_t>;

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = Clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

// Audio format constants
constexpr int DEFAULT_SAMPLE_RATE = 16000;
constexpr int DEFAULT_CHANNELS = 1;
constexpr int DEFAULT_CHUNK_SIZE = 1024;               // samples per frame
constexpr int SILENCE_AMPLITUDE_THRESHOLD = 1000;      // peak below this counts as silence
constexpr double DEFAULT_SILENCE_DURATION_S = 2.0;
constexpr double DEFAULT_MAX_RECORDING_S = 60.0;

// Interview constants
constexpr int DEFAULT_INTERVIEW_MINUTES = 30;
constexpr int DEFAULT_DIFFICULTY = 3;
constexpr int MIN_DIFFICULTY = 1;
constexpr int MAX_DIFFICULTY = 5;
constexpr int DEFAULT_MAX_FOLLOW_UPS = 3;
constexpr double END_BUFFER_MINUTES = 1.0;
constexpr int MIN_SCORE = 1;
constexpr int MAX_SCORE = 10;

/**
 * @brief Describes a PCM payload handed to or returned from a collaborator
 */
struct AudioFormat {
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int channels = DEFAULT_CHANNELS;
    std::string encoding = "linear16";
};

// Transcript result
struct Transcript {
    std::string text;
    float confidence = 0.0f;
    int64_t processing_ms = 0;
    int token_count = 0;  ///< Number of tokens from STT (0 if not set)
};

} // namespace viva
