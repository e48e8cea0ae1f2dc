#include "audio/wav_io.h"
#include "logger.h"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

namespace viva {
namespace audio {

namespace {

void put_u16(ByteBuffer& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void put_u32(ByteBuffer& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

uint16_t read_u16(const ByteBuffer& b, size_t offset) {
    return static_cast<uint16_t>(b[offset] | (b[offset + 1] << 8));
}

uint32_t read_u32(const ByteBuffer& b, size_t offset) {
    return static_cast<uint32_t>(b[offset]) |
           (static_cast<uint32_t>(b[offset + 1]) << 8) |
           (static_cast<uint32_t>(b[offset + 2]) << 16) |
           (static_cast<uint32_t>(b[offset + 3]) << 24);
}

bool tag_is(const ByteBuffer& b, size_t offset, const char* tag) {
    return offset + 4 <= b.size() && std::memcmp(b.data() + offset, tag, 4) == 0;
}

// Interleaved PCM16LE bytes -> mono samples
AudioBuffer to_mono(const uint8_t* data, size_t len, int channels) {
    size_t total = len / sizeof(Sample);
    AudioBuffer mono;
    if (channels <= 1) {
        mono.resize(total);
        for (size_t i = 0; i < total; ++i) {
            mono[i] = static_cast<Sample>(data[2 * i] | (data[2 * i + 1] << 8));
        }
        return mono;
    }
    size_t frames = total / static_cast<size_t>(channels);
    mono.reserve(frames);
    for (size_t f = 0; f < frames; ++f) {
        int sum = 0;
        for (int c = 0; c < channels; ++c) {
            size_t i = f * channels + c;
            sum += static_cast<Sample>(data[2 * i] | (data[2 * i + 1] << 8));
        }
        mono.push_back(static_cast<Sample>(sum / channels));
    }
    return mono;
}

} // namespace

ByteBuffer encode_wav(const AudioBuffer& samples, int sample_rate) {
    const uint16_t channels = 1;
    const uint16_t bits_per_sample = 16;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(Sample));

    ByteBuffer out;
    out.reserve(44 + data_size);

    // RIFF header
    out.insert(out.end(), {'R', 'I', 'F', 'F'});
    put_u32(out, 36 + data_size);
    out.insert(out.end(), {'W', 'A', 'V', 'E'});

    // fmt chunk
    out.insert(out.end(), {'f', 'm', 't', ' '});
    put_u32(out, 16);
    put_u16(out, 1);  // PCM
    put_u16(out, channels);
    put_u32(out, static_cast<uint32_t>(sample_rate));
    put_u32(out, static_cast<uint32_t>(sample_rate) * channels * bits_per_sample / 8);
    put_u16(out, channels * bits_per_sample / 8);
    put_u16(out, bits_per_sample);

    // data chunk
    out.insert(out.end(), {'d', 'a', 't', 'a'});
    put_u32(out, data_size);
    for (Sample s : samples) {
        put_u16(out, static_cast<uint16_t>(s));
    }
    return out;
}

Result<AudioBuffer> decode_wav(const ByteBuffer& bytes, int target_rate) {
    if (bytes.size() < 12 || !tag_is(bytes, 0, "RIFF") || !tag_is(bytes, 8, "WAVE")) {
        return make_parse_error("Not a RIFF/WAVE file");
    }

    int channels = 0;
    int sample_rate = 0;
    int bits_per_sample = 0;
    bool have_fmt = false;

    // Walk chunks; LIST and other metadata chunks are skipped
    size_t offset = 12;
    while (offset + 8 <= bytes.size()) {
        uint32_t chunk_size = read_u32(bytes, offset + 4);
        size_t body = offset + 8;

        if (tag_is(bytes, offset, "fmt ")) {
            if (chunk_size < 16 || body + 16 > bytes.size()) {
                return make_parse_error("Truncated fmt chunk");
            }
            uint16_t audio_format = read_u16(bytes, body);
            channels = read_u16(bytes, body + 2);
            sample_rate = static_cast<int>(read_u32(bytes, body + 4));
            bits_per_sample = read_u16(bytes, body + 14);
            if (audio_format != 1 || bits_per_sample != 16) {
                return make_parse_error("Only 16-bit PCM WAV is supported");
            }
            if (channels < 1 || channels > 2 || sample_rate <= 0) {
                return make_parse_error("Unsupported WAV channel count or sample rate");
            }
            have_fmt = true;
        } else if (tag_is(bytes, offset, "data")) {
            if (!have_fmt) {
                return make_parse_error("WAV data chunk precedes fmt chunk");
            }
            // Streamed WAVs may carry a placeholder size; clamp to what is present
            size_t available = bytes.size() - body;
            size_t len = std::min<size_t>(chunk_size, available);
            AudioBuffer mono = to_mono(bytes.data() + body, len, channels);

            std::ostringstream info;
            info << "WAV: " << sample_rate << "Hz, " << channels << "ch, " << len << " bytes";
            LOG_AUDIO(info.str());
            return resample(mono, sample_rate, target_rate);
        }

        // Chunks are word aligned
        offset = body + chunk_size + (chunk_size & 1);
    }
    return make_parse_error("WAV file has no data chunk");
}

Result<AudioBuffer> decode_payload(const ByteBuffer& bytes, const AudioFormat& declared, int target_rate) {
    if (tag_is(bytes, 0, "RIFF")) {
        return decode_wav(bytes, target_rate);
    }
    if (declared.encoding != "linear16" && declared.encoding != "pcm_s16le") {
        return make_parse_error("Unsupported audio encoding: " + declared.encoding);
    }
    if (declared.channels < 1 || declared.channels > 2 || declared.sample_rate <= 0) {
        return make_parse_error("Unsupported channel count or sample rate");
    }
    AudioBuffer mono = to_mono(bytes.data(), bytes.size(), declared.channels);
    return resample(mono, declared.sample_rate, target_rate);
}

AudioBuffer resample(const AudioBuffer& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || input.empty() || from_rate <= 0 || to_rate <= 0) return input;

    double ratio = static_cast<double>(from_rate) / static_cast<double>(to_rate);
    size_t output_samples = static_cast<size_t>(input.size() / ratio);

    AudioBuffer output;
    output.reserve(output_samples);
    for (size_t i = 0; i < output_samples; i++) {
        double input_pos = static_cast<double>(i) * ratio;
        size_t idx0 = static_cast<size_t>(input_pos);
        if (idx0 >= input.size()) break;
        size_t idx1 = std::min(idx0 + 1, input.size() - 1);

        double t = input_pos - static_cast<double>(idx0);
        double interpolated = input[idx0] * (1.0 - t) + input[idx1] * t;
        output.push_back(static_cast<Sample>(interpolated));
    }
    return output;
}

Result<AudioBuffer> read_wav_file(const std::string& path, int target_rate) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return make_io_error("Failed to open WAV file: " + path);
    }
    ByteBuffer bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return decode_wav(bytes, target_rate);
}

Result<void> write_wav_file(const std::string& path, const AudioBuffer& samples, int sample_rate) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return make_io_error("Failed to write WAV file: " + path);
    }
    ByteBuffer bytes = encode_wav(samples, sample_rate);
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        return make_io_error("Short write to WAV file: " + path);
    }
    return Result<void>();
}

} // namespace audio
} // namespace viva
