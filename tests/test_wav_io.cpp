/**
 * WAV encode/decode, raw payload decoding, resampling and base64 transport encoding.
 *
 * Run from build dir: ./test_wav_io
 */

#include "audio/buffered_frame_source.h"
#include "audio/wav_io.h"
#include "logger.h"
#include "utils.h"
#include <cstdio>
#include <iostream>
#include <string>

using namespace viva;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static void put_u16(ByteBuffer& b, size_t at, uint16_t v) {
    b[at] = static_cast<uint8_t>(v & 0xFF);
    b[at + 1] = static_cast<uint8_t>(v >> 8);
}

static void put_u32(ByteBuffer& b, size_t at, uint32_t v) {
    for (int i = 0; i < 4; ++i) b[at + i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
}

int main() {
    Logger::initialize(LogLevel::ERROR);

    AudioBuffer ramp;
    for (int i = 0; i < 160; ++i) ramp.push_back(static_cast<Sample>(i * 100 - 8000));

    // --- canonical header ---
    {
        ByteBuffer wav = audio::encode_wav(ramp, 16000);
        ASSERT(wav.size() == 44 + ramp.size() * 2);
        ASSERT(std::string(wav.begin(), wav.begin() + 4) == "RIFF");
        ASSERT(std::string(wav.begin() + 8, wav.begin() + 12) == "WAVE");
        ASSERT(std::string(wav.begin() + 36, wav.begin() + 40) == "data");

        auto decoded = audio::decode_wav(wav, 16000);
        ASSERT(decoded);
        ASSERT(decoded.value() == ramp);
    }

    // --- resampling on decode ---
    {
        ByteBuffer wav = audio::encode_wav(AudioBuffer(800, 1000), 8000);
        auto decoded = audio::decode_wav(wav, 16000);
        ASSERT(decoded);
        ASSERT(decoded.value().size() == 1600);
        ASSERT(decoded.value()[10] == 1000);

        AudioBuffer down = audio::resample(AudioBuffer(4800, 0), 48000, 16000);
        ASSERT(down.size() == 1600);
        ASSERT(audio::resample(ramp, 16000, 16000) == ramp);
    }

    // --- stereo WAV is downmixed ---
    {
        ByteBuffer wav = audio::encode_wav(AudioBuffer{100, 300, -200, -400}, 16000);
        put_u16(wav, 22, 2);            // channels
        put_u32(wav, 28, 16000 * 4);    // byte rate
        put_u16(wav, 32, 4);            // block align
        auto decoded = audio::decode_wav(wav, 16000);
        ASSERT(decoded);
        ASSERT(decoded.value().size() == 2);
        ASSERT(decoded.value()[0] == 200);
        ASSERT(decoded.value()[1] == -300);
    }

    // --- malformed WAV ---
    {
        ByteBuffer junk = {'R', 'I', 'F', 'F', 0, 0, 0, 0, 'J', 'U', 'N', 'K'};
        ASSERT(!audio::decode_wav(junk));
        ASSERT(audio::decode_wav(junk).error().type == ErrorType::ParseError);

        ByteBuffer eight_bit = audio::encode_wav(ramp, 16000);
        put_u16(eight_bit, 34, 8);
        ASSERT(!audio::decode_wav(eight_bit));

        ByteBuffer header_only = audio::encode_wav(AudioBuffer(), 16000);
        header_only.resize(36);
        ASSERT(!audio::decode_wav(header_only));
    }

    // --- raw PCM payloads ---
    {
        ByteBuffer raw = {0x10, 0x00, 0xF0, 0xFF};  // 16, -16
        AudioFormat declared;
        auto decoded = audio::decode_payload(raw, declared, 16000);
        ASSERT(decoded);
        ASSERT(decoded.value().size() == 2);
        ASSERT(decoded.value()[0] == 16);
        ASSERT(decoded.value()[1] == -16);

        AudioFormat mp3;
        mp3.encoding = "mp3";
        ASSERT(!audio::decode_payload(raw, mp3, 16000));

        AudioFormat six_channels;
        six_channels.channels = 6;
        ASSERT(!audio::decode_payload(raw, six_channels, 16000));

        // a RIFF payload ignores the declared format
        auto from_wav = audio::decode_payload(audio::encode_wav(ramp, 16000), mp3, 16000);
        ASSERT(from_wav);
        ASSERT(from_wav.value() == ramp);
    }

    // --- base64 ---
    {
        ASSERT(utils::base64_encode(ByteBuffer{'M', 'a', 'n'}) == "TWFu");
        ASSERT(utils::base64_encode(ByteBuffer{'M', 'a'}) == "TWE=");
        ASSERT(utils::base64_encode(ByteBuffer{'M'}) == "TQ==");
        ASSERT(utils::base64_encode(ByteBuffer()) == "");

        auto decoded = utils::base64_decode("TWE=");
        ASSERT(decoded.has_value());
        ASSERT((*decoded == ByteBuffer{'M', 'a'}));
        ASSERT(utils::base64_decode("TW\nFu").has_value());
        ASSERT(!utils::base64_decode("T*Fu").has_value());
        ASSERT(!utils::base64_decode("TQ==TQ").has_value());

        ByteBuffer wav = audio::encode_wav(ramp, 16000);
        auto back = utils::base64_decode(utils::base64_encode(wav));
        ASSERT(back.has_value() && *back == wav);
    }

    // --- files ---
    {
        std::string path = "test_wav_io_tmp.wav";
        ASSERT(audio::write_wav_file(path, ramp, 16000));
        auto loaded = audio::read_wav_file(path, 16000);
        ASSERT(loaded);
        ASSERT(loaded.value() == ramp);

        // 160 samples in 64-sample frames: 3 frames, the last zero-padded
        auto replay = audio::BufferedFrameSource::from_wav_file(path, 64);
        ASSERT(replay);
        if (replay) {
            auto& source = *replay.value();
            ASSERT(source.format().sample_rate == 16000);
            ASSERT(source.open());
            AudioFrame frame;
            ASSERT(source.read_frame(frame) && frame.size() == 64 && frame[0] == ramp[0]);
            ASSERT(source.read_frame(frame));
            ASSERT(source.read_frame(frame) && frame[31] == ramp[159] && frame[32] == 0);
            ASSERT(source.exhausted());
            ASSERT(!source.read_frame(frame));
        }
        std::remove(path.c_str());
        ASSERT(!audio::BufferedFrameSource::from_wav_file(path, 64));

        auto missing = audio::read_wav_file("does/not/exist.wav");
        ASSERT(!missing);
        ASSERT(missing.error().type == ErrorType::IOError);
    }

    Logger::shutdown();
    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All WAV I/O tests passed.\n";
    return 0;
}
