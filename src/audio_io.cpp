#include "audio_io.h"
#include "logger.h"
#include <portaudio.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <chrono>
#include <cstring>
#include <mutex>
#include <sstream>
#include <thread>

namespace viva {

namespace {

Error pa_failure(ErrorType type, const std::string& what, PaError err) {
    return make_error(type, what + ": " + Pa_GetErrorText(err));
}

PaStreamParameters stream_params(int device, int channels, bool input) {
    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    PaStreamParameters params;
    params.device = device;
    params.channelCount = channels;
    params.sampleFormat = paInt16;
    params.suggestedLatency = info ? (input ? info->defaultLowInputLatency
                                            : info->defaultLowOutputLatency)
                                   : 0.05;
    params.hostApiSpecificStreamInfo = nullptr;
    return params;
}

bool has_channels(const PaDeviceInfo* info, bool input) {
    return info && (input ? info->maxInputChannels > 0 : info->maxOutputChannels > 0);
}

// "default" / "" -> host default, a bare number -> that index, else an exact name match
int resolve_device(const std::string& name, bool input) {
    if (name.empty() || name == "default") {
        PaDeviceIndex idx = input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
        return idx == paNoDevice ? -1 : idx;
    }

    const int count = Pa_GetDeviceCount();
    if (std::all_of(name.begin(), name.end(), ::isdigit)) {
        int idx = std::atoi(name.c_str());
        return idx < count && has_channels(Pa_GetDeviceInfo(idx), input) ? idx : -1;
    }

    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && name == info->name && has_channels(info, input)) return i;
    }
    return -1;
}

} // namespace

class AudioIO::Impl {
public:
    explicit Impl(const AudioConfig& config) : config_(config) {
        if (config_.sample_rate <= 0) config_.sample_rate = DEFAULT_SAMPLE_RATE;
        if (config_.chunk_size <= 0) config_.chunk_size = DEFAULT_CHUNK_SIZE;
        if (config_.channels <= 0) config_.channels = DEFAULT_CHANNELS;
    }

    ~Impl() { shutdown(); }

    Result<void> initialize() {
        if (pa_ready_) return Result<void>();

        PaError err = Pa_Initialize();
        if (err != paNoError) return pa_failure(ErrorType::ResourceError, "PortAudio init", err);
        pa_ready_ = true;

        input_device_ = resolve_device(config_.input_device, true);
        output_device_ = resolve_device(config_.output_device, false);
        if (input_device_ < 0 || output_device_ < 0) {
            std::string missing = input_device_ < 0 ? "Input device " + config_.input_device
                                                    : "Output device " + config_.output_device;
            shutdown();
            return make_not_found_error(missing + " not found or has no channels");
        }

        std::ostringstream devices;
        devices << "Input [" << input_device_ << "] " << Pa_GetDeviceInfo(input_device_)->name
                << ", output [" << output_device_ << "] " << Pa_GetDeviceInfo(output_device_)->name;
        LOG_AUDIO(devices.str());

        PaStreamParameters out = stream_params(output_device_, config_.channels, false);
        err = Pa_OpenStream(&output_stream_, nullptr, &out, config_.sample_rate,
                            config_.chunk_size, paClipOff, &Impl::playback_callback, this);
        if (err == paNoError) err = Pa_StartStream(output_stream_);
        if (err != paNoError) {
            shutdown();
            return pa_failure(ErrorType::ResourceError, "Output stream", err);
        }
        return Result<void>();
    }

    Result<void> open() {
        if (!pa_ready_) return make_invalid_state_error("Audio I/O not initialized");
        if (input_stream_) return Result<void>();

        PaStreamParameters in = stream_params(input_device_, config_.channels, true);
        PaError err = Pa_OpenStream(&input_stream_, &in, nullptr, config_.sample_rate,
                                    config_.chunk_size, paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            input_stream_ = nullptr;
            return pa_failure(ErrorType::IOError, "Open input stream", err);
        }
        err = Pa_StartStream(input_stream_);
        if (err != paNoError) {
            Pa_CloseStream(input_stream_);
            input_stream_ = nullptr;
            return pa_failure(ErrorType::IOError, "Start input stream", err);
        }
        return Result<void>();
    }

    Result<void> read_frame(AudioFrame& frame) {
        if (!input_stream_) return make_invalid_state_error("Input stream is not open");

        frame.resize(static_cast<size_t>(config_.chunk_size) * config_.channels);
        PaError err = Pa_ReadStream(input_stream_, frame.data(), config_.chunk_size);
        if (err == paInputOverflowed) {
            LOG_AUDIO("Input overflowed, frame kept");
        } else if (err != paNoError) {
            return pa_failure(ErrorType::IOError, "Input read", err);
        }
        return Result<void>();
    }

    void close() {
        if (!input_stream_) return;
        Pa_StopStream(input_stream_);
        Pa_CloseStream(input_stream_);
        input_stream_ = nullptr;
    }

    AudioFormat format() const {
        AudioFormat fmt;
        fmt.sample_rate = config_.sample_rate;
        fmt.channels = config_.channels;
        return fmt;
    }

    bool play(const AudioBuffer& buffer) {
        if (!output_stream_) return false;
        std::lock_guard<std::mutex> lock(playback_mutex_);
        pending_ = buffer;
        cursor_ = 0;
        return true;
    }

    bool wait_playback(int timeout_ms) {
        auto start = Clock::now();
        while (playing()) {
            if (ms_since(start) >= timeout_ms) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        return true;
    }

    void stop_playback() {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        pending_.clear();
        cursor_ = 0;
    }

    void shutdown() {
        close();
        if (output_stream_) {
            Pa_StopStream(output_stream_);
            Pa_CloseStream(output_stream_);
            output_stream_ = nullptr;
        }
        if (pa_ready_) {
            Pa_Terminate();
            pa_ready_ = false;
        }
    }

    static void list_devices() {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            LOG_ERROR("PortAudio init: " + std::string(Pa_GetErrorText(err)));
            return;
        }
        LOG_INFO("Audio devices (use the index or exact name in audio.input_device / output_device):");
        for (int i = 0; i < Pa_GetDeviceCount(); ++i) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info) continue;
            std::ostringstream line;
            line << "  [" << i << "] " << info->name << "  in:" << info->maxInputChannels
                 << " out:" << info->maxOutputChannels;
            if (i == Pa_GetDefaultInputDevice()) line << "  (default input)";
            if (i == Pa_GetDefaultOutputDevice()) line << "  (default output)";
            LOG_INFO(line.str());
        }
        Pa_Terminate();
    }

private:
    bool playing() const {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        return cursor_ < pending_.size();
    }

    // PortAudio thread: copy the next slice of pending_, zero-fill the remainder
    static int playback_callback(const void*, void* output, unsigned long frame_count,
                                 const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags,
                                 void* user_data) {
        Impl* self = static_cast<Impl*>(user_data);
        Sample* out = static_cast<Sample*>(output);
        const size_t wanted = frame_count * static_cast<size_t>(self->config_.channels);

        std::lock_guard<std::mutex> lock(self->playback_mutex_);
        const size_t available = self->pending_.size() - self->cursor_;
        const size_t n = std::min(wanted, available);
        if (n > 0) {
            std::memcpy(out, self->pending_.data() + self->cursor_, n * sizeof(Sample));
            self->cursor_ += n;
        }
        std::memset(out + n, 0, (wanted - n) * sizeof(Sample));
        return paContinue;
    }

    AudioConfig config_;
    bool pa_ready_ = false;
    int input_device_ = -1;
    int output_device_ = -1;
    PaStream* input_stream_ = nullptr;
    PaStream* output_stream_ = nullptr;

    mutable std::mutex playback_mutex_;
    AudioBuffer pending_;
    size_t cursor_ = 0;
};

AudioIO::AudioIO(const AudioConfig& config) : pimpl_(std::make_unique<Impl>(config)) {}
AudioIO::~AudioIO() = default;

Result<void> AudioIO::initialize() {
    return pimpl_->initialize();
}

Result<void> AudioIO::open() {
    return pimpl_->open();
}

Result<void> AudioIO::read_frame(AudioFrame& frame) {
    return pimpl_->read_frame(frame);
}

void AudioIO::close() {
    pimpl_->close();
}

AudioFormat AudioIO::format() const {
    return pimpl_->format();
}

bool AudioIO::play(const AudioBuffer& buffer) {
    return pimpl_->play(buffer);
}

bool AudioIO::wait_playback(int timeout_ms) {
    return pimpl_->wait_playback(timeout_ms);
}

void AudioIO::stop_playback() {
    pimpl_->stop_playback();
}

void AudioIO::shutdown() {
    pimpl_->shutdown();
}

void AudioIO::list_devices() {
    Impl::list_devices();
}

} // namespace viva
