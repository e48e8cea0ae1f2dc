#include "audio/buffered_frame_source.h"
#include "audio/wav_io.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>

namespace viva {
namespace audio {

class BufferedFrameSource::Impl {
public:
    Impl(std::vector<AudioFrame> frames, const AudioFormat& format)
        : frames_(std::move(frames)), format_(format) {}

    std::vector<AudioFrame> frames_;
    AudioFormat format_;
    std::optional<size_t> fail_index_;
    std::optional<AudioFrame> repeat_frame_;
    int frame_delay_ms_ = 0;
    bool keep_position_ = false;
    size_t next_ = 0;
    std::atomic<bool> open_{false};
    std::atomic<size_t> served_{0};
    std::atomic<int> open_count_{0};
    std::atomic<int> close_count_{0};
};

BufferedFrameSource::BufferedFrameSource(std::vector<AudioFrame> frames, const AudioFormat& format)
    : pimpl_(std::make_unique<Impl>(std::move(frames), format)) {}

BufferedFrameSource::~BufferedFrameSource() = default;

std::vector<AudioFrame> BufferedFrameSource::split(const AudioBuffer& samples, int chunk_size) {
    std::vector<AudioFrame> frames;
    if (chunk_size <= 0) return frames;
    size_t step = static_cast<size_t>(chunk_size);
    for (size_t i = 0; i < samples.size(); i += step) {
        size_t n = std::min(step, samples.size() - i);
        AudioFrame frame(samples.begin() + i, samples.begin() + i + n);
        frame.resize(step, 0);
        frames.push_back(std::move(frame));
    }
    return frames;
}

Result<std::unique_ptr<BufferedFrameSource>> BufferedFrameSource::from_wav_file(const std::string& path,
                                                                                int chunk_size) {
    auto samples = read_wav_file(path, DEFAULT_SAMPLE_RATE);
    if (!samples) return samples.error();
    if (chunk_size <= 0) return make_validation_error("chunk_size must be positive");

    AudioFormat format;
    format.sample_rate = DEFAULT_SAMPLE_RATE;
    format.channels = 1;
    return std::make_unique<BufferedFrameSource>(split(samples.value(), chunk_size), format);
}

void BufferedFrameSource::keep_position_on_open(bool keep) {
    pimpl_->keep_position_ = keep;
}

bool BufferedFrameSource::exhausted() const {
    return !pimpl_->repeat_frame_ && pimpl_->next_ >= pimpl_->frames_.size();
}

void BufferedFrameSource::fail_at(size_t index) {
    pimpl_->fail_index_ = index;
}

void BufferedFrameSource::repeat_after_end(const AudioFrame& frame) {
    pimpl_->repeat_frame_ = frame;
}

void BufferedFrameSource::set_frame_delay_ms(int delay_ms) {
    pimpl_->frame_delay_ms_ = delay_ms;
}

bool BufferedFrameSource::is_open() const {
    return pimpl_->open_;
}

size_t BufferedFrameSource::frames_served() const {
    return pimpl_->served_;
}

int BufferedFrameSource::open_count() const {
    return pimpl_->open_count_;
}

int BufferedFrameSource::close_count() const {
    return pimpl_->close_count_;
}

Result<void> BufferedFrameSource::open() {
    if (!pimpl_->keep_position_) pimpl_->next_ = 0;
    pimpl_->open_ = true;
    pimpl_->open_count_++;
    return Result<void>();
}

Result<void> BufferedFrameSource::read_frame(AudioFrame& frame) {
    if (!pimpl_->open_) {
        return make_invalid_state_error("Frame source is not open");
    }
    if (pimpl_->frame_delay_ms_ > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(pimpl_->frame_delay_ms_));
    }
    if (pimpl_->fail_index_ && pimpl_->next_ == *pimpl_->fail_index_) {
        return make_io_error("Simulated read failure at frame " + std::to_string(pimpl_->next_));
    }
    if (pimpl_->next_ < pimpl_->frames_.size()) {
        frame = pimpl_->frames_[pimpl_->next_];
    } else if (pimpl_->repeat_frame_) {
        frame = *pimpl_->repeat_frame_;
    } else {
        return make_io_error("End of buffered input");
    }
    pimpl_->next_++;
    pimpl_->served_++;
    return Result<void>();
}

void BufferedFrameSource::close() {
    if (pimpl_->open_) {
        pimpl_->open_ = false;
        pimpl_->close_count_++;
    }
}

AudioFormat BufferedFrameSource::format() const {
    return pimpl_->format_;
}

} // namespace audio
} // namespace viva
