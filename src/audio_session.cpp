#include "audio_session.h"
#include "silence_gate.h"
#include "logger.h"
#include <atomic>
#include <mutex>
#include <sstream>
#include <thread>

namespace viva {

const char* recording_state_name(RecordingState state) {
    switch (state) {
        case RecordingState::Idle: return "Idle";
        case RecordingState::Recording: return "Recording";
        case RecordingState::Finished: return "Finished";
        case RecordingState::Aborted: return "Aborted";
    }
    return "Idle";
}

const char* capture_end_name(CaptureEnd reason) {
    switch (reason) {
        case CaptureEnd::Silence: return "silence";
        case CaptureEnd::MaxDuration: return "max_duration";
        case CaptureEnd::Stopped: return "stopped";
        case CaptureEnd::ReadError: return "read_error";
    }
    return "stopped";
}

class AudioSession::Impl {
public:
    Impl(audio::IFrameSource& source, const AudioConfig& config)
        : source_(source), gate_(config), state_(RecordingState::Idle),
          stop_requested_(false), handed_off_(false) {}

    ~Impl() {
        stop_requested_ = true;
        join_capture();
    }

    Result<void> start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != RecordingState::Idle) {
            return make_error(ErrorType::AlreadyRecording,
                              std::string("Cannot start recording in state ") + recording_state_name(state_));
        }

        auto opened = source_.open();
        if (!opened) {
            return opened.error();
        }

        buffer_.clear();
        frames_ = 0;
        gate_.reset();
        stop_requested_ = false;
        handed_off_ = false;
        promise_ = std::promise<CaptureOutcome>();
        completion_ = promise_.get_future().share();
        state_ = RecordingState::Recording;

        std::lock_guard<std::mutex> join_lock(join_mutex_);
        capture_thread_ = std::thread(&Impl::capture_loop, this);
        LOG_AUDIO("Recording started");
        return Result<void>();
    }

    std::shared_future<CaptureOutcome> completion() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completion_;
    }

    Result<std::optional<AudioBuffer>> stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == RecordingState::Idle || state_ == RecordingState::Aborted || handed_off_) {
                return make_error(ErrorType::NoActiveRecording, "No active recording");
            }
            stop_requested_ = true;
        }

        join_capture();

        std::lock_guard<std::mutex> lock(mutex_);
        if (handed_off_ || state_ == RecordingState::Aborted) {
            // A concurrent stop() or abort() won the race
            return make_error(ErrorType::NoActiveRecording, "No active recording");
        }
        handed_off_ = true;
        state_ = RecordingState::Finished;

        std::ostringstream oss;
        oss << "Recording handed off: " << frames_ << " frames, " << buffer_.size() << " samples";
        LOG_AUDIO(oss.str());

        if (buffer_.empty()) {
            return std::optional<AudioBuffer>();
        }
        AudioBuffer out = std::move(buffer_);
        buffer_.clear();
        return std::optional<AudioBuffer>(std::move(out));
    }

    void abort() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == RecordingState::Idle || state_ == RecordingState::Aborted) return;
            stop_requested_ = true;
        }
        join_capture();

        std::lock_guard<std::mutex> lock(mutex_);
        buffer_.clear();
        state_ = RecordingState::Aborted;
        LOG_AUDIO("Recording aborted");
    }

    Result<void> reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == RecordingState::Recording) {
            return make_invalid_state_error("Cannot reset while recording");
        }
        {
            std::lock_guard<std::mutex> join_lock(join_mutex_);
            if (capture_thread_.joinable()) capture_thread_.join();
        }
        buffer_.clear();
        frames_ = 0;
        gate_.reset();
        handed_off_ = false;
        state_ = RecordingState::Idle;
        return Result<void>();
    }

    RecordingState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    size_t frames_captured() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_;
    }

private:
    void capture_loop() {
        CaptureOutcome outcome;
        AudioFrame frame;

        while (true) {
            if (stop_requested_) {
                outcome.reason = CaptureEnd::Stopped;
                break;
            }

            auto read = source_.read_frame(frame);
            if (!read) {
                // Fail fast: no retry, keep what was captured
                LOG_WARN("[Audio] Frame read failed: " + read.error().message);
                outcome.reason = CaptureEnd::ReadError;
                outcome.error = read.error().message;
                break;
            }

            GateSignal signal;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                buffer_.insert(buffer_.end(), frame.begin(), frame.end());
                frames_++;
                signal = gate_.observe(frame);
            }

            if (signal == GateSignal::EndOfUtterance) {
                outcome.reason = gate_.reason() == GateReason::MaxDuration
                                     ? CaptureEnd::MaxDuration
                                     : CaptureEnd::Silence;
                break;
            }
        }

        source_.close();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            outcome.frames = frames_;
            if (state_ == RecordingState::Recording) {
                state_ = RecordingState::Finished;
            }
        }

        std::ostringstream oss;
        oss << "Capture loop exited: reason=" << capture_end_name(outcome.reason)
            << " frames=" << outcome.frames;
        LOG_AUDIO(oss.str());

        promise_.set_value(outcome);
    }

    void join_capture() {
        std::lock_guard<std::mutex> join_lock(join_mutex_);
        if (capture_thread_.joinable()) {
            capture_thread_.join();
        }
    }

    audio::IFrameSource& source_;
    SilenceGate gate_;

    mutable std::mutex mutex_;
    RecordingState state_;
    AudioBuffer buffer_;
    size_t frames_ = 0;
    std::atomic<bool> stop_requested_;
    bool handed_off_;

    std::promise<CaptureOutcome> promise_;
    std::shared_future<CaptureOutcome> completion_;

    std::mutex join_mutex_;
    std::thread capture_thread_;
};

AudioSession::AudioSession(audio::IFrameSource& source, const AudioConfig& config)
    : pimpl_(std::make_unique<Impl>(source, config)) {}

AudioSession::~AudioSession() = default;

Result<void> AudioSession::start() {
    return pimpl_->start();
}

std::shared_future<CaptureOutcome> AudioSession::completion() const {
    return pimpl_->completion();
}

Result<std::optional<AudioBuffer>> AudioSession::stop() {
    return pimpl_->stop();
}

void AudioSession::abort() {
    pimpl_->abort();
}

Result<void> AudioSession::reset() {
    return pimpl_->reset();
}

RecordingState AudioSession::state() const {
    return pimpl_->state();
}

size_t AudioSession::frames_captured() const {
    return pimpl_->frames_captured();
}

} // namespace viva
