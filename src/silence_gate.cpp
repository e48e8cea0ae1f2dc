#include "silence_gate.h"
#include "logger.h"
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace viva {

const char* gate_reason_name(GateReason reason) {
    switch (reason) {
        case GateReason::None: return "none";
        case GateReason::Silence: return "silence";
        case GateReason::MaxDuration: return "max_duration";
    }
    return "none";
}

class SilenceGate::Impl {
public:
    explicit Impl(const AudioConfig& config)
        : silent_frames_(0),
          frames_observed_(0),
          reason_(GateReason::None) {
        int sample_rate = config.sample_rate > 0 ? config.sample_rate : DEFAULT_SAMPLE_RATE;
        int chunk_size = config.chunk_size > 0 ? config.chunk_size : DEFAULT_CHUNK_SIZE;
        // Integer floor of seconds * frames-per-second
        silence_threshold_frames_ = static_cast<int>(config.silence_duration_s * sample_rate / chunk_size);
        max_frames_ = static_cast<int>(config.max_duration_s * sample_rate / chunk_size);

        std::ostringstream oss;
        oss << "silence_threshold_frames=" << silence_threshold_frames_
            << " max_frames=" << max_frames_
            << " amplitude_threshold=" << SILENCE_AMPLITUDE_THRESHOLD;
        LOG_GATE(oss.str());
    }

    GateSignal observe(const AudioFrame& frame) {
        if (reason_ != GateReason::None) {
            return GateSignal::EndOfUtterance;
        }

        frames_observed_++;
        int peak = peak_amplitude(frame);
        if (peak < SILENCE_AMPLITUDE_THRESHOLD) {
            silent_frames_++;
        } else {
            silent_frames_ = 0;
        }

        if (silent_frames_ > 0 && silent_frames_ >= std::max(1, silence_threshold_frames_)) {
            reason_ = GateReason::Silence;
        } else if (frames_observed_ >= std::max(1, max_frames_)) {
            reason_ = GateReason::MaxDuration;
        }

        if (reason_ != GateReason::None) {
            std::ostringstream oss;
            oss << "EndOfUtterance reason=" << gate_reason_name(reason_)
                << " frames=" << frames_observed_ << " silent_frames=" << silent_frames_;
            LOG_GATE(oss.str());
            return GateSignal::EndOfUtterance;
        }
        return GateSignal::Continue;
    }

    GateReason reason() const { return reason_; }
    int silent_frames() const { return silent_frames_; }
    int frames_observed() const { return frames_observed_; }
    int silence_threshold_frames() const { return silence_threshold_frames_; }
    int max_frames() const { return max_frames_; }

    void reset() {
        silent_frames_ = 0;
        frames_observed_ = 0;
        reason_ = GateReason::None;
    }

private:
    int silence_threshold_frames_;
    int max_frames_;
    int silent_frames_;
    int frames_observed_;
    GateReason reason_;
};

SilenceGate::SilenceGate(const AudioConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

SilenceGate::~SilenceGate() = default;

GateSignal SilenceGate::observe(const AudioFrame& frame) {
    return pimpl_->observe(frame);
}

GateReason SilenceGate::reason() const {
    return pimpl_->reason();
}

int SilenceGate::silent_frames() const {
    return pimpl_->silent_frames();
}

int SilenceGate::frames_observed() const {
    return pimpl_->frames_observed();
}

int SilenceGate::silence_threshold_frames() const {
    return pimpl_->silence_threshold_frames();
}

int SilenceGate::max_frames() const {
    return pimpl_->max_frames();
}

void SilenceGate::reset() {
    pimpl_->reset();
}

int SilenceGate::peak_amplitude(const AudioFrame& frame) {
    int peak = 0;
    for (Sample s : frame) {
        int a = std::abs(static_cast<int>(s));
        if (a > peak) peak = a;
    }
    return peak;
}

} // namespace viva
