#include "stt_engine.h"
#include "audio/wav_io.h"
#include "logger.h"
#include "utils.h"
#include <whisper.h>
#include <mutex>
#include <sstream>
#include <vector>

namespace viva {

namespace {

std::vector<float> to_float_pcm(const AudioBuffer& samples) {
    std::vector<float> pcm(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        pcm[i] = static_cast<float>(samples[i]) / 32768.0f;
    }
    return pcm;
}

} // namespace

class WhisperTranscriber::Impl {
public:
    explicit Impl(const STTConfig& config) : config_(config) {
        if (config_.model_path.empty()) {
            LOG_STT("stt.model_path is empty, transcription disabled");
            return;
        }
        whisper_context_params context_params = whisper_context_default_params();
        context_params.use_gpu = config_.use_gpu;
        ctx_ = whisper_init_from_file_with_params(config_.model_path.c_str(), context_params);
        LOG_STT(ctx_ ? "Loaded " + config_.model_path : "Cannot load " + config_.model_path);
    }

    ~Impl() {
        if (ctx_) whisper_free(ctx_);
    }

    Result<Transcript> transcribe(const AudioBuffer& audio, const AudioFormat& format) {
        if (!ctx_) return make_invalid_state_error("Whisper model not loaded");
        if (audio.empty()) return Transcript();

        auto started = Clock::now();
        std::vector<float> pcm = format.sample_rate == WHISPER_SAMPLE_RATE
            ? to_float_pcm(audio)
            : to_float_pcm(audio::resample(audio, format.sample_rate, WHISPER_SAMPLE_RATE));

        std::lock_guard<std::mutex> lock(mutex_);
        whisper_full_params params = decode_params();
        int status = whisper_full(ctx_, params, pcm.data(), static_cast<int>(pcm.size()));
        if (status != 0) {
            LOG_STT("whisper_full returned " + std::to_string(status));
            return make_resource_error("whisper_full returned " + std::to_string(status));
        }

        Transcript transcript = collect_segments();
        transcript.processing_ms = ms_since(started);

        std::ostringstream line;
        line << pcm.size() << " samples -> \"" << utils::preview(transcript.text) << "\" ("
             << transcript.processing_ms << "ms, confidence " << transcript.confidence << ")";
        LOG_STT(line.str());
        return transcript;
    }

    bool is_ready() const { return ctx_ != nullptr; }

    void set_initial_prompt(const std::string& prompt) {
        std::lock_guard<std::mutex> lock(mutex_);
        initial_prompt_ = prompt;
    }

private:
    // One utterance per call: greedy, single segment, no carried-over context
    whisper_full_params decode_params() const {
        whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.print_timestamps = false;
        params.translate = false;
        params.no_context = true;
        params.single_segment = true;
        params.language = config_.language.c_str();
        params.n_threads = config_.threads > 0 ? config_.threads : 4;
        if (!initial_prompt_.empty()) params.initial_prompt = initial_prompt_.c_str();
        return params;
    }

    // Mean token probability across all segments is the confidence
    Transcript collect_segments() const {
        Transcript transcript;
        float probability_sum = 0.0f;
        for (int segment = 0; segment < whisper_full_n_segments(ctx_); ++segment) {
            transcript.text += whisper_full_get_segment_text(ctx_, segment);
            const int tokens = whisper_full_n_tokens(ctx_, segment);
            for (int token = 0; token < tokens; ++token) {
                probability_sum += whisper_full_get_token_p(ctx_, segment, token);
            }
            transcript.token_count += tokens;
        }

        utils::trim(transcript.text);
        if (transcript.text == config_.blank_sentinel) transcript.text.clear();
        if (transcript.token_count > 0) {
            transcript.confidence = probability_sum / transcript.token_count;
        }
        return transcript;
    }

    STTConfig config_;
    whisper_context* ctx_ = nullptr;
    std::mutex mutex_;
    std::string initial_prompt_;
};

WhisperTranscriber::WhisperTranscriber(const STTConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

WhisperTranscriber::~WhisperTranscriber() = default;

Result<Transcript> WhisperTranscriber::transcribe(const AudioBuffer& audio, const AudioFormat& format) {
    return pimpl_->transcribe(audio, format);
}

bool WhisperTranscriber::is_ready() const {
    return pimpl_->is_ready();
}

void WhisperTranscriber::set_initial_prompt(const std::string& prompt) {
    pimpl_->set_initial_prompt(prompt);
}

} // namespace viva
