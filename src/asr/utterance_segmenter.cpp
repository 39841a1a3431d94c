#include "asr/utterance_segmenter.hpp"
#include "audio/pcm_convert.hpp"

#include <algorithm>

namespace asr {

namespace {
size_t ms_to_samples(int ms, int sample_rate) {
    return static_cast<size_t>(std::max(0, ms)) * static_cast<size_t>(sample_rate) / 1000;
}
} // namespace

UtteranceSegmenter::UtteranceSegmenter(const core::RecognitionConfig& config, int sample_rate)
    : threshold_dbfs_(config.vad_threshold_dbfs)
    , silence_samples_limit_(ms_to_samples(config.silence_ms, sample_rate))
    , max_samples_(std::max<size_t>(1, ms_to_samples(config.max_utterance_ms, sample_rate)))
    , interim_samples_(ms_to_samples(config.interim_interval_ms, sample_rate)) {}

UtteranceSegmenter::Action UtteranceSegmenter::feed(const std::vector<int16_t>& pcm, int64_t received_ms) {
    if (pcm.empty()) return Action::None;

    const bool voiced = audio::dbfs(pcm.data(), pcm.size()) > threshold_dbfs_;
    if (!in_utterance_) {
        if (!voiced) return Action::None;
        in_utterance_ = true;
        start_ms_ = received_ms;
        trailing_silence_ = 0;
        since_interim_ = 0;
        buffer_.clear();
    }

    buffer_.insert(buffer_.end(), pcm.begin(), pcm.end());
    since_interim_ += pcm.size();
    trailing_silence_ = voiced ? 0 : trailing_silence_ + pcm.size();

    if (trailing_silence_ >= silence_samples_limit_ || buffer_.size() >= max_samples_) {
        return Action::Final;
    }
    if (interim_samples_ > 0 && since_interim_ >= interim_samples_) {
        since_interim_ = 0;
        return Action::Interim;
    }
    return Action::None;
}

Utterance UtteranceSegmenter::take() {
    Utterance u;
    u.pcm = std::move(buffer_);
    u.start_ms = start_ms_;
    buffer_.clear();
    in_utterance_ = false;
    trailing_silence_ = 0;
    since_interim_ = 0;
    return u;
}

} // namespace asr
