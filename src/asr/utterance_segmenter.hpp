#pragma once
#include "core/config.hpp"

#include <cstdint>
#include <vector>

namespace asr {

struct Utterance {
    std::vector<int16_t> pcm;   // 16 kHz mono
    int64_t start_ms = 0;       // wall clock of the first voiced chunk
};

// Energy-based endpointing for recognizers that decode whole utterances.
// An utterance opens on the first chunk louder than vad_threshold_dbfs and
// closes after silence_ms of quieter audio or at max_utterance_ms.
class UtteranceSegmenter {
public:
    enum class Action {
        None,
        Interim,   // interim_interval_ms of new audio since the last decode
        Final      // utterance complete; call take()
    };

    explicit UtteranceSegmenter(const core::RecognitionConfig& config, int sample_rate = 16000);

    Action feed(const std::vector<int16_t>& pcm, int64_t received_ms);

    bool in_utterance() const { return in_utterance_; }
    const std::vector<int16_t>& current() const { return buffer_; }
    int64_t current_start_ms() const { return start_ms_; }

    // Returns the buffered utterance and resets.
    Utterance take();

private:
    float threshold_dbfs_;
    size_t silence_samples_limit_;
    size_t max_samples_;
    size_t interim_samples_;

    bool in_utterance_ = false;
    std::vector<int16_t> buffer_;
    int64_t start_ms_ = 0;
    size_t trailing_silence_ = 0;
    size_t since_interim_ = 0;
};

} // namespace asr
