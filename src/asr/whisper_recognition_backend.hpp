#pragma once
#include "asr/recognition_backend.hpp"
#include "core/config.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace asr {

/**
 * @brief Local recognizer backed by whisper.cpp
 *
 * One model context is loaded on the first connect() and shared by every
 * connection; each connection owns its own whisper_state and decode thread.
 * Audio is endpointed by energy (UtteranceSegmenter), interims are produced by
 * re-decoding the open utterance, finals when the utterance closes.
 */
class WhisperRecognitionBackend : public IRecognitionBackend {
public:
    explicit WhisperRecognitionBackend(const core::RecognitionConfig& config);
    ~WhisperRecognitionBackend() override;

    /// @throws core::ConnectivityError when the model cannot be loaded
    std::unique_ptr<IRecognitionConnection> connect(
        core::StreamId stream,
        const LanguageConfig& language,
        RecognitionListener listener) override;

    std::string name() const override { return "whisper"; }

    // "base.en" -> models/ggml-base.en.bin (or one of the other usual layouts)
    static std::string resolve_model_path(const std::string& model_name);

    struct Model;

private:
    std::shared_ptr<Model> load_model();

    core::RecognitionConfig config_;
    std::mutex mutex_;
    std::shared_ptr<Model> model_;
};

} // namespace asr
