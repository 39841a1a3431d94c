#include "asr/whisper_recognition_backend.hpp"
#include "asr/utterance_segmenter.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "core/message_channel.hpp"
#include "core/time_utils.hpp"

#include "whisper.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <thread>
#include <vector>

namespace asr {

struct WhisperRecognitionBackend::Model {
    whisper_context* ctx = nullptr;
    ~Model() {
        if (ctx) whisper_free(ctx);
    }
};

namespace {

// whisper/ggml chatter goes through our logger; info and debug only at debug level.
void whisper_log_to_core(ggml_log_level level, const char* text, void*) {
    if (!text) return;
    std::string msg(text);
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) msg.pop_back();
    if (msg.empty()) return;
    switch (level) {
        case GGML_LOG_LEVEL_ERROR: core::log_error("[whisper] " + msg); break;
        case GGML_LOG_LEVEL_WARN:  core::log_warn("[whisper] " + msg); break;
        default:                   core::log_debug("[whisper] " + msg); break;
    }
}

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

// "[BLANK_AUDIO]", "[ Silence ]", "(music)" ...
bool is_non_speech(const std::string& s) {
    if (s.size() < 2) return false;
    return (s.front() == '[' && s.back() == ']') || (s.front() == '(' && s.back() == ')');
}

// whisper wants ISO-639-1 ("en"), we carry BCP-47 ("en-US").
std::string whisper_language(const std::string& tag) {
    if (tag.empty()) return "en";
    auto dash = tag.find_first_of("-_");
    std::string code = tag.substr(0, dash);
    std::transform(code.begin(), code.end(), code.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return code;
}

int decode_threads(int configured) {
    if (configured > 0) return configured;
    // Two streams decode concurrently; give each half the cores.
    return static_cast<int>(std::max(1u, std::thread::hardware_concurrency() / 2));
}

// Shortest utterance worth decoding (whisper hallucinates on slivers).
constexpr size_t kMinDecodeSamples = 16000 * 3 / 10;

class WhisperConnection : public IRecognitionConnection {
public:
    WhisperConnection(std::shared_ptr<WhisperRecognitionBackend::Model> model,
                      whisper_state* state,
                      core::StreamId stream,
                      const LanguageConfig& language,
                      const core::RecognitionConfig& config,
                      RecognitionListener listener)
        : model_(std::move(model))
        , state_(state)
        , stream_(stream)
        , language_(language)
        , whisper_lang_(whisper_language(language.language))
        , n_threads_(decode_threads(config.whisper_threads))
        , listener_(std::move(listener))
        , segmenter_(config)
        , inbox_(static_cast<size_t>(std::max(1, config.send_queue_frames))) {
        worker_ = std::thread(&WhisperConnection::run, this);
    }

    ~WhisperConnection() override {
        inbox_.close();
        if (worker_.joinable()) worker_.join();
        whisper_free_state(state_);
    }

    void write(const std::vector<int16_t>& pcm) override {
        if (!inbox_.push(Chunk{pcm, core::now_ms()})) {
            throw core::ConnectivityError("whisper stream for " + std::string(core::to_string(stream_)) + " already finished");
        }
    }

    void finish() override {
        inbox_.close();
        if (worker_.joinable()) worker_.join();
    }

private:
    struct Chunk {
        std::vector<int16_t> pcm;
        int64_t received_ms = 0;
    };

    struct Decoded {
        std::string text;
        double confidence = 0.0;
    };

    void run() {
        Chunk chunk;
        while (inbox_.pop(chunk)) {
            switch (segmenter_.feed(chunk.pcm, chunk.received_ms)) {
                case UtteranceSegmenter::Action::Interim:
                    if (language_.enable_interim_results) emit_interim();
                    break;
                case UtteranceSegmenter::Action::Final:
                    emit_final();
                    break;
                case UtteranceSegmenter::Action::None:
                    break;
            }
        }
        if (segmenter_.in_utterance()) {
            emit_final();
        }
    }

    void emit_interim() {
        Decoded d;
        if (decode(segmenter_.current(), true, d) && !d.text.empty() && listener_.on_interim) {
            listener_.on_interim(d.text, segmenter_.current_start_ms());
        }
    }

    void emit_final() {
        Utterance u = segmenter_.take();
        Decoded d;
        if (decode(u.pcm, false, d) && !d.text.empty() && listener_.on_final) {
            listener_.on_final(d.text, d.confidence, u.start_ms);
        }
    }

    bool decode(const std::vector<int16_t>& pcm, bool single_segment, Decoded& out) {
        if (pcm.size() < kMinDecodeSamples) return true;

        whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        wparams.print_realtime   = false;
        wparams.print_progress   = false;
        wparams.print_timestamps = false;
        wparams.print_special    = false;
        wparams.translate        = false;
        wparams.language         = whisper_lang_.c_str();
        wparams.detect_language  = false;
        wparams.n_threads        = n_threads_;
        wparams.no_context       = true;
        wparams.single_segment   = single_segment;
        wparams.greedy.best_of   = 1;

        std::vector<float> pcm_f32;
        pcm_f32.reserve(pcm.size());
        constexpr float scale = 1.0f / 32768.0f;
        for (int16_t s : pcm) {
            pcm_f32.push_back(static_cast<float>(s) * scale);
        }

        int ret = whisper_full_with_state(model_->ctx, state_, wparams, pcm_f32.data(), static_cast<int>(pcm_f32.size()));
        if (ret != 0) {
            if (listener_.on_error) {
                listener_.on_error(RecognitionErrorKind::Protocol, "whisper_full failed, ret=" + std::to_string(ret));
            }
            return false;
        }

        const whisper_token eot = whisper_token_eot(model_->ctx);
        double p_sum = 0.0;
        int p_count = 0;
        std::string text;
        const int n_segments = whisper_full_n_segments_from_state(state_);
        for (int i = 0; i < n_segments; ++i) {
            const char* raw = whisper_full_get_segment_text_from_state(state_, i);
            std::string seg = trim(raw ? raw : "");
            if (seg.empty() || is_non_speech(seg)) continue;
            if (!text.empty()) text += ' ';
            text += seg;

            const int n_tokens = whisper_full_n_tokens_from_state(state_, i);
            for (int j = 0; j < n_tokens; ++j) {
                whisper_token_data td = whisper_full_get_token_data_from_state(state_, i, j);
                if (td.id >= eot) continue;  // special tokens
                p_sum += td.p;
                p_count++;
            }
        }
        out.text = text;
        out.confidence = p_count > 0 ? p_sum / p_count : 0.0;
        return true;
    }

    std::shared_ptr<WhisperRecognitionBackend::Model> model_;
    whisper_state* state_;
    const core::StreamId stream_;
    const LanguageConfig language_;
    const std::string whisper_lang_;
    const int n_threads_;
    RecognitionListener listener_;
    UtteranceSegmenter segmenter_;
    core::MessageChannel<Chunk> inbox_;
    std::thread worker_;
};

} // namespace

WhisperRecognitionBackend::WhisperRecognitionBackend(const core::RecognitionConfig& config)
    : config_(config) {}

WhisperRecognitionBackend::~WhisperRecognitionBackend() = default;

std::string WhisperRecognitionBackend::resolve_model_path(const std::string& model_name) {
    auto exists = [](const std::string& p) { return std::filesystem::exists(std::filesystem::u8path(p)); };
    const bool has_ext = (model_name.find(".gguf") != std::string::npos) || (model_name.find(".bin") != std::string::npos);
    if (has_ext || exists(model_name)) {
        return model_name;
    }
    const std::vector<std::string> candidates = {
        "models/" + model_name + ".gguf",
        "models/ggml-" + model_name + "-q5_1.gguf",
        "models/ggml-" + model_name + ".gguf",
        "models/" + model_name + ".bin",
        "models/ggml-" + model_name + ".bin",
        "models/ggml-" + model_name + "-q5_1.bin",
    };
    for (const auto& c : candidates) {
        if (exists(c)) return c;
    }
    return "models/ggml-" + model_name + ".bin";  // may fail; reported by load
}

std::shared_ptr<WhisperRecognitionBackend::Model> WhisperRecognitionBackend::load_model() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (model_) return model_;

    const std::string path = resolve_model_path(config_.whisper_model);
    whisper_log_set(whisper_log_to_core, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;
    core::log_info("[whisper] init from: " + path);
    auto model = std::make_shared<Model>();
    model->ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!model->ctx) {
        throw core::ConnectivityError("whisper: cannot load model '" + path + "'");
    }
    core::log_debug(std::string("[whisper] system: ") + whisper_print_system_info());
    model_ = model;
    return model_;
}

std::unique_ptr<IRecognitionConnection> WhisperRecognitionBackend::connect(
    core::StreamId stream,
    const LanguageConfig& language,
    RecognitionListener listener) {
    auto model = load_model();
    whisper_state* state = whisper_init_state(model->ctx);
    if (!state) {
        throw core::ConnectivityError("whisper: failed to allocate decoder state");
    }
    return std::make_unique<WhisperConnection>(model, state, stream, language, config_, std::move(listener));
}

} // namespace asr
