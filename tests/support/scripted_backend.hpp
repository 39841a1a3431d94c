// Recognizer stand-in for tests: scripted finals, injectable failures.
#pragma once
#include "asr/recognition_backend.hpp"
#include "core/stream_id.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace test_support {

class ScriptedBackend : public asr::IRecognitionBackend {
public:
    struct StreamScript {
        std::vector<std::string> finals;   // emitted in order
        size_t samples_per_final = 16000;  // one final per this many samples written
        int connect_delay_ms = 0;
        std::string flush_final;           // emitted by finish() when not empty
        std::string write_failure;         // write() throws std::runtime_error with this text
        std::string finish_failure;        // finish() throws std::runtime_error with this text
        int failing_connects = 0;          // next N connect() calls throw
        asr::RecognitionErrorKind failure_kind = asr::RecognitionErrorKind::Connectivity;
    };

    std::unique_ptr<asr::IRecognitionConnection> connect(
        core::StreamId stream,
        const asr::LanguageConfig& language,
        asr::RecognitionListener listener) override;

    std::string name() const override { return "scripted"; }

    void set_script(core::StreamId stream, StreamScript script);
    void fail_next_connects(core::StreamId stream, int count,
                            asr::RecognitionErrorKind kind = asr::RecognitionErrorKind::Connectivity);
    void set_connect_delay(core::StreamId stream, int ms);

    // Drives the listener of the latest connection, as the recognizer would.
    bool inject_final(core::StreamId stream, const std::string& text, double confidence, int64_t timestamp_ms);
    bool inject_interim(core::StreamId stream, const std::string& text, int64_t timestamp_ms);
    bool inject_error(core::StreamId stream, asr::RecognitionErrorKind kind, const std::string& message);

    int connect_calls(core::StreamId stream) const;
    int connections(core::StreamId stream) const;        // successful connects
    int finished(core::StreamId stream) const;
    size_t samples_written(core::StreamId stream) const;
    std::string last_language(core::StreamId stream) const;

    // Called by connections.
    void on_write(core::StreamId stream, const asr::RecognitionListener& listener, size_t samples);
    void on_finish(core::StreamId stream, const asr::RecognitionListener& listener);

private:
    struct StreamState {
        StreamScript script;
        int connect_calls = 0;
        int connections = 0;
        int finished = 0;
        size_t samples = 0;           // total across connections
        size_t samples_since_final = 0;
        size_t next_final = 0;
        std::string language;
        std::optional<asr::RecognitionListener> listener;
    };

    StreamState& state(core::StreamId stream) { return streams_[core::stream_index(stream)]; }
    const StreamState& state(core::StreamId stream) const { return streams_[core::stream_index(stream)]; }

    mutable std::mutex mutex_;
    std::array<StreamState, 2> streams_;
};

} // namespace test_support
