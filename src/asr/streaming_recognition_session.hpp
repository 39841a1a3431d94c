#pragma once
#include "asr/recognition_backend.hpp"
#include "audio/audio_source_capture.hpp"
#include "core/config.hpp"
#include "core/message_channel.hpp"
#include "core/stream_id.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace asr {

enum class SessionState {
    Idle,
    Opening,
    Active,
    Closing
};

const char* to_string(SessionState state);

enum class ResultKind {
    Interim,
    Final
};

struct RecognitionResult {
    core::StreamId stream = core::StreamId::Microphone;
    ResultKind kind = ResultKind::Final;
    std::string text;
    double confidence = 0.0;    // [0,1]; 0 for interims
    int64_t timestamp_ms = 0;   // non-decreasing per stream and kind
};

struct SessionError {
    core::StreamId stream = core::StreamId::Microphone;
    RecognitionErrorKind kind = RecognitionErrorKind::Protocol;
    std::string message;
    bool fatal = false;         // authentication failures are never retried
};

/**
 * @brief One recognizer connection bound to one logical stream
 *
 * Idle -> Opening -> Active -> Closing -> Idle. Only Active accepts frames.
 *
 * push_frame() never blocks: frames go into a bounded send queue that a
 * writer thread drains into the connection. When the recognizer cannot keep
 * up the oldest queued frames are dropped and counted.
 *
 * An error reported while Active moves the session to Idle and emits a
 * SessionError. The dead connection is torn down by the next open()/close()
 * or the destructor, never from the thread that reported the error.
 */
class StreamingRecognitionSession {
public:
    using ResultCallback = std::function<void(const RecognitionResult&)>;
    using ErrorCallback = std::function<void(const SessionError&)>;

    StreamingRecognitionSession(std::shared_ptr<IRecognitionBackend> backend, const core::RecognitionConfig& config);
    ~StreamingRecognitionSession();

    StreamingRecognitionSession(const StreamingRecognitionSession&) = delete;
    StreamingRecognitionSession& operator=(const StreamingRecognitionSession&) = delete;

    /// @throws core::AlreadyOpenError unless Idle
    /// @throws core::AuthenticationError, core::ConnectivityError (including open timeout)
    void open(core::StreamId stream, const LanguageConfig& language);

    /// @return false if not Active or bound to another stream
    bool push_frame(core::StreamId stream, const audio::AudioFrame& frame);

    /// Drains queued audio, waits for in-flight finals, releases the connection.
    void close(core::StreamId stream);

    void on_result(ResultCallback callback);
    void on_error(ErrorCallback callback);

    SessionState state() const;
    std::optional<core::StreamId> stream() const;
    size_t dropped_frames() const { return send_queue_.dropped_count(); }

private:
    struct ListenerRelay;

    RecognitionListener make_listener(const std::shared_ptr<ListenerRelay>& relay);
    void handle_result(uint64_t generation, ResultKind kind, const std::string& text, double confidence, int64_t timestamp_ms);
    void handle_error(uint64_t generation, RecognitionErrorKind kind, const std::string& message);
    void writer_loop(IRecognitionConnection* connection, uint64_t generation);
    void reap_dead_connection();
    static void detach(const std::shared_ptr<ListenerRelay>& relay);

    std::shared_ptr<IRecognitionBackend> backend_;
    const core::RecognitionConfig config_;

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Idle;
    std::optional<core::StreamId> stream_;
    uint64_t generation_ = 0;
    std::unique_ptr<IRecognitionConnection> connection_;
    std::shared_ptr<ListenerRelay> relay_;
    std::thread writer_thread_;
    bool interim_enabled_ = true;
    int64_t last_interim_ts_ = 0;
    int64_t last_final_ts_ = 0;
    size_t last_logged_drops_ = 0;

    core::MessageChannel<std::vector<int16_t>> send_queue_;

    std::mutex callbacks_mutex_;
    std::vector<ResultCallback> result_callbacks_;
    std::vector<ErrorCallback> error_callbacks_;
};

} // namespace asr
