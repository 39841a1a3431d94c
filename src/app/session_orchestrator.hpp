// Copyright (c) 2025 Dualscribe
// Session Orchestrator - atomic recording lifecycle over N capture/recognition pipelines
//
// Each pipeline pairs one AudioSourceCapture with one
// StreamingRecognitionSession for the same StreamId. Frames and results
// travel through a single typed inbox drained by the orchestration loop,
// which is also the only writer of the TranscriptEngine during recording.

#pragma once

#include "app/transcript_engine.hpp"
#include "asr/recognition_backend.hpp"
#include "asr/streaming_recognition_session.hpp"
#include "audio/audio_source_capture.hpp"
#include "core/config.hpp"
#include "core/stream_id.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace app {

class SessionOrchestratorImpl;

struct RecordingOptions {
    std::string language;      ///< Empty = RecognitionConfig::language
    Metadata metadata;         ///< Copied into the transcript session
};

//==============================================================================
// Events
//==============================================================================

struct RecordingStarted {
    std::string session_id;
    std::vector<core::StreamId> streams;
};

struct RecordingStopped {
    std::optional<SessionSummary> summary;
};

struct StreamFault {
    core::StreamId stream = core::StreamId::Microphone;
    std::string message;
    bool fatal = false;        ///< No further reopen attempts
};

struct StreamRecovered {
    core::StreamId stream = core::StreamId::Microphone;
    int attempts = 0;
};

struct SourceActivity {
    core::StreamId stream = core::StreamId::Microphone;
    bool active = false;
};

using OrchestratorEvent = std::variant<RecordingStarted, RecordingStopped, StreamFault, StreamRecovered, SourceActivity>;
using OrchestratorEventCallback = std::function<void(const OrchestratorEvent&)>;

//==============================================================================
// Status
//==============================================================================

struct StreamStatus {
    core::StreamId stream = core::StreamId::Microphone;
    std::string device_id;
    asr::SessionState session_state = asr::SessionState::Idle;
    bool capture_active = false;
    size_t capture_dropped = 0;     ///< Frames dropped between device and loop
    size_t session_dropped = 0;     ///< Frames dropped before the recognizer
    int reopen_attempts = 0;
    bool failed = false;            ///< Gave up on this stream
};

struct OrchestratorStatus {
    bool recording = false;
    std::string session_id;
    std::vector<StreamStatus> streams;
    size_t inbox_dropped = 0;
};

/// One pipeline to build: which stream, which device.
struct PipelineSpec {
    core::StreamId stream = core::StreamId::Microphone;
    audio::CaptureSpec capture;
};

class SessionOrchestrator {
public:
    /// Pipelines come from the config: microphone always, system audio when
    /// AppConfig::system_device is set.
    SessionOrchestrator(const core::AppConfig& config,
                        std::shared_ptr<asr::IRecognitionBackend> backend,
                        audio::DeviceFactory device_factory = nullptr);

    SessionOrchestrator(const core::AppConfig& config,
                        std::vector<PipelineSpec> pipelines,
                        std::shared_ptr<asr::IRecognitionBackend> backend,
                        audio::DeviceFactory device_factory = nullptr);

    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    /// Opens every recognition session, then acquires every capture.
    /// Anything opened before a failure is rolled back.
    /// @return transcript session id (the current one if already recording)
    /// @throws core::RecordingStartError listing each failing stream
    std::string start_recording(const RecordingOptions& options = {});

    /// Tears everything down and seals the transcript session.
    /// @return nullopt when not recording
    std::optional<SessionSummary> stop_recording();

    /// @return session id when recording started, nullopt when it stopped
    std::optional<std::string> toggle_recording(const RecordingOptions& options = {});

    bool is_recording() const;
    OrchestratorStatus status() const;

    void subscribe(OrchestratorEventCallback callback);

    TranscriptEngine& engine();

    static std::vector<PipelineSpec> pipelines_from_config(const core::AppConfig& config);

private:
    std::unique_ptr<SessionOrchestratorImpl> impl_;
};

} // namespace app
