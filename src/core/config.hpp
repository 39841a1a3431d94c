#pragma once
#include "core/stream_id.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace core {

struct CaptureConfig {
    int max_queue_frames = 64;          // ~1.3s of 20ms frames before the oldest is dropped
    int device_buffer_ms = 20;          // period requested from the device
    bool synthetic_loop = false;        // loop file-backed sources
};

struct RecognitionConfig {
    std::string language = "en-US";
    bool enable_interim_results = true;
    int open_timeout_ms = 5000;
    int send_queue_frames = 200;        // frames buffered between push_frame and the connection

    // whisper.cpp recognizer
    std::string whisper_model = "base.en";
    int whisper_threads = 0;            // 0 = auto
    float vad_threshold_dbfs = -40.0f;
    int silence_ms = 700;               // silence that closes an utterance
    int max_utterance_ms = 15000;
    int interim_interval_ms = 1000;
};

struct OrchestratorConfig {
    int stop_grace_ms = 1000;           // wait for in-flight finals before sealing
    int max_reopen_attempts = 3;
    int reopen_backoff_ms = 500;
    int reopen_backoff_max_ms = 8000;
    int inbox_max_frames = 400;
};

struct TranscriptConfig {
    size_t max_buffer_size = 1000;
    bool enable_speaker_tagging = true;
    bool filter_duplicates = true;
    int64_t duplicate_time_window_ms = 3000;
    double similarity_threshold = 0.8;
    size_t similarity_scan_depth = 10;
    double containment_bonus = 0.3;
    std::optional<StreamId> preferred_source = StreamId::SystemAudio;
    bool suppress_non_preferred_when_active = true;
    bool auto_save = true;
    int auto_save_interval_ms = 30000;
    std::string save_directory = "./transcripts";
    int64_t subtitle_default_duration_ms = 3000;
};

struct AppConfig {
    std::string microphone_device = "default";
    std::string system_device;          // empty = microphone-only capture
    std::string log_level = "info";

    CaptureConfig capture;
    RecognitionConfig recognition;
    OrchestratorConfig orchestrator;
    TranscriptConfig transcript;

    bool dual_capture() const { return !system_device.empty(); }
};

/// Reads a JSON config file. Keys that are absent keep their defaults.
/// @throws ConfigError when the file cannot be read, parsed, or has wrong types
AppConfig load_config(const std::string& path);

AppConfig config_from_json(const nlohmann::json& j);
nlohmann::json config_to_json(const AppConfig& cfg);

} // namespace core
