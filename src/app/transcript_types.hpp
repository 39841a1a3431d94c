// Copyright (c) 2025 Dualscribe
#pragma once
#include "core/stream_id.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace app {

enum class TranscriptKind {
    Interim,
    Final
};

struct Transcript {
    uint64_t id = 0;                  // monotonic within the process
    std::string session_id;
    core::StreamId stream = core::StreamId::Microphone;
    std::string speaker;              // "Me" / "Other"
    std::string text;                 // trimmed
    std::string tagged_text;          // "[Me] text", or text when tagging is off
    double confidence = 0.0;
    int64_t timestamp_ms = 0;
    TranscriptKind kind = TranscriptKind::Final;
};

struct InterimState {
    core::StreamId stream = core::StreamId::Microphone;
    std::string speaker;
    std::string text;
    int64_t timestamp_ms = 0;
};

using Metadata = std::map<std::string, std::string>;

struct Session {
    std::string id;                   // session_<startMs>_<random>
    int64_t start_ms = 0;
    std::optional<int64_t> end_ms;
    Metadata metadata;
};

struct SpeakerStats {
    std::string speaker;
    size_t transcript_count = 0;
    size_t word_count = 0;
};

struct SessionSummary {
    std::string session_id;
    int64_t start_ms = 0;
    std::optional<int64_t> end_ms;
    int64_t duration_ms = 0;
    size_t total_transcripts = 0;
    size_t total_words = 0;
    double average_confidence = 0.0;
    std::vector<SpeakerStats> speakers;
    std::string saved_path;           // empty when the final save failed
};

struct SearchOptions {
    std::optional<std::string> speaker;
    std::optional<std::pair<int64_t, int64_t>> date_range;   // inclusive, ms
    bool case_sensitive = false;
    size_t limit = 50;                // last `limit` hits
};

enum class ExportFormat {
    Json,
    Text,
    Csv,
    Subtitle
};

struct EngineStatus {
    bool has_active_session = false;
    std::string session_id;
    int64_t session_start_ms = 0;
    int64_t last_activity_ms = 0;
    size_t transcript_count = 0;
    size_t interim_count = 0;
    bool auto_save_enabled = false;
    size_t suppressed_count = 0;
    size_t retracted_count = 0;
};

// Consumer events

struct SessionStarted {
    std::string session_id;
    int64_t start_ms = 0;
};

struct SessionEnded {
    SessionSummary summary;
};

struct InterimTranscript {
    core::StreamId stream = core::StreamId::Microphone;
    std::string speaker;
    std::string text;
    int64_t timestamp_ms = 0;
};

struct FinalTranscript {
    Transcript transcript;
};

// A final already delivered was removed in favour of the preferred source.
struct TranscriptRetracted {
    uint64_t id = 0;
    uint64_t replaced_by = 0;
};

struct TranscriptsUpdated {
    std::vector<Transcript> recent;   // last 10
};

struct SessionSaved {
    std::string path;
};

struct PersistenceFailed {
    std::string message;
};

using TranscriptEvent = std::variant<
    SessionStarted,
    SessionEnded,
    InterimTranscript,
    FinalTranscript,
    TranscriptRetracted,
    TranscriptsUpdated,
    SessionSaved,
    PersistenceFailed>;

} // namespace app
