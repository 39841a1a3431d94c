// Copyright (c) 2025 Dualscribe
// Transcript Engine - deduplicated transcript log and session lifecycle
//
// Owns the authoritative, time-ordered transcript of a recording session.
// Final results from both streams are checked against recent entries from
// the other stream; echoes of the same utterance are suppressed or replaced
// according to the preferred source.

#pragma once

#include "app/transcript_types.hpp"
#include "core/config.hpp"
#include "core/stream_id.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace app {

class TranscriptEngineImpl;

using TranscriptEventCallback = std::function<void(const TranscriptEvent&)>;

/// Thread-safety: all methods may be called from any thread. Events are
/// delivered on the calling thread (or the auto-save thread for
/// SessionSaved/PersistenceFailed) after internal locks are released.
class TranscriptEngine {
public:
    explicit TranscriptEngine(const core::TranscriptConfig& config);
    ~TranscriptEngine();

    TranscriptEngine(const TranscriptEngine&) = delete;
    TranscriptEngine& operator=(const TranscriptEngine&) = delete;

    //==========================================================================
    // Session lifecycle
    //==========================================================================

    /// Seals any active session, clears the log and interim state.
    /// @return new session id
    std::string start_session(const Metadata& metadata = {});

    /// Seals, persists and summarizes the active session.
    /// @return nullopt when no session is active
    std::optional<SessionSummary> end_session();

    bool has_active_session() const;
    std::optional<Session> current_session() const;

    //==========================================================================
    // Results
    //==========================================================================

    /// Replaces the live preview for `stream`. Empty text is ignored.
    void add_interim(core::StreamId stream, const std::string& text, int64_t timestamp_ms);

    /// Runs duplicate suppression and stores the result.
    /// @return the stored transcript, or nullopt if ignored or suppressed
    std::optional<Transcript> add_final(core::StreamId stream, const std::string& text,
                                        double confidence, int64_t timestamp_ms);

    //==========================================================================
    // Queries
    //==========================================================================

    std::vector<Transcript> recent(size_t n = 10) const;
    std::vector<Transcript> all() const;
    std::vector<InterimState> interim_states() const;
    std::vector<Transcript> search(const std::string& query, const SearchOptions& options = {}) const;
    std::string export_transcripts(ExportFormat format) const;
    SessionSummary summary() const;
    EngineStatus status() const;

    //==========================================================================
    // Runtime tuning
    //==========================================================================

    void set_duplicate_filtering(bool enabled);
    void set_similarity_threshold(double threshold);   // clamped to [0,1]
    void set_preferred_source(std::optional<core::StreamId> source);
    core::TranscriptConfig config() const;

    /// Drops all transcripts and interim state; the session stays active.
    void clear();

    /// Writes the active session now.
    /// @return path, or nullopt if there was nothing to save or the write failed
    std::optional<std::string> save_now();

    //==========================================================================
    // Events
    //==========================================================================

    void subscribe(TranscriptEventCallback callback);
    void clear_subscriptions();

private:
    std::unique_ptr<TranscriptEngineImpl> impl_;
};

} // namespace app
