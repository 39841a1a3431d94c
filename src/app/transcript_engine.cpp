// Copyright (c) 2025 Dualscribe
// Transcript Engine - Implementation

#include "app/transcript_engine.hpp"
#include "app/session_store.hpp"
#include "app/text_similarity.hpp"
#include "app/transcript_export.hpp"
#include "app/transcript_json.hpp"
#include "app/transcript_log.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <random>
#include <thread>

namespace app {

namespace {

constexpr size_t kRollingUpdateSize = 10;

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n\f\v");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(a, b - a + 1);
}

std::string ascii_lower(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

std::string make_session_id(int64_t start_ms) {
    static const char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::string suffix;
    for (int i = 0; i < 10; ++i) {
        suffix += kDigits[rng() % 36];
    }
    return "session_" + std::to_string(start_ms) + "_" + suffix;
}

std::string tagged(const std::string& speaker, const std::string& text, bool tagging) {
    return tagging ? "[" + speaker + "] " + text : text;
}

} // namespace

//==============================================================================
// Implementation Class (PIMPL Pattern)
//==============================================================================

class TranscriptEngineImpl {
public:
    explicit TranscriptEngineImpl(const core::TranscriptConfig& config)
        : config_(config)
        , log_(config.max_buffer_size)
        , store_(config.save_directory) {}

    ~TranscriptEngineImpl() {
        stop_autosave();
    }

    std::string start_session(const Metadata& metadata);
    std::optional<SessionSummary> end_session();
    bool has_active_session() const;
    std::optional<Session> current_session() const;

    void add_interim(core::StreamId stream, const std::string& text, int64_t timestamp_ms);
    std::optional<Transcript> add_final(core::StreamId stream, const std::string& text,
                                        double confidence, int64_t timestamp_ms);

    std::vector<Transcript> recent(size_t n) const;
    std::vector<Transcript> all() const;
    std::vector<InterimState> interim_states() const;
    std::vector<Transcript> search(const std::string& query, const SearchOptions& options) const;
    std::string export_transcripts(ExportFormat format) const;
    SessionSummary summary() const;
    EngineStatus status() const;

    void set_duplicate_filtering(bool enabled);
    void set_similarity_threshold(double threshold);
    void set_preferred_source(std::optional<core::StreamId> source);
    core::TranscriptConfig config() const;
    void clear();
    std::optional<std::string> save_now();

    void subscribe(TranscriptEventCallback callback);
    void clear_subscriptions();

private:
    struct DedupVerdict {
        bool suppress = false;
        std::optional<uint64_t> retract;   // stored entry to replace
        std::string reason;
    };

    struct Snapshot {
        Session session;
        std::vector<Transcript> transcripts;
        SessionSummary summary;
    };

    DedupVerdict check_duplicate_locked(const Transcript& candidate) const;
    SessionSummary compute_summary_locked(const std::optional<Session>& session) const;
    std::optional<std::string> persist(const Snapshot& snapshot, std::vector<TranscriptEvent>& events);
    std::optional<std::string> save_active(bool require_transcripts, std::vector<TranscriptEvent>& events);
    void emit(const std::vector<TranscriptEvent>& events);

    void start_autosave();
    void stop_autosave();
    void autosave_loop();

    // State
    mutable std::mutex mutex_;
    core::TranscriptConfig config_;
    TranscriptLog log_;
    std::optional<Session> session_;
    std::optional<Session> last_session_;    // sealed; keeps the log queryable
    std::array<std::optional<InterimState>, 2> interims_;
    uint64_t next_id_ = 1;
    int64_t last_activity_ms_ = 0;
    size_t suppressed_count_ = 0;
    size_t retracted_count_ = 0;

    // Persistence
    SessionStore store_;
    std::mutex save_mutex_;

    // Auto-save
    mutable std::mutex autosave_mutex_;
    std::condition_variable autosave_cv_;
    bool autosave_stop_ = true;
    std::thread autosave_thread_;

    // Callbacks
    std::mutex callbacks_mutex_;
    std::vector<TranscriptEventCallback> callbacks_;
};

//==============================================================================
// Session Lifecycle
//==============================================================================

std::string TranscriptEngineImpl::start_session(const Metadata& metadata) {
    if (has_active_session()) {
        core::log_info("[transcript] sealing previous session before starting a new one");
        end_session();
    }

    std::vector<TranscriptEvent> events;
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Session s;
        s.start_ms = core::now_ms();
        s.id = make_session_id(s.start_ms);
        s.metadata = metadata;
        session_ = s;
        last_session_.reset();
        log_.clear();
        interims_ = {};
        suppressed_count_ = 0;
        retracted_count_ = 0;
        last_activity_ms_ = s.start_ms;
        id = s.id;
        events.push_back(SessionStarted{s.id, s.start_ms});
    }
    start_autosave();
    core::log_info("[transcript] session started: " + id);
    emit(events);
    return id;
}

std::optional<SessionSummary> TranscriptEngineImpl::end_session() {
    Snapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_) {
            return std::nullopt;
        }
        session_->end_ms = core::now_ms();
        snapshot.session = *session_;
        snapshot.transcripts = log_.all();
        snapshot.summary = compute_summary_locked(session_);
        last_session_ = session_;
        session_.reset();
        interims_ = {};
    }
    stop_autosave();

    std::vector<TranscriptEvent> events;
    if (auto path = persist(snapshot, events)) {
        snapshot.summary.saved_path = *path;
    }
    events.push_back(SessionEnded{snapshot.summary});
    core::log_info("[transcript] session ended: " + snapshot.session.id + " (" +
                   std::to_string(snapshot.summary.total_transcripts) + " transcripts, " +
                   std::to_string(snapshot.summary.duration_ms) + " ms)");
    emit(events);
    return snapshot.summary;
}

bool TranscriptEngineImpl::has_active_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.has_value();
}

std::optional<Session> TranscriptEngineImpl::current_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

//==============================================================================
// Results
//==============================================================================

void TranscriptEngineImpl::add_interim(core::StreamId stream, const std::string& text, int64_t timestamp_ms) {
    const std::string trimmed = valid_utf8(trim(text));
    if (trimmed.empty()) {
        return;
    }

    InterimTranscript event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_) {
            core::log_debug(std::string("[transcript] interim from ") + core::to_string(stream) + " without a session, ignored");
            return;
        }
        InterimState state;
        state.stream = stream;
        state.speaker = core::speaker_label(stream);
        state.text = trimmed;
        state.timestamp_ms = timestamp_ms;
        interims_[core::stream_index(stream)] = state;
        last_activity_ms_ = core::now_ms();
        event = InterimTranscript{stream, state.speaker, state.text, timestamp_ms};
    }
    emit({event});
}

std::optional<Transcript> TranscriptEngineImpl::add_final(core::StreamId stream, const std::string& text,
                                                          double confidence, int64_t timestamp_ms) {
    const std::string trimmed = valid_utf8(trim(text));
    if (trimmed.empty()) {
        core::log_debug(std::string("[transcript] empty final from ") + core::to_string(stream) + " ignored");
        return std::nullopt;
    }

    std::vector<TranscriptEvent> events;
    Transcript accepted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_) {
            core::log_warn(std::string("[transcript] final from ") + core::to_string(stream) +
                           " arrived after the session was sealed, discarded: \"" + trimmed + "\"");
            return std::nullopt;
        }

        Transcript candidate;
        candidate.session_id = session_->id;
        candidate.stream = stream;
        candidate.speaker = core::speaker_label(stream);
        candidate.text = trimmed;
        candidate.tagged_text = tagged(candidate.speaker, trimmed, config_.enable_speaker_tagging);
        candidate.confidence = std::isfinite(confidence) ? std::clamp(confidence, 0.0, 1.0) : 0.0;
        candidate.timestamp_ms = timestamp_ms;
        candidate.kind = TranscriptKind::Final;

        DedupVerdict verdict;
        try {
            verdict = check_duplicate_locked(candidate);
        } catch (const std::exception& e) {
            // Never lose speech because the heuristic failed.
            core::log_warn(std::string("[transcript] duplicate check failed, keeping transcript: ") + e.what());
            verdict = DedupVerdict{};
        }

        if (verdict.suppress) {
            suppressed_count_++;
            core::log_debug("[transcript] suppressed " + candidate.speaker + " \"" + trimmed + "\": " + verdict.reason);
            return std::nullopt;
        }

        candidate.id = next_id_++;
        if (verdict.retract && log_.remove(*verdict.retract)) {
            retracted_count_++;
            core::log_debug("[transcript] replaced #" + std::to_string(*verdict.retract) + " with #" +
                            std::to_string(candidate.id) + ": " + verdict.reason);
            events.push_back(TranscriptRetracted{*verdict.retract, candidate.id});
        }

        auto evicted = log_.append(candidate);
        if (!evicted.empty()) {
            core::log_debug("[transcript] buffer full, evicted " + std::to_string(evicted.size()) + " oldest");
        }
        interims_[core::stream_index(stream)].reset();
        last_activity_ms_ = core::now_ms();

        accepted = candidate;
        events.push_back(FinalTranscript{candidate});
        events.push_back(TranscriptsUpdated{log_.recent(kRollingUpdateSize)});
    }
    emit(events);
    return accepted;
}

TranscriptEngineImpl::DedupVerdict TranscriptEngineImpl::check_duplicate_locked(const Transcript& candidate) const {
    DedupVerdict verdict;
    if (!config_.filter_duplicates) {
        return verdict;
    }
    const std::optional<core::StreamId> preferred = config_.preferred_source;
    const int64_t window = config_.duplicate_time_window_ms;

    // The preferred source spoke shortly before: treat the other stream as echo.
    if (preferred && config_.suppress_non_preferred_when_active && candidate.stream != *preferred) {
        bool active = false;
        log_.visit_newest_first([&](const Transcript& t) {
            if (t.stream != *preferred) return true;
            const int64_t dt = candidate.timestamp_ms - t.timestamp_ms;
            if (dt >= 0 && dt <= window) {
                active = true;
                return false;
            }
            return dt < 0;
        });
        if (active) {
            verdict.suppress = true;
            verdict.reason = std::string(core::speaker_label(*preferred)) + " active within window";
            return verdict;
        }
    }

    const size_t depth = std::max<size_t>(1, config_.similarity_scan_depth);
    size_t scanned = 0;
    double best = -1.0;
    const Transcript* match = nullptr;
    log_.visit_newest_first([&](const Transcript& t) {
        if (t.stream == candidate.stream) return true;
        const int64_t dt = candidate.timestamp_ms - t.timestamp_ms;
        if (dt > window || dt < -window) return true;
        const double s = text_similarity(candidate.text, t.text, config_.containment_bonus);
        if (s > best) {
            best = s;
            match = &t;
        }
        return ++scanned < depth;
    });

    if (!match || best < config_.similarity_threshold) {
        return verdict;
    }
    verdict.reason = "similar to #" + std::to_string(match->id) + " (" + std::to_string(best) + ")";
    if (preferred && match->stream == *preferred) {
        verdict.suppress = true;
    } else if (preferred && candidate.stream == *preferred) {
        verdict.retract = match->id;
    } else {
        verdict.suppress = true;   // first seen wins
    }
    return verdict;
}

//==============================================================================
// Queries
//==============================================================================

std::vector<Transcript> TranscriptEngineImpl::recent(size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.recent(n);
}

std::vector<Transcript> TranscriptEngineImpl::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.all();
}

std::vector<InterimState> TranscriptEngineImpl::interim_states() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InterimState> out;
    for (const auto& slot : interims_) {
        if (slot) out.push_back(*slot);
    }
    return out;
}

std::vector<Transcript> TranscriptEngineImpl::search(const std::string& query, const SearchOptions& options) const {
    const std::string needle = options.case_sensitive ? query : ascii_lower(query);

    std::vector<Transcript> hits;
    for (const auto& t : all()) {
        if (options.speaker && t.speaker != *options.speaker) continue;
        if (options.date_range &&
            (t.timestamp_ms < options.date_range->first || t.timestamp_ms > options.date_range->second)) {
            continue;
        }
        const std::string hay = options.case_sensitive ? t.text : ascii_lower(t.text);
        if (hay.find(needle) == std::string::npos) continue;
        hits.push_back(t);
    }
    if (hits.size() > options.limit) {
        hits.erase(hits.begin(), hits.end() - static_cast<std::ptrdiff_t>(options.limit));
    }
    return hits;
}

std::string TranscriptEngineImpl::export_transcripts(ExportFormat format) const {
    std::vector<Transcript> items;
    int64_t base = 0;
    int64_t default_duration = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items = log_.all();
        if (session_) {
            base = session_->start_ms;
        } else if (last_session_) {
            base = last_session_->start_ms;
        } else if (!items.empty()) {
            base = items.front().timestamp_ms;
        }
        default_duration = config_.subtitle_default_duration_ms;
    }
    return app::export_transcripts(items, format, base, default_duration);
}

SessionSummary TranscriptEngineImpl::compute_summary_locked(const std::optional<Session>& session) const {
    SessionSummary s;
    if (session) {
        s.session_id = session->id;
        s.start_ms = session->start_ms;
        s.end_ms = session->end_ms;
        s.duration_ms = session->end_ms.value_or(core::now_ms()) - session->start_ms;
    }

    double confidence_sum = 0.0;
    // Speakers in order of first appearance.
    for (const auto& t : log_.all()) {
        const size_t words = word_count(t.text);
        s.total_transcripts++;
        s.total_words += words;
        confidence_sum += t.confidence;

        auto it = std::find_if(s.speakers.begin(), s.speakers.end(),
                               [&](const SpeakerStats& st) { return st.speaker == t.speaker; });
        if (it == s.speakers.end()) {
            s.speakers.push_back(SpeakerStats{t.speaker, 0, 0});
            it = s.speakers.end() - 1;
        }
        it->transcript_count++;
        it->word_count += words;
    }
    s.average_confidence = s.total_transcripts > 0 ? confidence_sum / static_cast<double>(s.total_transcripts) : 0.0;
    return s;
}

SessionSummary TranscriptEngineImpl::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return compute_summary_locked(session_ ? session_ : last_session_);
}

EngineStatus TranscriptEngineImpl::status() const {
    EngineStatus st;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        st.has_active_session = session_.has_value();
        if (session_) {
            st.session_id = session_->id;
            st.session_start_ms = session_->start_ms;
        }
        st.last_activity_ms = last_activity_ms_;
        st.transcript_count = log_.size();
        st.interim_count = static_cast<size_t>(std::count_if(interims_.begin(), interims_.end(),
                                                             [](const auto& s) { return s.has_value(); }));
        st.suppressed_count = suppressed_count_;
        st.retracted_count = retracted_count_;
    }
    {
        std::lock_guard<std::mutex> lock(autosave_mutex_);
        st.auto_save_enabled = !autosave_stop_;
    }
    return st;
}

//==============================================================================
// Runtime Tuning
//==============================================================================

void TranscriptEngineImpl::set_duplicate_filtering(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.filter_duplicates = enabled;
    core::log_info(std::string("[transcript] duplicate filtering ") + (enabled ? "enabled" : "disabled"));
}

void TranscriptEngineImpl::set_similarity_threshold(double threshold) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.similarity_threshold = std::clamp(threshold, 0.0, 1.0);
    core::log_info("[transcript] similarity threshold " + std::to_string(config_.similarity_threshold));
}

void TranscriptEngineImpl::set_preferred_source(std::optional<core::StreamId> source) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.preferred_source = source;
    core::log_info(std::string("[transcript] preferred source ") + (source ? core::to_string(*source) : "none"));
}

core::TranscriptConfig TranscriptEngineImpl::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void TranscriptEngineImpl::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    log_.clear();
    interims_ = {};
    core::log_info("[transcript] cleared");
}

//==============================================================================
// Persistence
//==============================================================================

std::optional<std::string> TranscriptEngineImpl::persist(const Snapshot& snapshot, std::vector<TranscriptEvent>& events) {
    std::lock_guard<std::mutex> lock(save_mutex_);
    try {
        std::string path = store_.save(snapshot.session, snapshot.transcripts, snapshot.summary);
        events.push_back(SessionSaved{path});
        return path;
    } catch (const core::PersistenceError& e) {
        core::log_error(std::string("[transcript] save failed: ") + e.what());
        events.push_back(PersistenceFailed{e.what()});
        return std::nullopt;
    }
}

std::optional<std::string> TranscriptEngineImpl::save_active(bool require_transcripts, std::vector<TranscriptEvent>& events) {
    Snapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_ || (require_transcripts && log_.empty())) {
            return std::nullopt;
        }
        snapshot.session = *session_;
        snapshot.transcripts = log_.all();
        snapshot.summary = compute_summary_locked(session_);
    }
    return persist(snapshot, events);
}

std::optional<std::string> TranscriptEngineImpl::save_now() {
    std::vector<TranscriptEvent> events;
    auto path = save_active(false, events);
    emit(events);
    return path;
}

void TranscriptEngineImpl::start_autosave() {
    stop_autosave();
    int interval_ms = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!config_.auto_save) return;
        interval_ms = config_.auto_save_interval_ms;
    }
    if (interval_ms <= 0) return;
    {
        std::lock_guard<std::mutex> lock(autosave_mutex_);
        autosave_stop_ = false;
    }
    autosave_thread_ = std::thread(&TranscriptEngineImpl::autosave_loop, this);
}

void TranscriptEngineImpl::stop_autosave() {
    {
        std::lock_guard<std::mutex> lock(autosave_mutex_);
        autosave_stop_ = true;
    }
    autosave_cv_.notify_all();
    if (autosave_thread_.joinable()) {
        autosave_thread_.join();
    }
}

void TranscriptEngineImpl::autosave_loop() {
    std::chrono::milliseconds interval;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interval = std::chrono::milliseconds(config_.auto_save_interval_ms);
    }
    std::unique_lock<std::mutex> lock(autosave_mutex_);
    while (!autosave_stop_) {
        if (autosave_cv_.wait_for(lock, interval, [this] { return autosave_stop_; })) {
            break;
        }
        lock.unlock();
        std::vector<TranscriptEvent> events;
        save_active(true, events);
        emit(events);
        lock.lock();
    }
}

//==============================================================================
// Event Subscription
//==============================================================================

void TranscriptEngineImpl::subscribe(TranscriptEventCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.push_back(std::move(callback));
}

void TranscriptEngineImpl::clear_subscriptions() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.clear();
}

void TranscriptEngineImpl::emit(const std::vector<TranscriptEvent>& events) {
    if (events.empty()) return;
    std::vector<TranscriptEventCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = callbacks_;
    }
    for (const auto& event : events) {
        for (auto& cb : callbacks) {
            try {
                cb(event);
            } catch (const std::exception& e) {
                core::log_error(std::string("[transcript] event subscriber threw: ") + e.what());
            }
        }
    }
}

//==============================================================================
// Public API Forwarding
//==============================================================================

TranscriptEngine::TranscriptEngine(const core::TranscriptConfig& config)
    : impl_(std::make_unique<TranscriptEngineImpl>(config)) {}

TranscriptEngine::~TranscriptEngine() = default;

std::string TranscriptEngine::start_session(const Metadata& metadata) { return impl_->start_session(metadata); }
std::optional<SessionSummary> TranscriptEngine::end_session() { return impl_->end_session(); }
bool TranscriptEngine::has_active_session() const { return impl_->has_active_session(); }
std::optional<Session> TranscriptEngine::current_session() const { return impl_->current_session(); }

void TranscriptEngine::add_interim(core::StreamId stream, const std::string& text, int64_t timestamp_ms) {
    impl_->add_interim(stream, text, timestamp_ms);
}

std::optional<Transcript> TranscriptEngine::add_final(core::StreamId stream, const std::string& text,
                                                      double confidence, int64_t timestamp_ms) {
    return impl_->add_final(stream, text, confidence, timestamp_ms);
}

std::vector<Transcript> TranscriptEngine::recent(size_t n) const { return impl_->recent(n); }
std::vector<Transcript> TranscriptEngine::all() const { return impl_->all(); }
std::vector<InterimState> TranscriptEngine::interim_states() const { return impl_->interim_states(); }

std::vector<Transcript> TranscriptEngine::search(const std::string& query, const SearchOptions& options) const {
    return impl_->search(query, options);
}

std::string TranscriptEngine::export_transcripts(ExportFormat format) const { return impl_->export_transcripts(format); }
SessionSummary TranscriptEngine::summary() const { return impl_->summary(); }
EngineStatus TranscriptEngine::status() const { return impl_->status(); }

void TranscriptEngine::set_duplicate_filtering(bool enabled) { impl_->set_duplicate_filtering(enabled); }
void TranscriptEngine::set_similarity_threshold(double threshold) { impl_->set_similarity_threshold(threshold); }
void TranscriptEngine::set_preferred_source(std::optional<core::StreamId> source) { impl_->set_preferred_source(source); }
core::TranscriptConfig TranscriptEngine::config() const { return impl_->config(); }
void TranscriptEngine::clear() { impl_->clear(); }
std::optional<std::string> TranscriptEngine::save_now() { return impl_->save_now(); }

void TranscriptEngine::subscribe(TranscriptEventCallback callback) { impl_->subscribe(std::move(callback)); }
void TranscriptEngine::clear_subscriptions() { impl_->clear_subscriptions(); }

} // namespace app
