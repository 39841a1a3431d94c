// Copyright (c) 2025 Dualscribe
// Session Orchestrator - Implementation

#include "app/session_orchestrator.hpp"
#include "app/orchestrator_messages.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "core/message_channel.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <variant>

namespace app {

namespace {

using Clock = std::chrono::steady_clock;

// Idle wake-up of the loop when no reopen is pending.
constexpr auto kIdlePoll = std::chrono::milliseconds(250);

std::string tag(core::StreamId stream) {
    return std::string("[orchestrator:") + core::to_string(stream) + "] ";
}

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

//==============================================================================
// Implementation Class (PIMPL Pattern)
//==============================================================================

class SessionOrchestratorImpl {
public:
    SessionOrchestratorImpl(const core::AppConfig& config,
                            std::vector<PipelineSpec> specs,
                            std::shared_ptr<asr::IRecognitionBackend> backend,
                            audio::DeviceFactory device_factory);
    ~SessionOrchestratorImpl();

    std::string start_recording(const RecordingOptions& options);
    std::optional<SessionSummary> stop_recording();
    std::optional<std::string> toggle_recording(const RecordingOptions& options);
    bool is_recording() const { return recording_.load(); }
    OrchestratorStatus status() const;
    void subscribe(OrchestratorEventCallback callback);
    TranscriptEngine& engine() { return engine_; }

private:
    struct Pipeline {
        core::StreamId stream;
        audio::CaptureSpec capture_spec;
        std::unique_ptr<audio::AudioSourceCapture> capture;
        std::unique_ptr<asr::StreamingRecognitionSession> session;

        // Guarded by state_mutex_
        int reopen_attempts = 0;
        std::optional<Clock::time_point> reopen_due;
        bool failed = false;
    };

    // Orchestration loop
    void loop();
    void handle(FrameMessage& msg);
    void handle(ResultMessage& msg);
    void handle(ControlMessage& msg);
    void on_session_fault(const asr::SessionError& error);
    void run_due_reopens();
    Clock::duration time_until_next_reopen() const;
    Clock::duration backoff_for(int attempt) const;

    void rollback(const std::vector<Pipeline*>& captures, const std::vector<Pipeline*>& sessions);
    std::optional<SessionSummary> seal();
    Pipeline* find(core::StreamId stream);
    bool on_loop_thread() const { return std::this_thread::get_id() == loop_thread_.get_id(); }

    // Holds lifecycle_mutex_ for start/stop.
    class LifecycleGuard {
    public:
        explicit LifecycleGuard(SessionOrchestratorImpl& owner);
        ~LifecycleGuard();
        LifecycleGuard(const LifecycleGuard&) = delete;
        LifecycleGuard& operator=(const LifecycleGuard&) = delete;
        bool locked() const { return locked_; }

    private:
        SessionOrchestratorImpl& owner_;
        const bool on_loop_;
        bool locked_ = false;
    };
    void emit(const OrchestratorEvent& event);

    const core::AppConfig config_;
    TranscriptEngine engine_;
    core::MessageChannel<Message> inbox_;

    std::vector<std::unique_ptr<Pipeline>> pipelines_;

    std::mutex lifecycle_mutex_;          // serializes start/stop
    std::mutex sessions_mutex_;           // open/close of recognition sessions
    mutable std::mutex state_mutex_;      // reopen bookkeeping, session id
    std::string session_id_;
    asr::LanguageConfig language_;
    std::atomic<bool> recording_{false};
    std::atomic<bool> starting_{false};
    std::atomic<bool> stopping_{false};     // a stop holds lifecycle_mutex_
    bool loop_in_lifecycle_ = false;        // loop thread only

    std::mutex callbacks_mutex_;
    std::vector<OrchestratorEventCallback> callbacks_;

    std::thread loop_thread_;
};

SessionOrchestratorImpl::SessionOrchestratorImpl(const core::AppConfig& config,
                                                 std::vector<PipelineSpec> specs,
                                                 std::shared_ptr<asr::IRecognitionBackend> backend,
                                                 audio::DeviceFactory device_factory)
    : config_(config)
    , engine_(config.transcript)
    , inbox_(static_cast<size_t>(std::max(1, config.orchestrator.inbox_max_frames)), &is_droppable) {
    for (const auto& spec : specs) {
        if (find(spec.stream)) {
            core::log_warn(tag(spec.stream) + "duplicate pipeline ignored");
            continue;
        }
        auto p = std::make_unique<Pipeline>();
        p->stream = spec.stream;
        p->capture_spec = spec.capture;
        p->capture = std::make_unique<audio::AudioSourceCapture>(spec.stream, config.capture, device_factory);
        p->session = std::make_unique<asr::StreamingRecognitionSession>(backend, config.recognition);

        p->capture->on_frame([this](const audio::AudioFrame& frame) {
            inbox_.push(Message{FrameMessage{frame}});
        });
        p->capture->on_lifecycle([this](const audio::SourceLifecycleEvent& ev) {
            inbox_.push(Message{ControlMessage{SourceMessage{ev.source, ev.state == audio::SourceState::Active, ev.reason}}});
        });
        p->session->on_result([this](const asr::RecognitionResult& r) {
            inbox_.push(Message{ResultMessage{r}});
        });
        p->session->on_error([this](const asr::SessionError& e) {
            inbox_.push(Message{ControlMessage{SessionFaultMessage{e}}});
        });
        pipelines_.push_back(std::move(p));
    }
    loop_thread_ = std::thread(&SessionOrchestratorImpl::loop, this);
}

SessionOrchestratorImpl::~SessionOrchestratorImpl() {
    stop_recording();
    inbox_.close();
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    for (auto& p : pipelines_) {
        p->capture->release();
        p->session->close(p->stream);
    }
}

SessionOrchestratorImpl::Pipeline* SessionOrchestratorImpl::find(core::StreamId stream) {
    for (auto& p : pipelines_) {
        if (p->stream == stream) return p.get();
    }
    return nullptr;
}

//==============================================================================
// Recording Control
//==============================================================================

SessionOrchestratorImpl::LifecycleGuard::LifecycleGuard(SessionOrchestratorImpl& owner)
    : owner_(owner), on_loop_(owner.on_loop_thread()) {
    if (!on_loop_) {
        owner_.lifecycle_mutex_.lock();
        locked_ = true;
        return;
    }
    // Called from an event callback. Re-entered from our own start/stop, or a
    // stop running elsewhere that waits for this thread to seal: never block.
    if (owner_.loop_in_lifecycle_) {
        return;
    }
    while (!owner_.lifecycle_mutex_.try_lock()) {
        if (owner_.stopping_.load()) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    locked_ = true;
    owner_.loop_in_lifecycle_ = true;
}

SessionOrchestratorImpl::LifecycleGuard::~LifecycleGuard() {
    if (!locked_) return;
    if (on_loop_) owner_.loop_in_lifecycle_ = false;
    owner_.lifecycle_mutex_.unlock();
}

std::string SessionOrchestratorImpl::start_recording(const RecordingOptions& options) {
    LifecycleGuard lifecycle(*this);
    if (!lifecycle.locked()) {
        throw core::RecordingStartError({"recording is being started or stopped"});
    }
    if (recording_.load()) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return session_id_;
    }
    if (pipelines_.empty()) {
        throw core::RecordingStartError({"no audio sources configured"});
    }

    asr::LanguageConfig language;
    language.language = options.language.empty() ? config_.recognition.language : options.language;
    language.enable_interim_results = config_.recognition.enable_interim_results;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        language_ = language;
        for (auto& p : pipelines_) {
            p->reopen_attempts = 0;
            p->reopen_due.reset();
            p->failed = false;
        }
    }
    starting_.store(true);

    // Recognition sessions first: a capture without a recognizer is wasted audio.
    std::vector<std::string> failures;
    std::vector<Pipeline*> opened;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& p : pipelines_) {
            try {
                p->session->open(p->stream, language);
                opened.push_back(p.get());
            } catch (const core::DualscribeError& e) {
                failures.push_back(std::string(core::to_string(p->stream)) + ": " + e.what());
            }
        }
    }
    if (!failures.empty()) {
        rollback({}, opened);
        starting_.store(false);
        throw core::RecordingStartError(failures);
    }

    std::vector<Pipeline*> acquired;
    for (auto& p : pipelines_) {
        try {
            p->capture->acquire(p->capture_spec);
            acquired.push_back(p.get());
        } catch (const core::DualscribeError& e) {
            failures.push_back(std::string(core::to_string(p->stream)) + ": " + e.what());
        }
    }
    if (!failures.empty()) {
        rollback(acquired, opened);
        starting_.store(false);
        throw core::RecordingStartError(failures);
    }

    Metadata metadata = options.metadata;
    metadata["capture_mode"] = pipelines_.size() > 1 ? "dual" : core::to_string(pipelines_.front()->stream);
    metadata["language"] = language.language;
    for (auto& p : pipelines_) {
        metadata[std::string("device_") + core::to_string(p->stream)] = p->capture_spec.device_id;
    }
    const std::string id = engine_.start_session(metadata);

    std::vector<core::StreamId> streams;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        session_id_ = id;
    }
    for (auto& p : pipelines_) streams.push_back(p->stream);
    recording_.store(true);
    starting_.store(false);

    core::log_info("[orchestrator] recording started: " + id + " (" + metadata["capture_mode"] + ")");
    emit(RecordingStarted{id, streams});
    return id;
}

void SessionOrchestratorImpl::rollback(const std::vector<Pipeline*>& captures, const std::vector<Pipeline*>& sessions) {
    for (auto* p : captures) {
        p->capture->release();
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (auto& p : pipelines_) p->reopen_due.reset();
    }
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto* p : sessions) {
        p->session->close(p->stream);
    }
    core::log_warn("[orchestrator] start rolled back (" + std::to_string(captures.size()) + " capture(s), " +
                   std::to_string(sessions.size()) + " session(s))");
}

std::optional<SessionSummary> SessionOrchestratorImpl::stop_recording() {
    LifecycleGuard lifecycle(*this);
    if (!lifecycle.locked()) {
        return std::nullopt;   // the stop in progress seals this session
    }
    if (!recording_.exchange(false)) {
        return std::nullopt;
    }
    stopping_.store(true);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (auto& p : pipelines_) p->reopen_due.reset();
    }

    for (auto& p : pipelines_) {
        p->capture->release();
    }
    {
        // close() flushes the recognizer; its finals land in the inbox ahead of the seal.
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& p : pipelines_) {
            p->session->close(p->stream);
        }
    }
    if (config_.orchestrator.stop_grace_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.orchestrator.stop_grace_ms));
    }

    auto summary = seal();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        session_id_.clear();
    }
    stopping_.store(false);
    core::log_info("[orchestrator] recording stopped");
    emit(RecordingStopped{summary});
    return summary;
}

std::optional<std::string> SessionOrchestratorImpl::toggle_recording(const RecordingOptions& options) {
    if (recording_.load()) {
        stop_recording();
        return std::nullopt;
    }
    return start_recording(options);
}

std::optional<SessionSummary> SessionOrchestratorImpl::seal() {
    if (on_loop_thread()) {
        // stop_recording() from an event callback: the loop is this thread.
        // Apply what is already queued, then seal here.
        while (auto msg = inbox_.pop_for(std::chrono::milliseconds(0))) {
            std::visit([this](auto& m) { handle(m); }, *msg);
        }
        return engine_.end_session();
    }

    auto done = std::make_shared<std::promise<std::optional<SessionSummary>>>();
    auto result = done->get_future();
    if (!inbox_.push(Message{ControlMessage{SealMessage{done}}})) {
        // Loop already gone (shutdown): seal here.
        return engine_.end_session();
    }
    return result.get();
}

//==============================================================================
// Orchestration Loop
//==============================================================================

void SessionOrchestratorImpl::loop() {
    while (true) {
        auto msg = inbox_.pop_for(time_until_next_reopen());
        if (msg) {
            std::visit([this](auto& m) { handle(m); }, *msg);
        } else if (inbox_.closed()) {
            break;
        }
        run_due_reopens();
    }
}

void SessionOrchestratorImpl::handle(FrameMessage& msg) {
    Pipeline* p = find(msg.frame.source);
    if (!p) return;
    // Returns false while the session is down; the audio is simply lost.
    p->session->push_frame(msg.frame.source, msg.frame);
}

void SessionOrchestratorImpl::handle(ResultMessage& msg) {
    const auto& r = msg.result;
    if (r.kind == asr::ResultKind::Interim) {
        engine_.add_interim(r.stream, r.text, r.timestamp_ms);
    } else {
        engine_.add_final(r.stream, r.text, r.confidence, r.timestamp_ms);
    }
}

void SessionOrchestratorImpl::handle(ControlMessage& msg) {
    std::visit(overloaded{
        [this](SessionFaultMessage& m) { on_session_fault(m.error); },
        [this](SourceMessage& m) {
            core::log_debug(tag(m.stream) + (m.active ? "source active" : "source inactive: " + m.reason));
            emit(SourceActivity{m.stream, m.active});
        },
        [this](SealMessage& m) {
            m.done->set_value(engine_.end_session());
        },
    }, msg);
}

void SessionOrchestratorImpl::on_session_fault(const asr::SessionError& error) {
    if (!recording_.load() && !starting_.load()) {
        return;
    }
    Pipeline* p = find(error.stream);
    if (!p) return;

    bool give_up = error.fatal;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!give_up && p->reopen_attempts >= config_.orchestrator.max_reopen_attempts) {
            give_up = true;
        }
        if (give_up) {
            p->failed = true;
            p->reopen_due.reset();
        } else {
            const auto delay = backoff_for(p->reopen_attempts);
            p->reopen_due = Clock::now() + delay;
            core::log_warn(tag(p->stream) + "reopen in " +
                           std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(delay).count()) +
                           " ms (attempt " + std::to_string(p->reopen_attempts + 1) + ")");
        }
    }
    if (give_up) {
        core::log_error(tag(p->stream) + "stream stopped: " + error.message);
    }
    emit(StreamFault{error.stream, error.message, give_up});
}

Clock::duration SessionOrchestratorImpl::backoff_for(int attempt) const {
    const int64_t base = std::max(1, config_.orchestrator.reopen_backoff_ms);
    const int64_t cap = std::max<int64_t>(base, config_.orchestrator.reopen_backoff_max_ms);
    int64_t delay = base;
    for (int i = 0; i < attempt && delay < cap; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, cap));
}

Clock::duration SessionOrchestratorImpl::time_until_next_reopen() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    Clock::duration wait = kIdlePoll;
    const auto now = Clock::now();
    for (const auto& p : pipelines_) {
        if (p->reopen_due) {
            wait = std::min<Clock::duration>(wait, std::max<Clock::duration>(Clock::duration::zero(), *p->reopen_due - now));
        }
    }
    return wait;
}

void SessionOrchestratorImpl::run_due_reopens() {
    for (auto& p : pipelines_) {
        asr::LanguageConfig language;
        int attempt = 0;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (!p->reopen_due || *p->reopen_due > Clock::now()) continue;
            if (!recording_.load()) {
                // Still starting: keep the deadline until the session is live.
                if (!starting_.load()) p->reopen_due.reset();
                continue;
            }
            p->reopen_due.reset();
            attempt = ++p->reopen_attempts;
            language = language_;
        }

        std::unique_lock<std::mutex> sessions(sessions_mutex_);
        if (!recording_.load()) {
            return;   // stop_recording won the race
        }
        try {
            p->session->open(p->stream, language);
            sessions.unlock();
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                p->reopen_attempts = 0;
            }
            core::log_info(tag(p->stream) + "recovered after " + std::to_string(attempt) + " attempt(s)");
            emit(StreamRecovered{p->stream, attempt});
        } catch (const core::DualscribeError& e) {
            sessions.unlock();
            asr::SessionError again;
            again.stream = p->stream;
            again.message = e.what();
            again.kind = dynamic_cast<const core::AuthenticationError*>(&e) ? asr::RecognitionErrorKind::Authentication
                                                                            : asr::RecognitionErrorKind::Connectivity;
            again.fatal = again.kind == asr::RecognitionErrorKind::Authentication;
            on_session_fault(again);
        }
    }
}

//==============================================================================
// Status & Events
//==============================================================================

OrchestratorStatus SessionOrchestratorImpl::status() const {
    OrchestratorStatus st;
    st.recording = recording_.load();
    st.inbox_dropped = inbox_.dropped_count();
    std::lock_guard<std::mutex> lock(state_mutex_);
    st.session_id = session_id_;
    for (const auto& p : pipelines_) {
        StreamStatus s;
        s.stream = p->stream;
        s.device_id = p->capture_spec.device_id;
        s.session_state = p->session->state();
        s.capture_active = p->capture->is_active();
        s.capture_dropped = p->capture->dropped_frames();
        s.session_dropped = p->session->dropped_frames();
        s.reopen_attempts = p->reopen_attempts;
        s.failed = p->failed;
        st.streams.push_back(s);
    }
    return st;
}

void SessionOrchestratorImpl::subscribe(OrchestratorEventCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.push_back(std::move(callback));
}

void SessionOrchestratorImpl::emit(const OrchestratorEvent& event) {
    std::vector<OrchestratorEventCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = callbacks_;
    }
    for (auto& cb : callbacks) {
        try {
            cb(event);
        } catch (const std::exception& e) {
            core::log_error(std::string("[orchestrator] event subscriber threw: ") + e.what());
        }
    }
}

//==============================================================================
// Public API Forwarding
//==============================================================================

std::vector<PipelineSpec> SessionOrchestrator::pipelines_from_config(const core::AppConfig& config) {
    std::vector<PipelineSpec> specs;
    PipelineSpec mic;
    mic.stream = core::StreamId::Microphone;
    mic.capture.device_id = config.microphone_device;
    specs.push_back(mic);
    if (config.dual_capture()) {
        PipelineSpec sys;
        sys.stream = core::StreamId::SystemAudio;
        sys.capture.device_id = config.system_device;
        specs.push_back(sys);
    }
    return specs;
}

SessionOrchestrator::SessionOrchestrator(const core::AppConfig& config,
                                         std::shared_ptr<asr::IRecognitionBackend> backend,
                                         audio::DeviceFactory device_factory)
    : SessionOrchestrator(config, pipelines_from_config(config), std::move(backend), std::move(device_factory)) {}

SessionOrchestrator::SessionOrchestrator(const core::AppConfig& config,
                                         std::vector<PipelineSpec> pipelines,
                                         std::shared_ptr<asr::IRecognitionBackend> backend,
                                         audio::DeviceFactory device_factory)
    : impl_(std::make_unique<SessionOrchestratorImpl>(config, std::move(pipelines), std::move(backend),
                                                      std::move(device_factory))) {}

SessionOrchestrator::~SessionOrchestrator() = default;

std::string SessionOrchestrator::start_recording(const RecordingOptions& options) { return impl_->start_recording(options); }
std::optional<SessionSummary> SessionOrchestrator::stop_recording() { return impl_->stop_recording(); }
std::optional<std::string> SessionOrchestrator::toggle_recording(const RecordingOptions& options) {
    return impl_->toggle_recording(options);
}
bool SessionOrchestrator::is_recording() const { return impl_->is_recording(); }
OrchestratorStatus SessionOrchestrator::status() const { return impl_->status(); }
void SessionOrchestrator::subscribe(OrchestratorEventCallback callback) { impl_->subscribe(std::move(callback)); }
TranscriptEngine& SessionOrchestrator::engine() { return impl_->engine(); }

} // namespace app
