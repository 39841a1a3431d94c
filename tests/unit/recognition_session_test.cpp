#include <cassert>
#include <chrono>
#include <cmath>
#include <limits>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "asr/streaming_recognition_session.hpp"
#include "core/errors.hpp"
#include "support/scripted_backend.hpp"

using asr::SessionState;
using core::StreamId;

namespace {

template <typename Pred>
bool wait_until(Pred pred, int timeout_ms = 2000) {
    for (int waited = 0; waited < timeout_ms; waited += 5) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

struct Collector {
    std::mutex mutex;
    std::vector<asr::RecognitionResult> results;
    std::vector<asr::SessionError> errors;

    void attach(asr::StreamingRecognitionSession& s) {
        s.on_result([this](const asr::RecognitionResult& r) {
            std::lock_guard<std::mutex> lock(mutex);
            results.push_back(r);
        });
        s.on_error([this](const asr::SessionError& e) {
            std::lock_guard<std::mutex> lock(mutex);
            errors.push_back(e);
        });
    }
    size_t result_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return results.size();
    }
};

audio::AudioFrame frame(StreamId stream, size_t samples = 1600) {
    audio::AudioFrame f;
    f.source = stream;
    f.timestamp_ms = 0;
    f.pcm.assign(samples, 100);
    return f;
}

core::RecognitionConfig test_config() {
    core::RecognitionConfig cfg;
    cfg.open_timeout_ms = 1000;
    return cfg;
}

void streams_audio_and_delivers_finals() {
    auto backend = std::make_shared<test_support::ScriptedBackend>();
    test_support::ScriptedBackend::StreamScript script;
    script.finals = {"good morning", "shall we start"};
    script.samples_per_final = 3200;
    backend->set_script(StreamId::SystemAudio, script);

    asr::StreamingRecognitionSession session(backend, test_config());
    Collector out;
    out.attach(session);

    assert(session.state() == SessionState::Idle);
    asr::LanguageConfig lang;
    lang.language = "en-GB";
    session.open(StreamId::SystemAudio, lang);
    assert(session.state() == SessionState::Active);
    assert(session.stream() == StreamId::SystemAudio);
    assert(backend->last_language(StreamId::SystemAudio) == "en-GB");

    // Bound to one stream only
    assert(!session.push_frame(StreamId::Microphone, frame(StreamId::Microphone)));
    for (int i = 0; i < 4; ++i) {
        assert(session.push_frame(StreamId::SystemAudio, frame(StreamId::SystemAudio)));
    }
    assert(wait_until([&] { return out.result_count() == 2; }));

    session.close(StreamId::SystemAudio);
    assert(session.state() == SessionState::Idle);
    assert(!session.stream());
    assert(backend->finished(StreamId::SystemAudio) == 1);
    assert(backend->samples_written(StreamId::SystemAudio) == 6400);

    std::lock_guard<std::mutex> lock(out.mutex);
    assert(out.results[0].text == "good morning");
    assert(out.results[0].stream == StreamId::SystemAudio);
    assert(out.results[0].kind == asr::ResultKind::Final);
    assert(out.results[1].text == "shall we start");
    assert(out.results[1].timestamp_ms >= out.results[0].timestamp_ms);
    assert(out.errors.empty());
}

void push_and_close_when_idle() {
    auto backend = std::make_shared<test_support::ScriptedBackend>();
    asr::StreamingRecognitionSession session(backend, test_config());
    assert(!session.push_frame(StreamId::Microphone, frame(StreamId::Microphone)));
    session.close(StreamId::Microphone);   // no-op
    assert(session.state() == SessionState::Idle);
    assert(backend->connect_calls(StreamId::Microphone) == 0);
}

void double_open_is_rejected() {
    auto backend = std::make_shared<test_support::ScriptedBackend>();
    asr::StreamingRecognitionSession session(backend, test_config());
    session.open(StreamId::Microphone, {});
    bool threw = false;
    try { session.open(StreamId::Microphone, {}); } catch (const core::AlreadyOpenError&) { threw = true; }
    assert(threw);
    assert(session.state() == SessionState::Active);
    session.close(StreamId::Microphone);
}

void open_is_bounded_by_timeout() {
    auto backend = std::make_shared<test_support::ScriptedBackend>();
    backend->set_connect_delay(StreamId::Microphone, 400);

    auto cfg = test_config();
    cfg.open_timeout_ms = 50;
    asr::StreamingRecognitionSession session(backend, cfg);

    const auto t0 = std::chrono::steady_clock::now();
    bool threw = false;
    try { session.open(StreamId::Microphone, {}); } catch (const core::ConnectivityError&) { threw = true; }
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    assert(threw);
    assert(elapsed < std::chrono::milliseconds(300));
    assert(session.state() == SessionState::Idle);

    // The late connection is discarded; the session can be opened again.
    backend->set_connect_delay(StreamId::Microphone, 0);
    assert(wait_until([&] { return backend->connections(StreamId::Microphone) == 1; }));
    session.open(StreamId::Microphone, {});
    assert(session.state() == SessionState::Active);
    session.close(StreamId::Microphone);
}

void connect_failures_propagate() {
    auto backend = std::make_shared<test_support::ScriptedBackend>();
    asr::StreamingRecognitionSession session(backend, test_config());

    backend->fail_next_connects(StreamId::Microphone, 1, asr::RecognitionErrorKind::Authentication);
    bool auth = false;
    try { session.open(StreamId::Microphone, {}); } catch (const core::AuthenticationError&) { auth = true; }
    assert(auth);
    assert(session.state() == SessionState::Idle);

    backend->fail_next_connects(StreamId::Microphone, 1, asr::RecognitionErrorKind::Connectivity);
    bool conn = false;
    try { session.open(StreamId::Microphone, {}); } catch (const core::ConnectivityError&) { conn = true; }
    assert(conn);

    session.open(StreamId::Microphone, {});
    assert(session.state() == SessionState::Active);
}

void error_while_active_goes_idle() {
    auto backend = std::make_shared<test_support::ScriptedBackend>();
    asr::StreamingRecognitionSession session(backend, test_config());
    Collector out;
    out.attach(session);

    session.open(StreamId::Microphone, {});
    assert(backend->inject_error(StreamId::Microphone, asr::RecognitionErrorKind::Connectivity, "socket reset"));
    assert(session.state() == SessionState::Idle);
    assert(!session.push_frame(StreamId::Microphone, frame(StreamId::Microphone)));
    {
        std::lock_guard<std::mutex> lock(out.mutex);
        assert(out.errors.size() == 1);
        assert(out.errors[0].kind == asr::RecognitionErrorKind::Connectivity);
        assert(!out.errors[0].fatal);
        assert(out.errors[0].message == "socket reset");
    }

    // Results from the dead connection are ignored
    backend->inject_final(StreamId::Microphone, "ghost", 0.9, 10);
    assert(out.result_count() == 0);

    // Reopening is the caller's decision
    session.open(StreamId::Microphone, {});
    assert(session.state() == SessionState::Active);
    backend->inject_error(StreamId::Microphone, asr::RecognitionErrorKind::Authentication, "token expired");
    std::lock_guard<std::mutex> lock(out.mutex);
    assert(out.errors.size() == 2 && out.errors[1].fatal);
}

void results_are_normalized() {
    auto backend = std::make_shared<test_support::ScriptedBackend>();
    asr::StreamingRecognitionSession session(backend, test_config());
    Collector out;
    out.attach(session);
    session.open(StreamId::Microphone, {});

    backend->inject_final(StreamId::Microphone, "too sure", 1.7, 500);
    backend->inject_final(StreamId::Microphone, "unsure", std::numeric_limits<double>::quiet_NaN(), 400);
    backend->inject_interim(StreamId::Microphone, "partial", 450);
    backend->inject_interim(StreamId::Microphone, "partial two", 300);

    std::lock_guard<std::mutex> lock(out.mutex);
    assert(out.results.size() == 4);
    assert(out.results[0].confidence == 1.0);
    assert(out.results[1].confidence == 0.0);
    assert(out.results[1].timestamp_ms == 500);      // never goes backwards
    assert(out.results[2].kind == asr::ResultKind::Interim && out.results[2].timestamp_ms == 450);
    assert(out.results[3].timestamp_ms == 450);
}

void interims_can_be_disabled() {
    auto backend = std::make_shared<test_support::ScriptedBackend>();
    asr::StreamingRecognitionSession session(backend, test_config());
    Collector out;
    out.attach(session);
    asr::LanguageConfig lang;
    lang.enable_interim_results = false;
    session.open(StreamId::Microphone, lang);

    backend->inject_interim(StreamId::Microphone, "partial", 100);
    backend->inject_final(StreamId::Microphone, "complete", 0.8, 200);
    std::lock_guard<std::mutex> lock(out.mutex);
    assert(out.results.size() == 1 && out.results[0].kind == asr::ResultKind::Final);
}

} // namespace

void backend_exceptions_do_not_wedge_the_session() {
    auto backend = std::make_shared<test_support::ScriptedBackend>();
    test_support::ScriptedBackend::StreamScript script;
    script.finish_failure = "socket reset during flush";
    backend->set_script(StreamId::Microphone, script);

    asr::StreamingRecognitionSession session(backend, test_config());
    Collector out;
    out.attach(session);

    // finish() throwing a plain std::exception still ends in Idle
    session.open(StreamId::Microphone, asr::LanguageConfig{});
    session.close(StreamId::Microphone);
    assert(session.state() == SessionState::Idle);
    assert(backend->finished(StreamId::Microphone) == 1);

    backend->set_script(StreamId::Microphone, test_support::ScriptedBackend::StreamScript{});
    session.open(StreamId::Microphone, asr::LanguageConfig{});
    assert(session.state() == SessionState::Active);
    session.close(StreamId::Microphone);

    // write() throwing on the writer thread becomes a connectivity error
    script = test_support::ScriptedBackend::StreamScript{};
    script.write_failure = "broken pipe";
    backend->set_script(StreamId::Microphone, script);
    session.open(StreamId::Microphone, asr::LanguageConfig{});
    assert(session.push_frame(StreamId::Microphone, frame(StreamId::Microphone)));
    assert(wait_until([&] { return session.state() == SessionState::Idle; }));
    {
        std::lock_guard<std::mutex> lock(out.mutex);
        assert(out.errors.size() == 1);
        assert(out.errors[0].kind == asr::RecognitionErrorKind::Connectivity);
        assert(!out.errors[0].fatal);
        assert(out.errors[0].message == "broken pipe");
    }

    backend->set_script(StreamId::Microphone, test_support::ScriptedBackend::StreamScript{});
    session.open(StreamId::Microphone, asr::LanguageConfig{});
    assert(session.state() == SessionState::Active);
    session.close(StreamId::Microphone);
    assert(session.state() == SessionState::Idle);
}

int main() {
    streams_audio_and_delivers_finals();
    push_and_close_when_idle();
    double_open_is_rejected();
    open_is_bounded_by_timeout();
    connect_failures_propagate();
    error_while_active_goes_idle();
    results_are_normalized();
    interims_can_be_disabled();
    backend_exceptions_do_not_wedge_the_session();
    return 0;
}
