#include "support/scripted_backend.hpp"
#include "core/errors.hpp"
#include "core/time_utils.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

namespace test_support {

namespace {

class ScriptedConnection : public asr::IRecognitionConnection {
public:
    ScriptedConnection(ScriptedBackend* backend, core::StreamId stream, asr::RecognitionListener listener)
        : backend_(backend), stream_(stream), listener_(std::move(listener)) {}

    void write(const std::vector<int16_t>& pcm) override {
        if (finished_) {
            throw core::ConnectivityError("write after finish");
        }
        backend_->on_write(stream_, listener_, pcm.size());
    }

    void finish() override {
        finished_ = true;
        backend_->on_finish(stream_, listener_);
    }

private:
    ScriptedBackend* backend_;
    core::StreamId stream_;
    asr::RecognitionListener listener_;
    bool finished_ = false;
};

} // namespace

std::unique_ptr<asr::IRecognitionConnection> ScriptedBackend::connect(core::StreamId stream,
                                                                      const asr::LanguageConfig& language,
                                                                      asr::RecognitionListener listener) {
    int delay_ms = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& st = state(stream);
        st.connect_calls++;
        delay_ms = st.script.connect_delay_ms;
        if (st.script.failing_connects > 0) {
            st.script.failing_connects--;
            if (st.script.failure_kind == asr::RecognitionErrorKind::Authentication) {
                throw core::AuthenticationError("scripted: credentials rejected");
            }
            throw core::ConnectivityError("scripted: recognizer unreachable");
        }
    }
    if (delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& st = state(stream);
    st.connections++;
    st.samples_since_final = 0;
    st.language = language.language;
    st.listener = listener;
    return std::make_unique<ScriptedConnection>(this, stream, std::move(listener));
}

void ScriptedBackend::set_script(core::StreamId stream, StreamScript script) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& st = state(stream);
    st.script = std::move(script);
    st.next_final = 0;
    st.samples_since_final = 0;
}

void ScriptedBackend::fail_next_connects(core::StreamId stream, int count, asr::RecognitionErrorKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    state(stream).script.failing_connects = count;
    state(stream).script.failure_kind = kind;
}

void ScriptedBackend::set_connect_delay(core::StreamId stream, int ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    state(stream).script.connect_delay_ms = ms;
}

bool ScriptedBackend::inject_final(core::StreamId stream, const std::string& text, double confidence,
                                   int64_t timestamp_ms) {
    std::optional<asr::RecognitionListener> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = state(stream).listener;
    }
    if (!listener || !listener->on_final) return false;
    listener->on_final(text, confidence, timestamp_ms);
    return true;
}

bool ScriptedBackend::inject_interim(core::StreamId stream, const std::string& text, int64_t timestamp_ms) {
    std::optional<asr::RecognitionListener> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = state(stream).listener;
    }
    if (!listener || !listener->on_interim) return false;
    listener->on_interim(text, timestamp_ms);
    return true;
}

bool ScriptedBackend::inject_error(core::StreamId stream, asr::RecognitionErrorKind kind, const std::string& message) {
    std::optional<asr::RecognitionListener> listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = state(stream).listener;
    }
    if (!listener || !listener->on_error) return false;
    listener->on_error(kind, message);
    return true;
}

int ScriptedBackend::connect_calls(core::StreamId stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state(stream).connect_calls;
}

int ScriptedBackend::connections(core::StreamId stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state(stream).connections;
}

int ScriptedBackend::finished(core::StreamId stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state(stream).finished;
}

size_t ScriptedBackend::samples_written(core::StreamId stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state(stream).samples;
}

std::string ScriptedBackend::last_language(core::StreamId stream) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state(stream).language;
}

void ScriptedBackend::on_write(core::StreamId stream, const asr::RecognitionListener& listener, size_t samples) {
    std::optional<std::string> final_text;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& st = state(stream);
        if (!st.script.write_failure.empty()) {
            throw std::runtime_error(st.script.write_failure);
        }
        st.samples += samples;
        st.samples_since_final += samples;
        if (st.next_final < st.script.finals.size() && st.samples_since_final >= st.script.samples_per_final) {
            st.samples_since_final = 0;
            final_text = st.script.finals[st.next_final++];
        }
    }
    if (final_text && listener.on_final) {
        listener.on_final(*final_text, 0.9, core::now_ms());
    }
}

void ScriptedBackend::on_finish(core::StreamId stream, const asr::RecognitionListener& listener) {
    std::string flush;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& st = state(stream);
        st.finished++;
        if (!st.script.finish_failure.empty()) {
            throw std::runtime_error(st.script.finish_failure);
        }
        flush = st.script.flush_final;
    }
    if (!flush.empty() && listener.on_final) {
        listener.on_final(flush, 0.8, core::now_ms());
    }
}

} // namespace test_support
