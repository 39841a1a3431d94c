#include "asr/streaming_recognition_session.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <exception>
#include <limits>

namespace asr {

// Shared between the session and every listener callback of one connection.
// Callbacks hold the relay mutex while they run; detach() takes the same
// mutex, so once it returns no callback can reach the session any more.
struct StreamingRecognitionSession::ListenerRelay {
    ListenerRelay(StreamingRecognitionSession* o, uint64_t g) : owner(o), generation(g) {}

    std::mutex mutex;
    StreamingRecognitionSession* owner;
    const uint64_t generation;
};

namespace {

struct PendingConnect {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool abandoned = false;
    std::unique_ptr<IRecognitionConnection> connection;
    std::exception_ptr error;
};

std::string tag(core::StreamId stream) {
    return std::string("[recognition:") + core::to_string(stream) + "] ";
}

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle:    return "idle";
        case SessionState::Opening: return "opening";
        case SessionState::Active:  return "active";
        case SessionState::Closing: return "closing";
    }
    return "idle";
}

StreamingRecognitionSession::StreamingRecognitionSession(std::shared_ptr<IRecognitionBackend> backend,
                                                         const core::RecognitionConfig& config)
    : backend_(std::move(backend))
    , config_(config)
    , send_queue_(static_cast<size_t>(std::max(1, config.send_queue_frames))) {}

StreamingRecognitionSession::~StreamingRecognitionSession() {
    if (auto s = stream()) {
        close(*s);
    }
    reap_dead_connection();
}

void StreamingRecognitionSession::on_result(ResultCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    result_callbacks_.push_back(std::move(callback));
}

void StreamingRecognitionSession::on_error(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    error_callbacks_.push_back(std::move(callback));
}

SessionState StreamingRecognitionSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<core::StreamId> StreamingRecognitionSession::stream() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_;
}

void StreamingRecognitionSession::detach(const std::shared_ptr<ListenerRelay>& relay) {
    if (!relay) return;
    std::lock_guard<std::mutex> lock(relay->mutex);
    relay->owner = nullptr;
}

RecognitionListener StreamingRecognitionSession::make_listener(const std::shared_ptr<ListenerRelay>& relay) {
    RecognitionListener listener;
    listener.on_interim = [relay](const std::string& text, int64_t timestamp_ms) {
        std::lock_guard<std::mutex> lock(relay->mutex);
        if (relay->owner) {
            relay->owner->handle_result(relay->generation, ResultKind::Interim, text, 0.0, timestamp_ms);
        }
    };
    listener.on_final = [relay](const std::string& text, double confidence, int64_t timestamp_ms) {
        std::lock_guard<std::mutex> lock(relay->mutex);
        if (relay->owner) {
            relay->owner->handle_result(relay->generation, ResultKind::Final, text, confidence, timestamp_ms);
        }
    };
    listener.on_error = [relay](RecognitionErrorKind kind, const std::string& message) {
        std::lock_guard<std::mutex> lock(relay->mutex);
        if (relay->owner) {
            relay->owner->handle_error(relay->generation, kind, message);
        }
    };
    return listener;
}

void StreamingRecognitionSession::open(core::StreamId stream, const LanguageConfig& language) {
    reap_dead_connection();

    std::shared_ptr<ListenerRelay> relay;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Idle) {
            throw core::AlreadyOpenError(tag(stream) + "session is " + to_string(state_));
        }
        state_ = SessionState::Opening;
        stream_ = stream;
        generation = ++generation_;
        relay = std::make_shared<ListenerRelay>(this, generation);
        interim_enabled_ = language.enable_interim_results;
        last_interim_ts_ = std::numeric_limits<int64_t>::min();
        last_final_ts_ = std::numeric_limits<int64_t>::min();
    }

    auto abort_open = [this, &relay]() {
        detach(relay);
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SessionState::Idle;
        stream_.reset();
    };

    // connect() may hang on a dead network; run it aside so open() stays bounded.
    auto pending = std::make_shared<PendingConnect>();
    auto backend = backend_;
    RecognitionListener listener = make_listener(relay);
    std::thread([pending, backend, stream, language, listener]() {
        std::unique_ptr<IRecognitionConnection> connection;
        std::exception_ptr error;
        try {
            connection = backend->connect(stream, language, listener);
        } catch (...) {
            error = std::current_exception();
        }
        std::unique_lock<std::mutex> lock(pending->mutex);
        if (pending->abandoned) {
            lock.unlock();
            if (connection) {
                core::log_warn(tag(stream) + "discarding connection that arrived after the open timeout");
            }
            return;
        }
        pending->connection = std::move(connection);
        pending->error = error;
        pending->done = true;
        pending->cv.notify_all();
    }).detach();

    std::unique_ptr<IRecognitionConnection> connection;
    std::exception_ptr error;
    {
        std::unique_lock<std::mutex> lock(pending->mutex);
        const auto timeout = std::chrono::milliseconds(std::max(1, config_.open_timeout_ms));
        if (!pending->cv.wait_for(lock, timeout, [&] { return pending->done; })) {
            pending->abandoned = true;
            lock.unlock();
            abort_open();
            throw core::ConnectivityError(tag(stream) + "connect timed out after " +
                                          std::to_string(config_.open_timeout_ms) + " ms");
        }
        connection = std::move(pending->connection);
        error = pending->error;
    }

    if (error) {
        abort_open();
        try {
            std::rethrow_exception(error);
        } catch (const core::AuthenticationError&) {
            throw;
        } catch (const core::ConnectivityError&) {
            throw;
        } catch (const std::exception& e) {
            throw core::ConnectivityError(tag(stream) + "connect failed: " + e.what());
        }
    }
    if (!connection) {
        abort_open();
        throw core::ConnectivityError(tag(stream) + backend_->name() + " returned no connection");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Opening || generation_ != generation) {
            // The connection reported an error before we could activate it.
            state_ = SessionState::Idle;
            stream_.reset();
        } else {
            connection_ = std::move(connection);
            relay_ = relay;
            send_queue_.reset();
            last_logged_drops_ = send_queue_.dropped_count();
            state_ = SessionState::Active;
            writer_thread_ = std::thread(&StreamingRecognitionSession::writer_loop, this, connection_.get(), generation);
        }
    }
    if (connection) {
        detach(relay);
        connection.reset();
        throw core::ConnectivityError(tag(stream) + "connection failed while opening");
    }
    core::log_info(tag(stream) + "active (" + backend_->name() + ", " + language.language + ")");
}

bool StreamingRecognitionSession::push_frame(core::StreamId stream, const audio::AudioFrame& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Active || !stream_ || *stream_ != stream) {
        return false;
    }
    send_queue_.push(std::vector<int16_t>(frame.pcm));

    const size_t drops = send_queue_.dropped_count();
    if (drops != last_logged_drops_ && (last_logged_drops_ == 0 || drops - last_logged_drops_ >= 100)) {
        core::log_warn(tag(stream) + "recognizer too slow, dropped " + std::to_string(drops) + " frame(s) so far");
        last_logged_drops_ = drops;
    }
    return true;
}

void StreamingRecognitionSession::close(core::StreamId stream) {
    IRecognitionConnection* connection = nullptr;
    std::thread writer;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!stream_ || *stream_ != stream) {
            return;
        }
        if (state_ == SessionState::Idle) {
            lock.unlock();
            reap_dead_connection();
            lock.lock();
            stream_.reset();
            return;
        }
        if (state_ != SessionState::Active) {
            return;
        }
        state_ = SessionState::Closing;
        connection = connection_.get();
        writer = std::move(writer_thread_);
    }

    // Writer drains whatever is queued, then exits.
    send_queue_.close();
    if (writer.joinable()) {
        writer.join();
    }
    try {
        connection->finish();
    } catch (const std::exception& e) {
        // The connection is released below whatever the backend reported.
        core::log_warn(tag(stream) + "finish failed: " + e.what());
    }

    std::unique_ptr<IRecognitionConnection> released;
    std::shared_ptr<ListenerRelay> relay;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released = std::move(connection_);
        relay = std::move(relay_);
        state_ = SessionState::Idle;
        stream_.reset();
    }
    detach(relay);
    released.reset();
    core::log_info(tag(stream) + "closed");
}

void StreamingRecognitionSession::reap_dead_connection() {
    std::unique_ptr<IRecognitionConnection> connection;
    std::shared_ptr<ListenerRelay> relay;
    std::thread writer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Idle) return;
        connection = std::move(connection_);
        relay = std::move(relay_);
        writer = std::move(writer_thread_);
    }
    if (!connection && !relay && !writer.joinable()) return;

    send_queue_.close();
    if (writer.joinable()) {
        writer.join();
    }
    detach(relay);
    connection.reset();
}

void StreamingRecognitionSession::writer_loop(IRecognitionConnection* connection, uint64_t generation) {
    std::vector<int16_t> pcm;
    while (send_queue_.pop(pcm)) {
        try {
            connection->write(pcm);
        } catch (const core::AuthenticationError& e) {
            handle_error(generation, RecognitionErrorKind::Authentication, e.what());
            return;
        } catch (const std::exception& e) {
            handle_error(generation, RecognitionErrorKind::Connectivity, e.what());
            return;
        }
    }
}

void StreamingRecognitionSession::handle_result(uint64_t generation, ResultKind kind, const std::string& text,
                                                double confidence, int64_t timestamp_ms) {
    RecognitionResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || state_ == SessionState::Idle || !stream_) {
            return;
        }
        if (kind == ResultKind::Interim && !interim_enabled_) {
            return;
        }
        result.stream = *stream_;
        result.kind = kind;
        result.text = text;
        result.confidence = std::isnan(confidence) ? 0.0 : std::clamp(confidence, 0.0, 1.0);
        int64_t& last = (kind == ResultKind::Interim) ? last_interim_ts_ : last_final_ts_;
        result.timestamp_ms = std::max(timestamp_ms, last);
        last = result.timestamp_ms;
    }

    std::vector<ResultCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = result_callbacks_;
    }
    for (auto& cb : callbacks) {
        cb(result);
    }
}

void StreamingRecognitionSession::handle_error(uint64_t generation, RecognitionErrorKind kind,
                                               const std::string& message) {
    SessionError error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !stream_) {
            return;
        }
        if (state_ == SessionState::Closing) {
            core::log_warn(tag(*stream_) + "error while closing: " + message);
            return;
        }
        if (state_ == SessionState::Idle) {
            return;
        }
        state_ = SessionState::Idle;
        error.stream = *stream_;
        error.kind = kind;
        error.message = message;
        error.fatal = (kind == RecognitionErrorKind::Authentication);
    }
    send_queue_.close();
    core::log_error(tag(error.stream) + to_string(kind) + " error: " + message);

    std::vector<ErrorCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = error_callbacks_;
    }
    for (auto& cb : callbacks) {
        cb(error);
    }
}

} // namespace asr
