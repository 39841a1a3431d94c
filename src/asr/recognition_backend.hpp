#pragma once
#include "core/stream_id.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace asr {

struct LanguageConfig {
    std::string language = "en-US";     // BCP-47 tag
    bool enable_interim_results = true;
};

enum class RecognitionErrorKind {
    Authentication,
    Connectivity,
    Protocol
};

inline const char* to_string(RecognitionErrorKind kind) {
    switch (kind) {
        case RecognitionErrorKind::Authentication: return "authentication";
        case RecognitionErrorKind::Connectivity:   return "connectivity";
        case RecognitionErrorKind::Protocol:       return "protocol";
    }
    return "protocol";
}

// Callbacks a connection uses to report results. They may be invoked from
// any thread the backend owns, including after the connection was dropped.
struct RecognitionListener {
    std::function<void(const std::string& text, int64_t timestamp_ms)> on_interim;
    std::function<void(const std::string& text, double confidence, int64_t timestamp_ms)> on_final;
    std::function<void(RecognitionErrorKind kind, const std::string& message)> on_error;
};

/// One duplex stream to a recognizer. Destroying it drops the stream.
class IRecognitionConnection {
public:
    virtual ~IRecognitionConnection() = default;

    /// Sends canonical PCM (16 kHz mono int16).
    /// @throws core::ConnectivityError when the stream is gone
    virtual void write(const std::vector<int16_t>& pcm) = 0;

    /// Flushes pending audio and ends the stream. Final results for audio
    /// already written are delivered before this returns.
    virtual void finish() = 0;
};

/// Factory for recognizer connections (local model or remote service).
class IRecognitionBackend {
public:
    virtual ~IRecognitionBackend() = default;

    /// @throws core::AuthenticationError when credentials are rejected
    /// @throws core::ConnectivityError when the recognizer is unreachable
    virtual std::unique_ptr<IRecognitionConnection> connect(
        core::StreamId stream,
        const LanguageConfig& language,
        RecognitionListener listener) = 0;

    virtual std::string name() const = 0;
};

} // namespace asr
