#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace core {

/// Base class for every error the engine throws.
class DualscribeError : public std::runtime_error {
public:
    explicit DualscribeError(const std::string& what) : std::runtime_error(what) {}
};

/// Device could not be opened (missing device, permission denied, busy).
class AcquisitionError : public DualscribeError {
public:
    using DualscribeError::DualscribeError;
};

/// Device or buffer delivers a sample format the converter cannot handle.
class UnsupportedFormatError : public DualscribeError {
public:
    using DualscribeError::DualscribeError;
};

/// Recognizer rejected the credentials. Never retried.
class AuthenticationError : public DualscribeError {
public:
    using DualscribeError::DualscribeError;
};

/// Recognizer unreachable, timed out, or dropped the connection.
class ConnectivityError : public DualscribeError {
public:
    using DualscribeError::DualscribeError;
};

/// open() called on a recognition session that is not Idle.
class AlreadyOpenError : public DualscribeError {
public:
    using DualscribeError::DualscribeError;
};

/// Session file could not be written. Reported, never fatal.
class PersistenceError : public DualscribeError {
public:
    using DualscribeError::DualscribeError;
};

/// Configuration file unreadable or has the wrong types.
class ConfigError : public DualscribeError {
public:
    using DualscribeError::DualscribeError;
};

/// Aggregated failure of SessionOrchestrator::start_recording.
/// Everything opened before the failure has been rolled back.
class RecordingStartError : public DualscribeError {
public:
    explicit RecordingStartError(std::vector<std::string> failures)
        : DualscribeError(join(failures)), failures_(std::move(failures)) {}

    const std::vector<std::string>& failures() const { return failures_; }

private:
    static std::string join(const std::vector<std::string>& failures) {
        std::string msg = "Failed to start recording";
        for (size_t i = 0; i < failures.size(); ++i) {
            msg += (i == 0 ? ": " : "; ");
            msg += failures[i];
        }
        return msg;
    }

    std::vector<std::string> failures_;
};

} // namespace core
