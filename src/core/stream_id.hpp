#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace core {

// The two physical sources the engine knows about. The set is closed:
// every switch over StreamId is exhaustive.
enum class StreamId {
    Microphone,
    SystemAudio
};

constexpr size_t stream_index(StreamId id) {
    return id == StreamId::Microphone ? 0 : 1;
}

// Wire name used in config files, session files and logs.
inline const char* to_string(StreamId id) {
    switch (id) {
        case StreamId::Microphone:  return "microphone";
        case StreamId::SystemAudio: return "system";
    }
    return "microphone";
}

// Fixed speaker label shown to consumers.
inline const char* speaker_label(StreamId id) {
    switch (id) {
        case StreamId::Microphone:  return "Me";
        case StreamId::SystemAudio: return "Other";
    }
    return "Me";
}

inline std::optional<StreamId> parse_stream_id(const std::string& name) {
    if (name == "microphone" || name == "mic") return StreamId::Microphone;
    if (name == "system" || name == "system-audio" || name == "loopback") return StreamId::SystemAudio;
    return std::nullopt;
}

} // namespace core
