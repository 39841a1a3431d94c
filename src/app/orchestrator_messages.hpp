// Copyright (c) 2025 Dualscribe
// Messages carried by the orchestration loop's inbox.

#pragma once
#include "app/transcript_types.hpp"
#include "asr/streaming_recognition_session.hpp"
#include "audio/audio_source_capture.hpp"

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace app {

struct FrameMessage {
    audio::AudioFrame frame;
};

struct ResultMessage {
    asr::RecognitionResult result;
};

struct SessionFaultMessage {
    asr::SessionError error;
};

struct SourceMessage {
    core::StreamId stream = core::StreamId::Microphone;
    bool active = false;
    std::string reason;
};

// Seal the transcript session on the loop thread, after every result queued before it.
struct SealMessage {
    std::shared_ptr<std::promise<std::optional<SessionSummary>>> done;
};

using ControlMessage = std::variant<SessionFaultMessage, SourceMessage, SealMessage>;

using Message = std::variant<FrameMessage, ResultMessage, ControlMessage>;

// Only audio may be dropped when the loop falls behind.
inline bool is_droppable(const Message& m) {
    return std::holds_alternative<FrameMessage>(m);
}

} // namespace app
