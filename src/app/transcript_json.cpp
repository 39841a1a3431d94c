// Copyright (c) 2025 Dualscribe

#include "app/transcript_json.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace app {

using nlohmann::json;

std::string valid_utf8(const std::string& text) {
    const std::string quoted = json(text).dump(-1, ' ', false, json::error_handler_t::replace);
    return json::parse(quoted).get<std::string>();
}

void to_json(json& j, const Transcript& t) {
    j = json{
        {"id", t.id},
        {"sessionId", t.session_id},
        {"streamId", core::to_string(t.stream)},
        {"speaker", t.speaker},
        {"text", t.text},
        {"taggedText", t.tagged_text},
        {"confidence", t.confidence},
        {"timestamp", t.timestamp_ms},
        {"isFinal", t.kind == TranscriptKind::Final},
    };
}

void from_json(const json& j, Transcript& t) {
    j.at("id").get_to(t.id);
    t.session_id = j.value("sessionId", std::string());
    const std::string stream = j.at("streamId").get<std::string>();
    auto id = core::parse_stream_id(stream);
    if (!id) {
        throw std::invalid_argument("unknown streamId '" + stream + "'");
    }
    t.stream = *id;
    t.speaker = j.value("speaker", std::string(core::speaker_label(t.stream)));
    j.at("text").get_to(t.text);
    t.tagged_text = j.value("taggedText", t.text);
    j.at("confidence").get_to(t.confidence);
    j.at("timestamp").get_to(t.timestamp_ms);
    t.kind = j.value("isFinal", true) ? TranscriptKind::Final : TranscriptKind::Interim;
}

void to_json(json& j, const SpeakerStats& s) {
    j = json{
        {"speaker", s.speaker},
        {"transcriptCount", s.transcript_count},
        {"wordCount", s.word_count},
    };
}

void from_json(const json& j, SpeakerStats& s) {
    j.at("speaker").get_to(s.speaker);
    j.at("transcriptCount").get_to(s.transcript_count);
    j.at("wordCount").get_to(s.word_count);
}

void to_json(json& j, const SessionSummary& s) {
    j = json{
        {"sessionId", s.session_id},
        {"startTime", s.start_ms},
        {"endTime", s.end_ms ? json(*s.end_ms) : json(nullptr)},
        {"duration", s.duration_ms},
        {"totalTranscripts", s.total_transcripts},
        {"wordCount", s.total_words},
        {"averageConfidence", s.average_confidence},
        {"speakers", s.speakers},
    };
    if (!s.saved_path.empty()) {
        j["savedPath"] = s.saved_path;
    }
}

void from_json(const json& j, SessionSummary& s) {
    s.session_id = j.value("sessionId", std::string());
    s.start_ms = j.value("startTime", int64_t{0});
    auto end = j.find("endTime");
    if (end != j.end() && !end->is_null()) {
        s.end_ms = end->get<int64_t>();
    } else {
        s.end_ms.reset();
    }
    s.duration_ms = j.value("duration", int64_t{0});
    s.total_transcripts = j.value("totalTranscripts", size_t{0});
    s.total_words = j.value("wordCount", size_t{0});
    s.average_confidence = j.value("averageConfidence", 0.0);
    s.speakers = j.value("speakers", std::vector<SpeakerStats>{});
    s.saved_path = j.value("savedPath", std::string());
}

} // namespace app
