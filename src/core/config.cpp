#include "core/config.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace core {

using nlohmann::json;

namespace {
template <typename T>
void read(const json& obj, const char* key, T& out, const std::string& section) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError("config: " + section + "." + key + ": " + e.what());
    }
}

const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end()) return empty;
    if (!it->is_object()) {
        throw ConfigError(std::string("config: section '") + name + "' must be an object");
    }
    return *it;
}
} // namespace

AppConfig config_from_json(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("config: top level must be an object");
    }
    AppConfig cfg;

    const json& sources = section(j, "sources");
    read(sources, "microphone", cfg.microphone_device, "sources");
    read(sources, "system", cfg.system_device, "sources");
    read(j, "log_level", cfg.log_level, "root");

    const json& cap = section(j, "capture");
    read(cap, "max_queue_frames", cfg.capture.max_queue_frames, "capture");
    read(cap, "device_buffer_ms", cfg.capture.device_buffer_ms, "capture");
    read(cap, "synthetic_loop", cfg.capture.synthetic_loop, "capture");

    const json& rec = section(j, "recognition");
    read(rec, "language", cfg.recognition.language, "recognition");
    read(rec, "enable_interim_results", cfg.recognition.enable_interim_results, "recognition");
    read(rec, "open_timeout_ms", cfg.recognition.open_timeout_ms, "recognition");
    read(rec, "send_queue_frames", cfg.recognition.send_queue_frames, "recognition");
    read(rec, "whisper_model", cfg.recognition.whisper_model, "recognition");
    read(rec, "whisper_threads", cfg.recognition.whisper_threads, "recognition");
    read(rec, "vad_threshold_dbfs", cfg.recognition.vad_threshold_dbfs, "recognition");
    read(rec, "silence_ms", cfg.recognition.silence_ms, "recognition");
    read(rec, "max_utterance_ms", cfg.recognition.max_utterance_ms, "recognition");
    read(rec, "interim_interval_ms", cfg.recognition.interim_interval_ms, "recognition");

    const json& orch = section(j, "orchestrator");
    read(orch, "stop_grace_ms", cfg.orchestrator.stop_grace_ms, "orchestrator");
    read(orch, "max_reopen_attempts", cfg.orchestrator.max_reopen_attempts, "orchestrator");
    read(orch, "reopen_backoff_ms", cfg.orchestrator.reopen_backoff_ms, "orchestrator");
    read(orch, "reopen_backoff_max_ms", cfg.orchestrator.reopen_backoff_max_ms, "orchestrator");
    read(orch, "inbox_max_frames", cfg.orchestrator.inbox_max_frames, "orchestrator");

    const json& tr = section(j, "transcript");
    read(tr, "max_buffer_size", cfg.transcript.max_buffer_size, "transcript");
    read(tr, "enable_speaker_tagging", cfg.transcript.enable_speaker_tagging, "transcript");
    read(tr, "filter_duplicates", cfg.transcript.filter_duplicates, "transcript");
    read(tr, "duplicate_time_window_ms", cfg.transcript.duplicate_time_window_ms, "transcript");
    read(tr, "similarity_threshold", cfg.transcript.similarity_threshold, "transcript");
    read(tr, "similarity_scan_depth", cfg.transcript.similarity_scan_depth, "transcript");
    read(tr, "containment_bonus", cfg.transcript.containment_bonus, "transcript");
    read(tr, "suppress_non_preferred_when_active",
         cfg.transcript.suppress_non_preferred_when_active, "transcript");
    read(tr, "auto_save", cfg.transcript.auto_save, "transcript");
    read(tr, "auto_save_interval_ms", cfg.transcript.auto_save_interval_ms, "transcript");
    read(tr, "save_directory", cfg.transcript.save_directory, "transcript");
    read(tr, "subtitle_default_duration_ms", cfg.transcript.subtitle_default_duration_ms, "transcript");

    // "preferred_source": "system" | "microphone" | null/"none"
    auto pref = tr.find("preferred_source");
    if (pref != tr.end()) {
        if (pref->is_null()) {
            cfg.transcript.preferred_source.reset();
        } else if (pref->is_string()) {
            const std::string name = pref->get<std::string>();
            if (name == "none") {
                cfg.transcript.preferred_source.reset();
            } else if (auto id = parse_stream_id(name)) {
                cfg.transcript.preferred_source = *id;
            } else {
                throw ConfigError("config: transcript.preferred_source: unknown source '" + name + "'");
            }
        } else {
            throw ConfigError("config: transcript.preferred_source must be a string or null");
        }
    }

    if (cfg.transcript.similarity_threshold < 0.0 || cfg.transcript.similarity_threshold > 1.0) {
        throw ConfigError("config: transcript.similarity_threshold must be within [0, 1]");
    }
    if (cfg.transcript.max_buffer_size == 0) {
        throw ConfigError("config: transcript.max_buffer_size must be positive");
    }
    return cfg;
}

AppConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("config: cannot open " + path);
    }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("config: " + path + ": " + e.what());
    }
    return config_from_json(j);
}

json config_to_json(const AppConfig& cfg) {
    json j;
    j["log_level"] = cfg.log_level;
    j["sources"] = {{"microphone", cfg.microphone_device}, {"system", cfg.system_device}};
    j["capture"] = {
        {"max_queue_frames", cfg.capture.max_queue_frames},
        {"device_buffer_ms", cfg.capture.device_buffer_ms},
        {"synthetic_loop", cfg.capture.synthetic_loop},
    };
    j["recognition"] = {
        {"language", cfg.recognition.language},
        {"enable_interim_results", cfg.recognition.enable_interim_results},
        {"open_timeout_ms", cfg.recognition.open_timeout_ms},
        {"send_queue_frames", cfg.recognition.send_queue_frames},
        {"whisper_model", cfg.recognition.whisper_model},
        {"whisper_threads", cfg.recognition.whisper_threads},
        {"vad_threshold_dbfs", cfg.recognition.vad_threshold_dbfs},
        {"silence_ms", cfg.recognition.silence_ms},
        {"max_utterance_ms", cfg.recognition.max_utterance_ms},
        {"interim_interval_ms", cfg.recognition.interim_interval_ms},
    };
    j["orchestrator"] = {
        {"stop_grace_ms", cfg.orchestrator.stop_grace_ms},
        {"max_reopen_attempts", cfg.orchestrator.max_reopen_attempts},
        {"reopen_backoff_ms", cfg.orchestrator.reopen_backoff_ms},
        {"reopen_backoff_max_ms", cfg.orchestrator.reopen_backoff_max_ms},
        {"inbox_max_frames", cfg.orchestrator.inbox_max_frames},
    };
    j["transcript"] = {
        {"max_buffer_size", cfg.transcript.max_buffer_size},
        {"enable_speaker_tagging", cfg.transcript.enable_speaker_tagging},
        {"filter_duplicates", cfg.transcript.filter_duplicates},
        {"duplicate_time_window_ms", cfg.transcript.duplicate_time_window_ms},
        {"similarity_threshold", cfg.transcript.similarity_threshold},
        {"similarity_scan_depth", cfg.transcript.similarity_scan_depth},
        {"containment_bonus", cfg.transcript.containment_bonus},
        {"suppress_non_preferred_when_active", cfg.transcript.suppress_non_preferred_when_active},
        {"auto_save", cfg.transcript.auto_save},
        {"auto_save_interval_ms", cfg.transcript.auto_save_interval_ms},
        {"save_directory", cfg.transcript.save_directory},
        {"subtitle_default_duration_ms", cfg.transcript.subtitle_default_duration_ms},
    };
    if (cfg.transcript.preferred_source) {
        j["transcript"]["preferred_source"] = to_string(*cfg.transcript.preferred_source);
    } else {
        j["transcript"]["preferred_source"] = nullptr;
    }
    return j;
}

} // namespace core
