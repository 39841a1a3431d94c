// Dual-stream live transcription console: microphone plus (optionally) system audio
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "app/session_orchestrator.hpp"
#include "app/transcript_export.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "core/time_utils.hpp"

#if defined(DUALSCRIBE_WITH_WHISPER)
#include "asr/whisper_recognition_backend.hpp"
#endif

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

void print_usage() {
    std::cout <<
        "Usage: dualscribe [options]\n"
        "  --config <file>        JSON configuration file\n"
        "  --mic <device>         microphone device id (default: \"default\")\n"
        "  --system <device>      system-audio device id, enables dual capture\n"
        "  --language <tag>       recognition language (default from config)\n"
        "  --model <name>         whisper model name or path\n"
        "  --seconds <n>          stop after n seconds (default: until Ctrl+C)\n"
        "  --export <file>        write the transcript on exit (.json, .txt, .csv, .srt)\n"
        "  --format <fmt>         json | text | csv | subtitle (default: from the --export extension)\n"
        "  --log-level <level>    debug | info | warn | error\n"
        "  -v, --verbose          same as --log-level debug\n"
        "  -h, --help             this text\n"
        "Device ids: \"default\", \"alsa:<pcm>\", \"synthetic:<file.wav>\"\n";
}

void print_event(const app::TranscriptEvent& event) {
    if (auto* f = std::get_if<app::FinalTranscript>(&event)) {
        std::cout << "\r[" << core::format_clock_time(f->transcript.timestamp_ms).substr(0, 8) << "] "
                  << f->transcript.tagged_text << std::endl;
    } else if (auto* i = std::get_if<app::InterimTranscript>(&event)) {
        if (core::log_level() == core::LogLevel::Debug) {
            std::cout << "  ..." << core::speaker_label(i->stream) << ": " << i->text << std::endl;
        }
    } else if (auto* r = std::get_if<app::TranscriptRetracted>(&event)) {
        std::cout << "  (#" << r->id << " replaced by #" << r->replaced_by << ")" << std::endl;
    } else if (auto* saved = std::get_if<app::SessionSaved>(&event)) {
        std::cout << "Session saved: " << saved->path << std::endl;
    } else if (auto* failed = std::get_if<app::PersistenceFailed>(&event)) {
        std::cerr << "Could not save session: " << failed->message << std::endl;
    }
}

void print_summary(const app::SessionSummary& s) {
    std::cout << "\n=== Session " << s.session_id << " ===\n"
              << "Duration:     " << (s.duration_ms / 1000) << " s\n"
              << "Transcripts:  " << s.total_transcripts << "\n"
              << "Words:        " << s.total_words << "\n"
              << "Confidence:   " << s.average_confidence << "\n";
    for (const auto& sp : s.speakers) {
        std::cout << "  " << sp.speaker << ": " << sp.transcript_count << " transcripts, "
                  << sp.word_count << " words\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string mic_device;
    std::string system_device;
    std::string language;
    std::string model;
    std::string export_path;
    std::string format_name;
    std::string log_level;
    int seconds = 0;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help") { print_usage(); return 0; }
        if (a == "-v" || a == "--verbose") { log_level = "debug"; continue; }
        if (a == "--config" && i + 1 < argc) { config_path = argv[++i]; continue; }
        if (a == "--mic" && i + 1 < argc) { mic_device = argv[++i]; continue; }
        if (a == "--system" && i + 1 < argc) { system_device = argv[++i]; continue; }
        if (a == "--language" && i + 1 < argc) { language = argv[++i]; continue; }
        if (a == "--model" && i + 1 < argc) { model = argv[++i]; continue; }
        if (a == "--seconds" && i + 1 < argc) { seconds = std::atoi(argv[++i]); continue; }
        if (a == "--export" && i + 1 < argc) { export_path = argv[++i]; continue; }
        if (a == "--format" && i + 1 < argc) { format_name = argv[++i]; continue; }
        if (a == "--log-level" && i + 1 < argc) { log_level = argv[++i]; continue; }
        std::cerr << "Unknown argument: " << a << "\n";
        print_usage();
        return 2;
    }

    core::AppConfig config;
    try {
        if (!config_path.empty()) config = core::load_config(config_path);
    } catch (const core::ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }
    if (!mic_device.empty()) config.microphone_device = mic_device;
    if (!system_device.empty()) config.system_device = system_device;
    if (!model.empty()) config.recognition.whisper_model = model;
    if (!log_level.empty()) config.log_level = log_level;
    core::set_log_level(core::parse_log_level(config.log_level));

    std::optional<app::ExportFormat> export_format;
    if (!export_path.empty()) {
        // --format wins, then the file extension, then JSON.
        const std::filesystem::path path(export_path);
        std::string name = format_name;
        if (name.empty()) {
            name = path.has_extension() ? path.extension().string().substr(1) : "json";
        }
        try {
            export_format = app::parse_export_format(name);
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << std::endl;
            return 2;
        }
        if (!path.has_extension()) {
            export_path += app::file_extension(*export_format);
        }
    }

#if !defined(DUALSCRIBE_WITH_WHISPER)
    std::cerr << "This build has no recognizer: rebuild with whisper.cpp installed." << std::endl;
    return 1;
#else
    auto backend = std::make_shared<asr::WhisperRecognitionBackend>(config.recognition);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    app::SessionOrchestrator orchestrator(config, backend);
    orchestrator.engine().subscribe(print_event);
    orchestrator.subscribe([](const app::OrchestratorEvent& event) {
        if (auto* fault = std::get_if<app::StreamFault>(&event)) {
            std::cerr << "[" << core::to_string(fault->stream) << "] " << fault->message
                      << (fault->fatal ? " (stream stopped)" : " (reconnecting)") << std::endl;
        } else if (auto* ok = std::get_if<app::StreamRecovered>(&event)) {
            std::cerr << "[" << core::to_string(ok->stream) << "] reconnected" << std::endl;
        }
    });

    app::RecordingOptions options;
    options.language = language;
    try {
        const std::string id = orchestrator.start_recording(options);
        std::cout << "Recording session " << id
                  << (config.dual_capture() ? " (microphone + system audio)" : " (microphone)")
                  << "... press Ctrl+C to stop" << std::endl;
    } catch (const core::RecordingStartError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    const auto started = std::chrono::steady_clock::now();
    while (!g_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (seconds > 0 && std::chrono::steady_clock::now() - started >= std::chrono::seconds(seconds)) {
            break;
        }
    }

    std::cout << "\nStopping..." << std::endl;
    auto summary = orchestrator.stop_recording();
    if (summary) print_summary(*summary);

    if (export_format) {
        std::ofstream out(export_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            std::cerr << "Cannot write " << export_path << std::endl;
            return 1;
        }
        out << orchestrator.engine().export_transcripts(*export_format);
        std::cout << "Transcript written to " << export_path << " (" << app::to_string(*export_format) << ")"
                  << std::endl;
    }
    return 0;
#endif
}
