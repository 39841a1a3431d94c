// End-to-end smoke test: two file-backed sources play the same recording
// through the whole pipeline; only the system-audio copy must survive.
#include <cassert>
#include <chrono>
#include <filesystem>
#include <memory>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>
#include "app/session_orchestrator.hpp"
#include "app/transcript_export.hpp"
#include "core/logging.hpp"
#include "support/scripted_backend.hpp"
#include "support/wav_writer.hpp"

using core::StreamId;

int main() {
    core::set_log_level(core::LogLevel::Debug);

    const std::string dir = test_support::make_temp_dir("dualscribe_smoke");
    const std::string wav = dir + "/meeting.wav";
    std::vector<int16_t> samples = test_support::silence(200);
    test_support::append(samples, test_support::tone(1000));
    test_support::append(samples, test_support::silence(300));
    assert(test_support::write_wav(wav, samples));

    // The far end's voice reaches the microphone too (speakers, no headset).
    auto backend = std::make_shared<test_support::ScriptedBackend>();
    test_support::ScriptedBackend::StreamScript script;
    script.finals = {"Welcome everyone to the meeting."};
    script.samples_per_final = 12000;
    backend->set_script(StreamId::Microphone, script);
    backend->set_script(StreamId::SystemAudio, script);

    core::AppConfig cfg;
    cfg.microphone_device = "synthetic:" + wav;
    cfg.system_device = "synthetic:" + wav;
    cfg.orchestrator.stop_grace_ms = 100;
    cfg.transcript.save_directory = dir + "/sessions";
    cfg.transcript.auto_save = true;
    cfg.transcript.auto_save_interval_ms = 60000;

    app::SessionOrchestrator orch(cfg, backend);
    orch.start_recording();

    // Audio is paced in real time; give both sources time to reach 0.75 s.
    for (int i = 0; i < 100 && backend->samples_written(StreamId::Microphone) < 16000; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    for (int i = 0; i < 100 && backend->samples_written(StreamId::SystemAudio) < 16000; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    auto summary = orch.stop_recording();
    assert(summary);
    assert(summary->total_transcripts == 1);
    assert(!summary->saved_path.empty());
    assert(std::filesystem::exists(summary->saved_path));

    auto all = orch.engine().all();
    assert(all.size() == 1);
    assert(all[0].speaker == "Other");
    assert(all[0].tagged_text == "[Other] Welcome everyone to the meeting.");

    const std::string text = orch.engine().export_transcripts(app::ExportFormat::Text);
    assert(text.find("[Other] Welcome everyone to the meeting.") != std::string::npos);
    assert(text.find("[Me]") == std::string::npos);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    return 0;
}
