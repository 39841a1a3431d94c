#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>
#include "app/session_store.hpp"
#include "app/transcript_engine.hpp"
#include "core/errors.hpp"
#include "support/wav_writer.hpp"

namespace fs = std::filesystem;

static void save_and_load() {
    const std::string dir = test_support::make_temp_dir("dualscribe_store");
    app::SessionStore store(dir + "/nested");

    app::Session session;
    session.id = "session_1700000000000_abcdefghij";
    session.start_ms = 1700000000000;
    session.end_ms = 1700000060000;
    session.metadata = {{"capture_mode", "dual"}};

    app::Transcript t;
    t.id = 7;
    t.session_id = session.id;
    t.stream = core::StreamId::SystemAudio;
    t.speaker = "Other";
    t.text = "welcome";
    t.tagged_text = "[Other] welcome";
    t.confidence = 0.5;
    t.timestamp_ms = 1700000001000;

    app::SessionSummary summary;
    summary.session_id = session.id;
    summary.start_ms = session.start_ms;
    summary.end_ms = session.end_ms;
    summary.duration_ms = 60000;
    summary.total_transcripts = 1;
    summary.total_words = 1;
    summary.average_confidence = 0.5;
    summary.speakers = {app::SpeakerStats{"Other", 1, 1}};

    const std::string path = store.save(session, {t}, summary);
    assert(fs::exists(path));
    assert(fs::path(path).filename().string() == "session_2023-11-14T22-13-20-000Z.json");
    assert(!fs::exists(path + ".tmp"));

    auto rec = store.load(path);
    assert(rec.session.id == session.id);
    assert(rec.session.end_ms && *rec.session.end_ms == *session.end_ms);
    assert(rec.session.metadata.at("capture_mode") == "dual");
    assert(rec.transcripts.size() == 1 && rec.transcripts[0].text == "welcome");
    assert(rec.transcripts[0].stream == core::StreamId::SystemAudio);
    assert(rec.summary.total_words == 1);
    assert(rec.summary.speakers.size() == 1 && rec.summary.speakers[0].speaker == "Other");
    assert(rec.exported_at_ms > 0);

    // Later sessions sort after earlier ones
    app::Session later = session;
    later.start_ms += 3600000;
    store.save(later, {}, summary);
    auto files = store.list();
    assert(files.size() == 2);
    assert(files[0] == path);

    // Broken files are reported, not parsed
    std::ofstream(dir + "/nested/session_broken.json") << "{";
    bool threw = false;
    try { store.load(dir + "/nested/session_broken.json"); } catch (const core::PersistenceError&) { threw = true; }
    assert(threw);
}

static void engine_keeps_log_when_save_fails() {
    const std::string dir = test_support::make_temp_dir("dualscribe_store_fail");
    // A regular file where the save directory should be
    const std::string blocker = dir + "/blocker";
    std::ofstream(blocker) << "x";

    core::TranscriptConfig cfg;
    cfg.auto_save = false;
    cfg.save_directory = blocker + "/sessions";
    app::TranscriptEngine engine(cfg);

    std::vector<std::string> failures;
    int ended = 0;
    engine.subscribe([&](const app::TranscriptEvent& e) {
        if (auto* f = std::get_if<app::PersistenceFailed>(&e)) failures.push_back(f->message);
        if (std::holds_alternative<app::SessionEnded>(e)) ended++;
    });

    engine.start_session();
    engine.add_final(core::StreamId::Microphone, "do not lose me", 0.9, 100);
    assert(!engine.save_now());
    assert(failures.size() == 1);

    auto summary = engine.end_session();
    assert(summary);
    assert(summary->saved_path.empty());
    assert(summary->total_transcripts == 1);
    assert(failures.size() == 2);
    assert(ended == 1);
    assert(engine.all().size() == 1 && engine.all()[0].text == "do not lose me");
}

static void autosave_writes_while_active() {
    const std::string dir = test_support::make_temp_dir("dualscribe_autosave");
    core::TranscriptConfig cfg;
    cfg.auto_save = true;
    cfg.auto_save_interval_ms = 50;
    cfg.save_directory = dir;
    app::TranscriptEngine engine(cfg);

    std::atomic<int> saved{0};
    engine.subscribe([&](const app::TranscriptEvent& e) {
        if (std::holds_alternative<app::SessionSaved>(e)) saved++;
    });
    engine.start_session();
    assert(engine.status().auto_save_enabled);
    engine.add_final(core::StreamId::Microphone, "autosaved", 0.9, 100);

    for (int i = 0; i < 100 && saved.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    engine.end_session();
    assert(saved.load() >= 2);   // at least one periodic save plus the final one
    assert(!engine.status().auto_save_enabled);
    assert(app::SessionStore(dir).list().size() == 1);
}

int main() {
    save_and_load();
    engine_keeps_log_when_save_fails();
    autosave_writes_while_active();
    return 0;
}
