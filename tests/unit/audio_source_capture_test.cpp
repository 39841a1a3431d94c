#include <atomic>
#include <cassert>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>
#include "audio/audio_source_capture.hpp"
#include "core/errors.hpp"
#include "support/fake_audio_device.hpp"

using core::StreamId;

namespace {

template <typename Pred>
bool wait_until(Pred pred, int timeout_ms = 2000) {
    for (int waited = 0; waited < timeout_ms; waited += 5) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

struct Recorder {
    std::mutex mutex;
    std::vector<audio::AudioFrame> frames;
    std::vector<audio::SourceLifecycleEvent> lifecycle;

    void attach(audio::AudioSourceCapture& cap) {
        cap.on_frame([this](const audio::AudioFrame& f) {
            std::lock_guard<std::mutex> lock(mutex);
            frames.push_back(f);
        });
        cap.on_lifecycle([this](const audio::SourceLifecycleEvent& e) {
            std::lock_guard<std::mutex> lock(mutex);
            lifecycle.push_back(e);
        });
    }
    size_t frame_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return frames.size();
    }
    size_t lifecycle_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return lifecycle.size();
    }
};

void frames_arrive_in_order() {
    test_support::FakeDeviceRegistry devices;
    audio::AudioSourceCapture cap(StreamId::Microphone, core::CaptureConfig{}, devices.factory());
    Recorder rec;
    rec.attach(cap);

    audio::CaptureSpec spec;
    spec.device_id = "mic0";
    cap.acquire(spec);
    cap.acquire(spec);   // already active: no-op
    assert(cap.is_active());
    auto ctl = devices.control("mic0");
    assert(ctl->start_count() == 1);

    for (int16_t i = 0; i < 20; ++i) {
        assert(ctl->emit_pcm(std::vector<int16_t>(160, i)));
    }
    assert(wait_until([&] { return rec.frame_count() == 20; }));
    {
        std::lock_guard<std::mutex> lock(rec.mutex);
        for (size_t i = 0; i < rec.frames.size(); ++i) {
            assert(rec.frames[i].source == StreamId::Microphone);
            assert(rec.frames[i].pcm.size() == 160);
            assert(rec.frames[i].pcm[0] == static_cast<int16_t>(i));
            if (i > 0) assert(rec.frames[i].timestamp_ms >= rec.frames[i - 1].timestamp_ms);
        }
        assert(rec.lifecycle.size() == 1 && rec.lifecycle[0].state == audio::SourceState::Active);
    }

    cap.release();
    cap.release();       // safe to repeat
    assert(!cap.is_active());
    assert(!ctl->started());
    assert(rec.lifecycle_count() == 2);
    assert(!ctl->emit_pcm(std::vector<int16_t>(160, 1)));
}

void float_input_is_converted() {
    test_support::FakeDeviceRegistry devices;
    auto ctl = devices.control("loopback");
    ctl->format = audio::SampleFormat::Float32;
    ctl->sample_rate = 48000;
    ctl->channels = 2;

    Recorder rec;
    audio::AudioSourceCapture cap(StreamId::SystemAudio, core::CaptureConfig{}, devices.factory());
    rec.attach(cap);
    audio::CaptureSpec spec;
    spec.device_id = "loopback";
    cap.acquire(spec);

    std::vector<float> stereo(960 * 2, 2.0f);   // out of range: clamped
    ctl->emit_float(stereo);
    assert(wait_until([&] { return rec.frame_count() == 1; }));
    std::lock_guard<std::mutex> lock(rec.mutex);
    assert(rec.frames[0].pcm.size() == 320);
    assert(rec.frames[0].pcm[10] == 32767);
}

void acquisition_failures() {
    test_support::FakeDeviceRegistry devices;
    devices.make_unavailable("ghost");
    devices.control("busy")->fail_initialize = true;
    devices.control("s24")->format = audio::SampleFormat::Int24;

    audio::AudioSourceCapture cap(StreamId::Microphone, core::CaptureConfig{}, devices.factory());
    audio::CaptureSpec spec;

    spec.device_id = "ghost";
    bool threw = false;
    try { cap.acquire(spec); } catch (const core::AcquisitionError&) { threw = true; }
    assert(threw);

    spec.device_id = "busy";
    threw = false;
    try {
        cap.acquire(spec);
    } catch (const core::AcquisitionError& e) {
        threw = std::string(e.what()).find("device busy") != std::string::npos;
    }
    assert(threw);

    spec.device_id = "s24";
    threw = false;
    try { cap.acquire(spec); } catch (const core::UnsupportedFormatError&) { threw = true; }
    assert(threw);
    assert(!cap.is_active());
}

void slow_consumer_drops_oldest() {
    core::CaptureConfig cfg;
    cfg.max_queue_frames = 4;
    test_support::FakeDeviceRegistry devices;
    audio::AudioSourceCapture cap(StreamId::Microphone, cfg, devices.factory());

    std::atomic<bool> gate{false};
    std::mutex mutex;
    std::vector<int16_t> seen;
    cap.on_frame([&](const audio::AudioFrame& f) {
        while (!gate.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(f.pcm[0]);
    });

    audio::CaptureSpec spec;
    spec.device_id = "mic";
    cap.acquire(spec);
    auto ctl = devices.control("mic");

    // First frame is taken by the (blocked) consumer; the rest pile up
    ctl->emit_pcm(std::vector<int16_t>(160, 0));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    for (int16_t i = 1; i <= 10; ++i) {
        ctl->emit_pcm(std::vector<int16_t>(160, i));   // never blocks
    }
    assert(cap.dropped_frames() == 6);
    gate.store(true);
    assert(wait_until([&] { std::lock_guard<std::mutex> lock(mutex); return seen.size() == 5; }));
    {
        std::lock_guard<std::mutex> lock(mutex);
        assert((seen == std::vector<int16_t>{0, 7, 8, 9, 10}));
    }
    cap.release();
}

void fatal_device_error_marks_inactive() {
    test_support::FakeDeviceRegistry devices;
    audio::AudioSourceCapture cap(StreamId::Microphone, core::CaptureConfig{}, devices.factory());
    Recorder rec;
    rec.attach(cap);
    audio::CaptureSpec spec;
    spec.device_id = "usb";
    cap.acquire(spec);
    auto ctl = devices.control("usb");

    ctl->emit_error("xrun", false);
    assert(cap.is_active());
    ctl->emit_error("device unplugged", true);
    assert(!cap.is_active());
    {
        std::lock_guard<std::mutex> lock(rec.mutex);
        assert(rec.lifecycle.size() == 2);
        assert(rec.lifecycle[1].state == audio::SourceState::Inactive);
        assert(rec.lifecycle[1].reason == "device unplugged");
    }

    // Can be acquired again after the device died
    cap.acquire(spec);
    assert(cap.is_active());
    assert(ctl->start_count() == 2);
    cap.release();
}

} // namespace

int main() {
    frames_arrive_in_order();
    float_input_is_converted();
    acquisition_failures();
    slow_consumer_drops_oldest();
    fatal_device_error_marks_inactive();
    return 0;
}
