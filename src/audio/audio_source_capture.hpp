#pragma once

#include "audio/audio_input_device.hpp"
#include "audio/pcm_convert.hpp"
#include "core/config.hpp"
#include "core/message_channel.hpp"
#include "core/stream_id.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace audio {

/// One block of canonical audio (16 kHz, mono, int16) from one source.
struct AudioFrame {
    core::StreamId source = core::StreamId::Microphone;
    int64_t timestamp_ms = 0;        ///< Capture time (ms since epoch)
    std::vector<int16_t> pcm;
};

/// Which device to open for a source.
struct CaptureSpec {
    std::string device_id;           ///< "default", "alsa:<pcm>", "synthetic:<file.wav>"
    int sample_rate = 16000;         ///< Requested device rate (converted to 16 kHz regardless)
    int channels = 1;
};

enum class SourceState {
    Active,
    Inactive
};

/// `source-active` / `source-inactive` lifecycle notification.
struct SourceLifecycleEvent {
    core::StreamId source;
    SourceState state;
    std::string reason;
};

using FrameCallback = std::function<void(const AudioFrame&)>;
using LifecycleCallback = std::function<void(const SourceLifecycleEvent&)>;

/**
 * @brief Continuous capture of one physical source, normalized to canonical PCM
 *
 * Threading:
 * - The device callback runs on the platform audio thread. It converts the
 *   buffer and pushes it into a bounded queue; it never blocks.
 * - One delivery thread pops frames in arrival order and invokes the frame
 *   callbacks.
 * - When consumers fall behind, the oldest queued frames are dropped
 *   (max depth = CaptureConfig::max_queue_frames) and counted.
 */
class AudioSourceCapture {
public:
    AudioSourceCapture(core::StreamId source, const core::CaptureConfig& config, DeviceFactory factory = nullptr);
    ~AudioSourceCapture();

    AudioSourceCapture(const AudioSourceCapture&) = delete;
    AudioSourceCapture& operator=(const AudioSourceCapture&) = delete;

    /// Opens the device and starts delivering frames. No-op if already active.
    /// @throws core::AcquisitionError on device/permission failure
    /// @throws core::UnsupportedFormatError when the device format cannot be converted
    void acquire(const CaptureSpec& spec);

    /// Stops the device and the delivery thread. Safe to call repeatedly.
    void release();

    /// Subscribe to frames. Call before acquire(); callbacks run on the delivery thread.
    void on_frame(FrameCallback callback);

    /// Subscribe to lifecycle events.
    void on_lifecycle(LifecycleCallback callback);

    bool is_active() const { return active_.load(); }
    core::StreamId source() const { return source_; }

    size_t dropped_frames() const { return queue_.dropped_count(); }
    size_t delivered_frames() const { return delivered_frames_.load(); }
    size_t rejected_buffers() const { return rejected_buffers_.load(); }

    /// Devices the default factory can open.
    static std::vector<AudioDeviceInfo> enumerate();

private:
    void handle_audio(const AudioBuffer& buffer);
    void handle_device_error(const std::string& message, bool is_fatal);
    void delivery_loop();
    void emit_lifecycle(SourceState state, const std::string& reason);
    std::string tag() const;

    const core::StreamId source_;
    const core::CaptureConfig config_;
    DeviceFactory factory_;

    std::mutex lifecycle_mutex_;          // serializes acquire/release
    std::unique_ptr<IAudioInputDevice> device_;
    std::thread delivery_thread_;
    core::MessageChannel<AudioFrame> queue_;

    std::mutex callbacks_mutex_;
    std::vector<FrameCallback> frame_callbacks_;
    std::vector<LifecycleCallback> lifecycle_callbacks_;

    std::mutex device_error_mutex_;
    std::string last_device_error_;

    std::atomic<bool> accepting_{false};
    std::atomic<bool> active_{false};
    std::atomic<size_t> delivered_frames_{0};
    std::atomic<size_t> rejected_buffers_{0};
    size_t last_logged_drops_ = 0;        // audio thread only
    StreamResampler resampler_;           // audio thread only; reset by acquire()
};

} // namespace audio
