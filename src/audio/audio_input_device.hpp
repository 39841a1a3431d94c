#pragma once

#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <cstdint>

namespace audio {

/**
 * @brief Sample encodings a device may deliver
 */
enum class SampleFormat {
    Int16,      // signed 16-bit, native endian
    Float32,    // IEEE float in [-1, 1]
    Int24,      // packed 24-bit (reported by some devices, not converted)
    Unknown
};

const char* to_string(SampleFormat format);

/**
 * @brief What kind of endpoint a device is
 */
enum class DeviceKind {
    Input,      // microphone / line-in
    Monitor,    // loopback of what the system plays
    Synthetic   // file playback
};

/**
 * @brief Metadata about an audio input device
 */
struct AudioDeviceInfo {
    std::string id;              // Unique device identifier ("alsa:default", "synthetic:file.wav")
    std::string name;            // Human-readable name
    std::string driver;          // Driver/API name ("ALSA", "Synthetic")
    DeviceKind kind;
    int default_sample_rate;     // Native sample rate (48000, 44100, etc.)
    int max_channels;            // Maximum supported channels
    bool is_default;             // Is this the system default device?

    AudioDeviceInfo()
        : kind(DeviceKind::Input)
        , default_sample_rate(48000)
        , max_channels(2)
        , is_default(false) {}
};

/**
 * @brief Configuration for audio input capture
 */
struct AudioInputConfig {
    std::string device_id;       // Device to use (empty = system default)
    int sample_rate = 16000;     // Requested sample rate
    int channels = 1;            // Mono = 1, Stereo = 2
    int buffer_size_ms = 20;     // Period size in milliseconds (affects latency)
    SampleFormat format = SampleFormat::Int16;  // Negotiated format (filled by the device)

    // For synthetic device only
    std::string synthetic_file_path;    // Path to WAV file
    bool synthetic_loop = false;        // Loop playback?
};

/**
 * @brief One buffer as delivered by a device
 *
 * `data` points at `sample_count` interleaved samples in `format`
 * (for stereo, sample_count = frames * 2). Valid only during the callback.
 */
struct AudioBuffer {
    SampleFormat format = SampleFormat::Int16;
    const void* data = nullptr;
    size_t sample_count = 0;
    int sample_rate = 16000;
    int channels = 1;
};

// Runs on the device thread; must not block.
using AudioCallback = std::function<void(const AudioBuffer& buffer)>;

// is_fatal: the device has stopped and must be initialized again.
using ErrorCallback = std::function<void(const std::string& error_message, bool is_fatal)>;

/**
 * @brief Capture endpoint
 *
 * Implementations: AudioInputDevice_Alsa (Linux capture and monitor
 * sources), AudioInputDevice_Synthetic (WAV playback). A failing
 * initialize() reports its reason through the error callback before
 * returning false.
 */
class IAudioInputDevice {
public:
    virtual ~IAudioInputDevice() = default;

    virtual bool initialize(const AudioInputConfig& config,
                            AudioCallback audio_callback,
                            ErrorCallback error_callback) = 0;
    virtual bool start() = 0;
    virtual void stop() = 0;        ///< Idempotent; no callbacks after it returns
    virtual bool is_capturing() const = 0;
    virtual AudioDeviceInfo get_device_info() const = 0;

    /// Negotiated configuration, including the sample format actually delivered.
    virtual AudioInputConfig get_actual_config() const = 0;
};

class AudioInputFactory {
public:
    /// Platform devices plus a synthetic placeholder entry.
    static std::vector<AudioDeviceInfo> enumerate_devices();

    /**
     * @param device_id "" or "default" = system default capture device,
     *                  "alsa:<pcm>" = a specific ALSA PCM,
     *                  "synthetic:<file.wav>" = file playback
     * @return nullptr when no backend in this build handles the id
     */
    static std::unique_ptr<IAudioInputDevice> create_device(const std::string& device_id = "");
};

/// Device factory seam used by AudioSourceCapture (tests inject their own).
using DeviceFactory = std::function<std::unique_ptr<IAudioInputDevice>(const std::string& device_id)>;

} // namespace audio
