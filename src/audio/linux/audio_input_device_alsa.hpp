#pragma once

#include "../audio_input_device.hpp"
#include <atomic>
#include <memory>
#include <thread>

typedef struct _snd_pcm snd_pcm_t;

namespace audio {

/**
 * @brief ALSA capture device (Linux)
 *
 * Opens a capture PCM in interleaved S16_LE, falling back to FLOAT_LE when
 * the hardware refuses 16-bit, and reads periods on a dedicated thread.
 * Loopback capture works through monitor PCMs (e.g. the PulseAudio/PipeWire
 * "pulse" plugin with a ".monitor" source, or snd-aloop's "Loopback" card).
 *
 * Device ids: "default", "alsa:<pcm name>", or a bare PCM name.
 */
class AudioInputDevice_Alsa : public IAudioInputDevice {
public:
    AudioInputDevice_Alsa();
    ~AudioInputDevice_Alsa() override;

    bool initialize(
        const AudioInputConfig& config,
        AudioCallback audio_callback,
        ErrorCallback error_callback
    ) override;

    bool start() override;
    void stop() override;
    bool is_capturing() const override { return is_capturing_.load(); }
    AudioDeviceInfo get_device_info() const override;
    AudioInputConfig get_actual_config() const override { return config_; }

    /// Enumerate capture PCMs from ALSA name hints.
    static std::vector<AudioDeviceInfo> enumerate_alsa_devices();

    static std::string pcm_name_from_id(const std::string& device_id);

private:
    void capture_thread_func();
    void close_pcm();

    AudioInputConfig config_;
    AudioCallback audio_callback_;
    ErrorCallback error_callback_;

    snd_pcm_t* handle_ = nullptr;
    std::string pcm_name_;
    unsigned long period_frames_ = 0;

    std::unique_ptr<std::thread> capture_thread_;
    std::atomic<bool> is_capturing_{false};
    std::atomic<bool> should_stop_{false};
};

} // namespace audio
