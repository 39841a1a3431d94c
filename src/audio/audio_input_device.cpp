#include "audio_input_device.hpp"
#include "audio_input_device_synthetic.hpp"

#if defined(DUALSCRIBE_HAVE_ALSA)
#include "linux/audio_input_device_alsa.hpp"
#endif

namespace audio {

const char* to_string(SampleFormat format) {
    switch (format) {
        case SampleFormat::Int16:   return "s16";
        case SampleFormat::Float32: return "f32";
        case SampleFormat::Int24:   return "s24";
        case SampleFormat::Unknown: return "unknown";
    }
    return "unknown";
}

std::vector<AudioDeviceInfo> AudioInputFactory::enumerate_devices() {
    std::vector<AudioDeviceInfo> devices;

#if defined(DUALSCRIBE_HAVE_ALSA)
    auto alsa_devices = AudioInputDevice_Alsa::enumerate_alsa_devices();
    devices.insert(devices.end(), alsa_devices.begin(), alsa_devices.end());
#endif

    // Always add synthetic device
    AudioDeviceInfo synthetic;
    synthetic.id = "synthetic:<file.wav>";
    synthetic.name = "Synthetic Device (File Playback)";
    synthetic.driver = "Synthetic";
    synthetic.kind = DeviceKind::Synthetic;
    synthetic.default_sample_rate = 16000;
    synthetic.max_channels = 1;
    synthetic.is_default = false;
    devices.push_back(synthetic);

    return devices;
}

std::unique_ptr<IAudioInputDevice> AudioInputFactory::create_device(const std::string& device_id) {
    if (device_id.rfind("synthetic:", 0) == 0) {
        return std::make_unique<AudioInputDevice_Synthetic>();
    }

#if defined(DUALSCRIBE_HAVE_ALSA)
    return std::make_unique<AudioInputDevice_Alsa>();
#else
    return nullptr;  // no platform capture backend in this build
#endif
}

} // namespace audio
