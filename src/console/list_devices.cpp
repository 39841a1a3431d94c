#include <iostream>
#include "audio/audio_source_capture.hpp"

int main() {
    auto devices = audio::AudioSourceCapture::enumerate();
    if (devices.empty()) {
        std::cout << "No capture devices found." << std::endl;
        return 0;
    }
    std::cout << "Capture devices:" << std::endl;
    for (size_t i = 0; i < devices.size(); ++i) {
        const auto& d = devices[i];
        const char* kind = d.kind == audio::DeviceKind::Monitor ? "system audio"
                         : d.kind == audio::DeviceKind::Synthetic ? "file" : "microphone";
        std::cout << i << ": " << d.name << (d.is_default ? " (default)" : "")
                  << "\n  ID: " << d.id << "\n  " << d.driver << ", " << kind << ", "
                  << d.default_sample_rate << " Hz, " << d.max_channels << " ch\n";
    }
    return 0;
}
