#include "support/fake_audio_device.hpp"

#include <algorithm>

namespace test_support {

bool FakeDeviceControl::emit_raw(audio::SampleFormat fmt, const void* data, size_t sample_count) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!running || !audio_callback) return false;
    audio::AudioBuffer buffer;
    buffer.format = fmt;
    buffer.data = data;
    buffer.sample_count = sample_count;
    buffer.sample_rate = sample_rate;
    buffer.channels = channels;
    audio_callback(buffer);
    return true;
}

bool FakeDeviceControl::emit_pcm(const std::vector<int16_t>& samples) {
    return emit_raw(audio::SampleFormat::Int16, samples.data(), samples.size());
}

bool FakeDeviceControl::emit_float(const std::vector<float>& samples) {
    return emit_raw(audio::SampleFormat::Float32, samples.data(), samples.size());
}

void FakeDeviceControl::emit_error(const std::string& message, bool fatal) {
    audio::ErrorCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex);
        cb = error_callback;
        if (fatal) running = false;
    }
    if (cb) cb(message, fatal);
}

bool FakeDeviceControl::started() const {
    std::lock_guard<std::mutex> lock(mutex);
    return running;
}

int FakeDeviceControl::start_count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return starts;
}

int FakeDeviceControl::stop_count() const {
    std::lock_guard<std::mutex> lock(mutex);
    return stops;
}

FakeAudioDevice::FakeAudioDevice(std::string id, std::shared_ptr<FakeDeviceControl> control)
    : id_(std::move(id)), control_(std::move(control)) {}

FakeAudioDevice::~FakeAudioDevice() {
    stop();
    std::lock_guard<std::mutex> lock(control_->mutex);
    control_->audio_callback = nullptr;
    control_->error_callback = nullptr;
}

bool FakeAudioDevice::initialize(const audio::AudioInputConfig& config,
                                 audio::AudioCallback audio_callback,
                                 audio::ErrorCallback error_callback) {
    std::lock_guard<std::mutex> lock(control_->mutex);
    if (control_->fail_initialize) {
        if (error_callback) error_callback("device busy", true);
        return false;
    }
    config_ = config;
    config_.format = control_->format;
    config_.sample_rate = control_->sample_rate;
    config_.channels = control_->channels;
    control_->audio_callback = std::move(audio_callback);
    control_->error_callback = std::move(error_callback);
    return true;
}

bool FakeAudioDevice::start() {
    std::lock_guard<std::mutex> lock(control_->mutex);
    if (control_->fail_start) return false;
    control_->running = true;
    control_->starts++;
    return true;
}

void FakeAudioDevice::stop() {
    std::lock_guard<std::mutex> lock(control_->mutex);
    if (control_->running) {
        control_->running = false;
        control_->stops++;
    }
}

bool FakeAudioDevice::is_capturing() const {
    std::lock_guard<std::mutex> lock(control_->mutex);
    return control_->running;
}

audio::AudioDeviceInfo FakeAudioDevice::get_device_info() const {
    audio::AudioDeviceInfo info;
    info.id = id_;
    info.name = "Fake device " + id_;
    info.driver = "Fake";
    info.default_sample_rate = config_.sample_rate;
    info.max_channels = config_.channels;
    return info;
}

std::shared_ptr<FakeDeviceControl> FakeDeviceRegistry::control(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = controls_[id];
    if (!slot) slot = std::make_shared<FakeDeviceControl>();
    return slot;
}

void FakeDeviceRegistry::make_unavailable(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    unavailable_.push_back(id);
}

audio::DeviceFactory FakeDeviceRegistry::factory() {
    return [this](const std::string& id) -> std::unique_ptr<audio::IAudioInputDevice> {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (std::find(unavailable_.begin(), unavailable_.end(), id) != unavailable_.end()) {
                return nullptr;
            }
        }
        return std::make_unique<FakeAudioDevice>(id, control(id));
    };
}

} // namespace test_support
