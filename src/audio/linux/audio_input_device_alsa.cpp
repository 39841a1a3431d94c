#include "audio_input_device_alsa.hpp"
#include "core/logging.hpp"

#include <alsa/asoundlib.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <vector>

namespace audio {

namespace {

std::string alsa_error(int code, const std::string& context) {
    std::ostringstream oss;
    oss << context << ": " << snd_strerror(code);
    return oss.str();
}

bool looks_like_monitor(const std::string& name, const std::string& desc) {
    auto contains = [](const std::string& s, const char* needle) {
        return s.find(needle) != std::string::npos;
    };
    return contains(name, "monitor") || contains(name, "Loopback") ||
           contains(desc, "Monitor") || contains(desc, "Loopback");
}

} // namespace

AudioInputDevice_Alsa::AudioInputDevice_Alsa() = default;

AudioInputDevice_Alsa::~AudioInputDevice_Alsa() {
    stop();
    close_pcm();
}

std::string AudioInputDevice_Alsa::pcm_name_from_id(const std::string& device_id) {
    if (device_id.empty()) return "default";
    if (device_id.rfind("alsa:", 0) == 0) return device_id.substr(5);
    return device_id;
}

bool AudioInputDevice_Alsa::initialize(
    const AudioInputConfig& config,
    AudioCallback audio_callback,
    ErrorCallback error_callback
) {
    config_ = config;
    audio_callback_ = std::move(audio_callback);
    error_callback_ = std::move(error_callback);
    pcm_name_ = pcm_name_from_id(config.device_id);

    auto fail = [this](const std::string& msg) {
        core::log_error("[alsa] " + msg);
        if (error_callback_) error_callback_(msg, true);
        close_pcm();
        return false;
    };

    int err = snd_pcm_open(&handle_, pcm_name_.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (err < 0) {
        handle_ = nullptr;
        return fail(alsa_error(err, "snd_pcm_open(" + pcm_name_ + ")"));
    }

    snd_pcm_hw_params_t* hw_params = nullptr;
    snd_pcm_hw_params_malloc(&hw_params);
    if (!hw_params) {
        return fail("failed to allocate ALSA hw params");
    }
    snd_pcm_hw_params_any(handle_, hw_params);

    err = snd_pcm_hw_params_set_access(handle_, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED);
    if (err < 0) {
        snd_pcm_hw_params_free(hw_params);
        return fail(alsa_error(err, "snd_pcm_hw_params_set_access"));
    }

    config_.format = SampleFormat::Int16;
    err = snd_pcm_hw_params_set_format(handle_, hw_params, SND_PCM_FORMAT_S16_LE);
    if (err < 0) {
        err = snd_pcm_hw_params_set_format(handle_, hw_params, SND_PCM_FORMAT_FLOAT_LE);
        config_.format = SampleFormat::Float32;
    }
    if (err < 0) {
        snd_pcm_hw_params_free(hw_params);
        config_.format = SampleFormat::Unknown;
        return fail(alsa_error(err, "snd_pcm_hw_params_set_format"));
    }

    unsigned int channels = static_cast<unsigned int>(std::max(1, config_.channels));
    err = snd_pcm_hw_params_set_channels_near(handle_, hw_params, &channels);
    if (err < 0) {
        snd_pcm_hw_params_free(hw_params);
        return fail(alsa_error(err, "snd_pcm_hw_params_set_channels_near"));
    }
    config_.channels = static_cast<int>(channels);

    unsigned int rate = static_cast<unsigned int>(config_.sample_rate);
    err = snd_pcm_hw_params_set_rate_near(handle_, hw_params, &rate, nullptr);
    if (err < 0) {
        snd_pcm_hw_params_free(hw_params);
        return fail(alsa_error(err, "snd_pcm_hw_params_set_rate_near"));
    }
    if (static_cast<int>(rate) != config_.sample_rate) {
        core::log_info("[alsa] " + pcm_name_ + ": sample rate adjusted to " + std::to_string(rate) + " Hz");
        config_.sample_rate = static_cast<int>(rate);
    }

    snd_pcm_uframes_t frames = static_cast<snd_pcm_uframes_t>(rate) * std::max(1, config_.buffer_size_ms) / 1000;
    err = snd_pcm_hw_params_set_period_size_near(handle_, hw_params, &frames, nullptr);
    if (err < 0) {
        snd_pcm_hw_params_free(hw_params);
        return fail(alsa_error(err, "snd_pcm_hw_params_set_period_size_near"));
    }
    period_frames_ = frames;

    err = snd_pcm_hw_params(handle_, hw_params);
    snd_pcm_hw_params_free(hw_params);
    if (err < 0) {
        return fail(alsa_error(err, "snd_pcm_hw_params"));
    }

    err = snd_pcm_prepare(handle_);
    if (err < 0) {
        return fail(alsa_error(err, "snd_pcm_prepare"));
    }
    return true;
}

bool AudioInputDevice_Alsa::start() {
    if (is_capturing_.load()) {
        return true;
    }
    if (!handle_) {
        return false;
    }
    int err = snd_pcm_start(handle_);
    if (err < 0) {
        core::log_error("[alsa] " + alsa_error(err, "snd_pcm_start"));
        return false;
    }
    should_stop_.store(false);
    is_capturing_.store(true);
    capture_thread_ = std::make_unique<std::thread>(&AudioInputDevice_Alsa::capture_thread_func, this);
    return true;
}

void AudioInputDevice_Alsa::stop() {
    should_stop_.store(true);
    if (handle_) {
        snd_pcm_drop(handle_);  // unblocks snd_pcm_readi
    }
    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();
    }
    capture_thread_.reset();
    is_capturing_.store(false);
}

void AudioInputDevice_Alsa::close_pcm() {
    if (handle_) {
        snd_pcm_close(handle_);
        handle_ = nullptr;
    }
}

void AudioInputDevice_Alsa::capture_thread_func() {
    const size_t channels = static_cast<size_t>(config_.channels);
    const size_t bytes_per_sample = config_.format == SampleFormat::Float32 ? sizeof(float) : sizeof(int16_t);
    std::vector<unsigned char> raw(period_frames_ * channels * bytes_per_sample);

    while (!should_stop_.load()) {
        snd_pcm_sframes_t frames = snd_pcm_readi(handle_, raw.data(), period_frames_);
        if (frames < 0) {
            if (should_stop_.load()) break;
            frames = snd_pcm_recover(handle_, static_cast<int>(frames), 1);
            if (frames < 0) {
                std::string msg = alsa_error(static_cast<int>(frames), "snd_pcm_readi");
                core::log_error("[alsa] " + pcm_name_ + ": " + msg);
                if (error_callback_) error_callback_(msg, true);
                break;
            }
            if (error_callback_) error_callback_("overrun recovered", false);
            continue;
        }
        if (frames == 0) continue;

        if (audio_callback_) {
            AudioBuffer buffer;
            buffer.format = config_.format;
            buffer.data = raw.data();
            buffer.sample_count = static_cast<size_t>(frames) * channels;
            buffer.sample_rate = config_.sample_rate;
            buffer.channels = config_.channels;
            audio_callback_(buffer);
        }
    }
    is_capturing_.store(false);
}

AudioDeviceInfo AudioInputDevice_Alsa::get_device_info() const {
    AudioDeviceInfo info;
    info.id = "alsa:" + pcm_name_;
    info.name = pcm_name_;
    info.driver = "ALSA";
    info.kind = looks_like_monitor(pcm_name_, "") ? DeviceKind::Monitor : DeviceKind::Input;
    info.default_sample_rate = config_.sample_rate;
    info.max_channels = config_.channels;
    info.is_default = (pcm_name_ == "default");
    return info;
}

std::vector<AudioDeviceInfo> AudioInputDevice_Alsa::enumerate_alsa_devices() {
    std::vector<AudioDeviceInfo> devices;
    void** hints = nullptr;
    int err = snd_device_name_hint(-1, "pcm", &hints);
    if (err < 0 || !hints) {
        core::log_warn("[alsa] " + alsa_error(err, "snd_device_name_hint"));
        return devices;
    }

    for (void** h = hints; *h != nullptr; ++h) {
        char* name = snd_device_name_get_hint(*h, "NAME");
        char* desc = snd_device_name_get_hint(*h, "DESC");
        char* ioid = snd_device_name_get_hint(*h, "IOID");

        // IOID is absent for devices that support both directions.
        const bool capture = (ioid == nullptr) || std::strcmp(ioid, "Input") == 0;
        if (name && capture && std::strcmp(name, "null") != 0) {
            AudioDeviceInfo info;
            info.id = std::string("alsa:") + name;
            info.name = desc ? desc : name;
            // Descriptions are multi-line ("card\ndevice"); keep one line.
            std::replace(info.name.begin(), info.name.end(), '\n', ' ');
            info.driver = "ALSA";
            info.kind = looks_like_monitor(name, desc ? desc : "") ? DeviceKind::Monitor : DeviceKind::Input;
            info.default_sample_rate = 48000;
            info.max_channels = 2;
            info.is_default = std::strcmp(name, "default") == 0;
            devices.push_back(info);
        }

        free(name);
        free(desc);
        free(ioid);
    }
    snd_device_name_free_hint(hints);
    return devices;
}

} // namespace audio
