#include "audio_input_device_synthetic.hpp"
#include "core/logging.hpp"
#include <chrono>
#include <thread>
#include <algorithm>

namespace audio {

AudioInputDevice_Synthetic::AudioInputDevice_Synthetic() = default;

AudioInputDevice_Synthetic::~AudioInputDevice_Synthetic() {
    stop();
}

bool AudioInputDevice_Synthetic::initialize(
    const AudioInputConfig& config,
    AudioCallback audio_callback,
    ErrorCallback error_callback
) {
    config_ = config;
    audio_callback_ = std::move(audio_callback);
    error_callback_ = std::move(error_callback);

    if (config_.synthetic_file_path.empty() && config_.device_id.rfind("synthetic:", 0) == 0) {
        config_.synthetic_file_path = config_.device_id.substr(std::string("synthetic:").size());
    }
    if (config_.synthetic_file_path.empty()) {
        if (error_callback_) {
            error_callback_("Synthetic device requires a file path", true);
        }
        return false;
    }

    if (!file_capture_.start_from_wav(config_.synthetic_file_path)) {
        if (error_callback_) {
            error_callback_("Failed to load WAV file: " + config_.synthetic_file_path, true);
        }
        return false;
    }

    // Report what we actually deliver: mono int16 at the file's rate.
    config_.sample_rate = file_capture_.sample_rate();
    config_.channels = 1;
    config_.format = SampleFormat::Int16;
    return true;
}

bool AudioInputDevice_Synthetic::start() {
    if (is_capturing_.load()) {
        return true;  // Already capturing
    }
    if (file_capture_.sample_rate() <= 0) {
        return false; // not initialized
    }

    should_stop_.store(false);
    is_capturing_.store(true);

    capture_thread_ = std::make_unique<std::thread>(
        &AudioInputDevice_Synthetic::capture_thread_func, this
    );

    return true;
}

void AudioInputDevice_Synthetic::stop() {
    should_stop_.store(true);

    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();
    }
    capture_thread_.reset();
    is_capturing_.store(false);
}

void AudioInputDevice_Synthetic::capture_thread_func() {
    auto next_callback_time = std::chrono::steady_clock::now();
    const int chunk_ms = std::max(1, config_.buffer_size_ms);

    while (!should_stop_.load()) {
        auto chunk = file_capture_.read_chunk(chunk_ms);

        if (chunk.empty()) {
            if (config_.synthetic_loop) {
                file_capture_.rewind();
                continue;
            }
            core::log_info("[synthetic] end of file: " + config_.synthetic_file_path);
            if (error_callback_) {
                error_callback_("End of file reached", true);
            }
            break;
        }

        if (audio_callback_) {
            AudioBuffer buffer;
            buffer.format = SampleFormat::Int16;
            buffer.data = chunk.data();
            buffer.sample_count = chunk.size();
            buffer.sample_rate = file_capture_.sample_rate();
            buffer.channels = 1;
            audio_callback_(buffer);
        }

        // Sleep based on actual chunk duration (simulate real-time capture)
        double chunk_duration_s = static_cast<double>(chunk.size()) / file_capture_.sample_rate();
        next_callback_time += std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(chunk_duration_s));
        std::this_thread::sleep_until(next_callback_time);
    }

    is_capturing_.store(false);
}

AudioDeviceInfo AudioInputDevice_Synthetic::get_device_info() const {
    AudioDeviceInfo info;
    info.id = "synthetic:" + config_.synthetic_file_path;
    info.name = "Synthetic Device (File: " + config_.synthetic_file_path + ")";
    info.driver = "Synthetic";
    info.kind = DeviceKind::Synthetic;
    info.default_sample_rate = file_capture_.sample_rate();
    info.max_channels = 1;
    info.is_default = false;
    return info;
}

} // namespace audio
