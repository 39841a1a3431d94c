#include "audio/audio_source_capture.hpp"
#include "audio/pcm_convert.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "core/time_utils.hpp"

#include <algorithm>

namespace audio {

AudioSourceCapture::AudioSourceCapture(core::StreamId source, const core::CaptureConfig& config, DeviceFactory factory)
    : source_(source)
    , config_(config)
    , factory_(factory ? std::move(factory) : DeviceFactory(&AudioInputFactory::create_device))
    , queue_(static_cast<size_t>(std::max(1, config.max_queue_frames))) {}

AudioSourceCapture::~AudioSourceCapture() {
    release();
}

std::string AudioSourceCapture::tag() const {
    return std::string("[capture:") + core::to_string(source_) + "] ";
}

std::vector<AudioDeviceInfo> AudioSourceCapture::enumerate() {
    return AudioInputFactory::enumerate_devices();
}

void AudioSourceCapture::on_frame(FrameCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    frame_callbacks_.push_back(std::move(callback));
}

void AudioSourceCapture::on_lifecycle(LifecycleCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    lifecycle_callbacks_.push_back(std::move(callback));
}

void AudioSourceCapture::acquire(const CaptureSpec& spec) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (active_.load()) {
        return;
    }
    if (device_) {
        // Device stopped on its own (fatal error / end of file); start over.
        device_->stop();
        queue_.close();
        if (delivery_thread_.joinable()) {
            delivery_thread_.join();
        }
        device_.reset();
    }

    auto device = factory_(spec.device_id);
    if (!device) {
        throw core::AcquisitionError(tag() + "no capture backend for device '" + spec.device_id + "'");
    }

    AudioInputConfig cfg;
    cfg.device_id = spec.device_id;
    cfg.sample_rate = spec.sample_rate;
    cfg.channels = spec.channels;
    cfg.buffer_size_ms = config_.device_buffer_ms;
    cfg.synthetic_loop = config_.synthetic_loop;

    {
        std::lock_guard<std::mutex> err_lock(device_error_mutex_);
        last_device_error_.clear();
    }
    bool ok = device->initialize(
        cfg,
        [this](const AudioBuffer& buffer) { handle_audio(buffer); },
        [this](const std::string& message, bool is_fatal) { handle_device_error(message, is_fatal); });
    if (!ok) {
        std::string reason;
        {
            std::lock_guard<std::mutex> err_lock(device_error_mutex_);
            reason = last_device_error_.empty() ? "initialization failed" : last_device_error_;
        }
        throw core::AcquisitionError(tag() + "cannot open '" + spec.device_id + "': " + reason);
    }

    const AudioInputConfig actual = device->get_actual_config();
    if (!is_supported_format(actual.format)) {
        device->stop();
        throw core::UnsupportedFormatError(tag() + "device '" + spec.device_id + "' delivers " +
                                           to_string(actual.format) + " samples");
    }

    queue_.reset();
    resampler_.reset();
    delivered_frames_ = 0;
    last_logged_drops_ = queue_.dropped_count();
    accepting_.store(true);
    delivery_thread_ = std::thread(&AudioSourceCapture::delivery_loop, this);

    if (!device->start()) {
        accepting_.store(false);
        queue_.close();
        delivery_thread_.join();
        throw core::AcquisitionError(tag() + "device '" + spec.device_id + "' failed to start");
    }

    device_ = std::move(device);
    active_.store(true);
    core::log_info(tag() + "active on " + spec.device_id + " (" + std::to_string(actual.sample_rate) + " Hz, " +
                   std::to_string(actual.channels) + " ch, " + to_string(actual.format) + ")");
    emit_lifecycle(SourceState::Active, "acquired");
}

void AudioSourceCapture::release() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    accepting_.store(false);
    if (device_) {
        device_->stop();
    }
    queue_.close();
    if (delivery_thread_.joinable()) {
        delivery_thread_.join();
    }
    device_.reset();

    if (active_.exchange(false)) {
        core::log_info(tag() + "released (" + std::to_string(delivered_frames_.load()) + " frames delivered, " +
                       std::to_string(queue_.dropped_count()) + " dropped)");
        emit_lifecycle(SourceState::Inactive, "released");
    }
}

void AudioSourceCapture::handle_audio(const AudioBuffer& buffer) {
    if (!accepting_.load()) return;

    AudioFrame frame;
    frame.source = source_;
    frame.timestamp_ms = core::now_ms();
    try {
        frame.pcm = to_canonical_pcm(buffer, resampler_);
    } catch (const core::UnsupportedFormatError& e) {
        if (rejected_buffers_.fetch_add(1) == 0) {
            core::log_error(tag() + e.what());
        }
        return;
    }
    if (frame.pcm.empty()) return;

    queue_.push(std::move(frame));

    const size_t drops = queue_.dropped_count();
    if (drops != last_logged_drops_ && (last_logged_drops_ == 0 || drops - last_logged_drops_ >= 100)) {
        core::log_warn(tag() + "consumer too slow, dropped " + std::to_string(drops) + " frame(s) so far");
        last_logged_drops_ = drops;
    }
}

void AudioSourceCapture::handle_device_error(const std::string& message, bool is_fatal) {
    {
        std::lock_guard<std::mutex> lock(device_error_mutex_);
        last_device_error_ = message;
    }
    if (!is_fatal) {
        core::log_warn(tag() + "device: " + message);
        return;
    }
    // Runs on the device thread: never stop/join the device from here.
    accepting_.store(false);
    if (active_.exchange(false)) {
        core::log_error(tag() + "device stopped: " + message);
        emit_lifecycle(SourceState::Inactive, message);
    }
}

void AudioSourceCapture::delivery_loop() {
    AudioFrame frame;
    while (queue_.pop(frame)) {
        std::vector<FrameCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(callbacks_mutex_);
            callbacks = frame_callbacks_;
        }
        for (auto& cb : callbacks) {
            try {
                cb(frame);
            } catch (const std::exception& e) {
                core::log_error(tag() + "frame consumer threw: " + e.what());
            }
        }
        delivered_frames_++;
    }
}

void AudioSourceCapture::emit_lifecycle(SourceState state, const std::string& reason) {
    std::vector<LifecycleCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = lifecycle_callbacks_;
    }
    SourceLifecycleEvent event{source_, state, reason};
    for (auto& cb : callbacks) {
        cb(event);
    }
}

} // namespace audio
