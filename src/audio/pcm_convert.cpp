#include "audio/pcm_convert.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace audio {

namespace {
// Buffers may come from byte vectors, so read through memcpy instead of casting.
template <typename T>
T load_sample(const void* base, size_t index) {
    T v;
    std::memcpy(&v, static_cast<const unsigned char*>(base) + index * sizeof(T), sizeof(T));
    return v;
}
} // namespace

int16_t float_to_pcm16(float v) {
    if (std::isnan(v)) return 0;
    v = std::clamp(v, -1.0f, 1.0f);
    return static_cast<int16_t>(std::lrint(v * 32767.0f));
}

bool is_supported_format(SampleFormat format) {
    return format == SampleFormat::Int16 || format == SampleFormat::Float32;
}

std::vector<int16_t> downmix_to_mono_i16(const AudioBuffer& buffer) {
    if (!is_supported_format(buffer.format)) {
        throw core::UnsupportedFormatError(std::string("unsupported sample format: ") + to_string(buffer.format));
    }
    const size_t channels = static_cast<size_t>(std::max(1, buffer.channels));
    const size_t frames = buffer.data ? buffer.sample_count / channels : 0;
    std::vector<int16_t> mono(frames);

    if (buffer.format == SampleFormat::Int16) {
        for (size_t i = 0; i < frames; ++i) {
            int sum = 0;
            for (size_t c = 0; c < channels; ++c) {
                sum += load_sample<int16_t>(buffer.data, i * channels + c);
            }
            mono[i] = static_cast<int16_t>(sum / static_cast<int>(channels));
        }
    } else {
        for (size_t i = 0; i < frames; ++i) {
            float sum = 0.0f;
            for (size_t c = 0; c < channels; ++c) {
                sum += load_sample<float>(buffer.data, i * channels + c);
            }
            mono[i] = float_to_pcm16(sum / static_cast<float>(channels));
        }
    }
    return mono;
}

std::vector<int16_t> resample_linear(const int16_t* in, size_t in_samples, int in_hz, int out_hz) {
    if (in_hz == out_hz || in_hz <= 0 || out_hz <= 0 || in_samples == 0) {
        return std::vector<int16_t>(in, in + in_samples);
    }
    const double ratio = static_cast<double>(out_hz) / static_cast<double>(in_hz);
    const size_t out_len = static_cast<size_t>(std::llround(in_samples * ratio));
    std::vector<int16_t> out(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        double src_pos = i / ratio;
        size_t i0 = std::min(static_cast<size_t>(src_pos), in_samples - 1);
        size_t i1 = std::min(i0 + 1, in_samples - 1);
        double frac = src_pos - static_cast<double>(i0);
        double v = (1.0 - frac) * static_cast<double>(in[i0]) + frac * static_cast<double>(in[i1]);
        int vi = static_cast<int>(std::lrint(v));
        out[i] = static_cast<int16_t>(std::clamp(vi, -32768, 32767));
    }
    return out;
}

void StreamResampler::reset() {
    in_hz_ = 0;
    pos_ = 0.0;
    last_ = 0;
}

std::vector<int16_t> StreamResampler::process(const int16_t* in, size_t in_samples, int in_hz) {
    if (in_hz != in_hz_) {
        reset();
        in_hz_ = in_hz;
    }
    if (in_samples == 0) {
        return {};
    }
    if (in_hz == out_hz_ || in_hz <= 0 || out_hz_ <= 0) {
        last_ = in[in_samples - 1];
        return std::vector<int16_t>(in, in + in_samples);
    }

    const double step = static_cast<double>(in_hz) / static_cast<double>(out_hz_);
    const double end = static_cast<double>(in_samples - 1);
    std::vector<int16_t> out;
    out.reserve(static_cast<size_t>(static_cast<double>(in_samples) / step) + 2);
    // pos_ lies in (-1, 0] after the first buffer: between last_ and in[0].
    for (; pos_ <= end; pos_ += step) {
        const double base = std::floor(pos_);
        const double frac = pos_ - base;
        const long i0 = static_cast<long>(base);
        const double s0 = i0 < 0 ? static_cast<double>(last_) : static_cast<double>(in[i0]);
        const double s1 = (frac > 0.0) ? static_cast<double>(in[i0 + 1]) : s0;
        const int v = static_cast<int>(std::lrint(s0 + frac * (s1 - s0)));
        out.push_back(static_cast<int16_t>(std::clamp(v, -32768, 32767)));
    }
    pos_ -= static_cast<double>(in_samples);
    last_ = in[in_samples - 1];
    return out;
}

std::vector<int16_t> to_canonical_pcm(const AudioBuffer& buffer) {
    std::vector<int16_t> mono = downmix_to_mono_i16(buffer);
    if (buffer.sample_rate == kCanonicalSampleRate) {
        return mono;
    }
    return resample_linear(mono.data(), mono.size(), buffer.sample_rate, kCanonicalSampleRate);
}

std::vector<int16_t> to_canonical_pcm(const AudioBuffer& buffer, StreamResampler& resampler) {
    std::vector<int16_t> mono = downmix_to_mono_i16(buffer);
    return resampler.process(mono.data(), mono.size(), buffer.sample_rate);
}

float rms(const int16_t* samples, size_t n) {
    if (!samples || n == 0) return 0.0f;
    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) {
        acc += static_cast<double>(samples[i]) * static_cast<double>(samples[i]);
    }
    return static_cast<float>(std::sqrt(acc / static_cast<double>(n)));
}

float dbfs(const int16_t* samples, size_t n) {
    const float r = rms(samples, n);
    const float ref = 32768.0f; // int16 max magnitude
    return 20.0f * std::log10((r + 1e-9f) / ref);
}

} // namespace audio
