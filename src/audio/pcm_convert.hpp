#pragma once
#include "audio/audio_input_device.hpp"
#include <cstdint>
#include <vector>

namespace audio {

// Canonical engine format: 16 kHz, mono, signed 16-bit.
constexpr int kCanonicalSampleRate = 16000;

// Clamps to [-1, 1] and scales to int16 full scale.
int16_t float_to_pcm16(float v);

// Converts any supported buffer to mono int16 at the buffer's own rate.
// Channels are averaged.
// @throws core::UnsupportedFormatError for formats other than Int16/Float32
std::vector<int16_t> downmix_to_mono_i16(const AudioBuffer& buffer);

// Linear-interpolation resampler. Returns a copy when in_hz already matches.
std::vector<int16_t> resample_linear(const int16_t* in, size_t in_samples, int in_hz, int out_hz);

// Linear resampler for a continuous stream cut into buffers. The read
// position and the last input sample carry over between calls, so the
// output neither drifts nor jumps at buffer boundaries. A change of input
// rate starts over.
class StreamResampler {
public:
    explicit StreamResampler(int out_hz = kCanonicalSampleRate) : out_hz_(out_hz) {}

    std::vector<int16_t> process(const int16_t* in, size_t in_samples, int in_hz);
    void reset();

private:
    int out_hz_;
    int in_hz_ = 0;
    double pos_ = 0.0;        // next output, in input samples from the start of the next buffer
    int16_t last_ = 0;        // last sample of the previous buffer (position -1)
};

// downmix_to_mono_i16 followed by resampling to kCanonicalSampleRate.
// @throws core::UnsupportedFormatError
std::vector<int16_t> to_canonical_pcm(const AudioBuffer& buffer);

// Same, for consecutive buffers of one stream.
std::vector<int16_t> to_canonical_pcm(const AudioBuffer& buffer, StreamResampler& resampler);

bool is_supported_format(SampleFormat format);

// Level metering used for endpointing.
float rms(const int16_t* samples, size_t n);
float dbfs(const int16_t* samples, size_t n);

} // namespace audio
