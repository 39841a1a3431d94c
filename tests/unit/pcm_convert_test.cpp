#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <vector>
#include "audio/pcm_convert.hpp"
#include "core/errors.hpp"

int main() {
    // Float samples are clamped, then scaled to int16 full scale
    assert(audio::float_to_pcm16(0.0f) == 0);
    assert(audio::float_to_pcm16(1.0f) == 32767);
    assert(audio::float_to_pcm16(2.5f) == 32767);
    assert(audio::float_to_pcm16(-3.0f) <= -32767);

    // 16 kHz mono int16 passes through unchanged
    {
        std::vector<int16_t> in{1, -2, 300, -400};
        audio::AudioBuffer buf;
        buf.format = audio::SampleFormat::Int16;
        buf.data = in.data();
        buf.sample_count = in.size();
        buf.sample_rate = 16000;
        buf.channels = 1;
        auto out = audio::to_canonical_pcm(buf);
        assert(out == in);
    }

    // Stereo float at 48 kHz: downmixed and resampled to a third of the frames
    {
        std::vector<float> in(480 * 2);
        for (size_t i = 0; i < in.size(); i += 2) {
            in[i] = 0.5f;
            in[i + 1] = -0.5f;
        }
        audio::AudioBuffer buf;
        buf.format = audio::SampleFormat::Float32;
        buf.data = in.data();
        buf.sample_count = in.size();
        buf.sample_rate = 48000;
        buf.channels = 2;
        auto out = audio::to_canonical_pcm(buf);
        assert(out.size() == 160);
        for (int16_t s : out) assert(std::abs(s) <= 1);
    }

    // Unrecognized formats are rejected
    {
        std::vector<uint8_t> raw(30, 0);
        audio::AudioBuffer buf;
        buf.format = audio::SampleFormat::Int24;
        buf.data = raw.data();
        buf.sample_count = 10;
        bool threw = false;
        try {
            audio::to_canonical_pcm(buf);
        } catch (const core::UnsupportedFormatError&) {
            threw = true;
        }
        assert(threw);
        assert(!audio::is_supported_format(audio::SampleFormat::Unknown));
        assert(audio::is_supported_format(audio::SampleFormat::Float32));
    }

    // 44.1 kHz periods of 1024 frames: cutting the stream into buffers gives
    // the same output as converting it in one piece
    {
        const int in_hz = 44100;
        std::vector<int16_t> in(in_hz);
        for (size_t i = 0; i < in.size(); ++i) {
            in[i] = static_cast<int16_t>(12000.0 * std::sin(2.0 * 3.14159265358979 * 440.0 * i / in_hz));
        }

        audio::StreamResampler whole;
        auto expected = whole.process(in.data(), in.size(), in_hz);
        assert(expected.size() == 16000);

        audio::StreamResampler chunked;
        std::vector<int16_t> out;
        for (size_t off = 0; off < in.size(); off += 1024) {
            const size_t n = std::min<size_t>(1024, in.size() - off);
            auto part = chunked.process(in.data() + off, n, in_hz);
            out.insert(out.end(), part.begin(), part.end());
        }
        assert(std::labs(static_cast<long>(out.size()) - 16000) <= 1);
        const size_t common = std::min(out.size(), expected.size());
        for (size_t i = 0; i < common; ++i) {
            assert(std::abs(out[i] - expected[i]) <= 1);
        }

        // A different input rate starts over; 16 kHz passes through
        std::vector<int16_t> direct{5, 6, 7};
        assert(chunked.process(direct.data(), direct.size(), 16000) == direct);
    }

    // Level metering
    {
        std::vector<int16_t> quiet(160, 0);
        std::vector<int16_t> loud(160, 16384);
        assert(audio::dbfs(quiet.data(), quiet.size()) < -60.0f);
        assert(std::fabs(audio::dbfs(loud.data(), loud.size()) - (-6.0f)) < 0.5f);
    }
    return 0;
}
