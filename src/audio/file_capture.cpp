#include "audio/file_capture.hpp"
#include "audio/pcm_convert.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>

namespace audio {

namespace {
struct FmtChunk {
    uint16_t audioFormat;   // 1=PCM, 3=float
    uint16_t numChannels;
    uint32_t sampleRate;
    uint32_t byteRate;
    uint16_t blockAlign;
    uint16_t bitsPerSample;
};

bool read_u32(std::ifstream& f, uint32_t& v) {
    return static_cast<bool>(f.read(reinterpret_cast<char*>(&v), 4));
}
} // namespace

bool FileCapture::start_from_wav(const std::string& path) {
    stop();
    source_path_.clear();
    channels_ = 0;
    bits_per_sample_ = 0;
    duration_seconds_ = 0.0;

    std::ifstream f(path, std::ios::binary);
    if (!f) {
        core::log_error("[file] cannot open " + path);
        return false;
    }

    char riff[4];
    uint32_t riff_size = 0;
    char wave[4];
    if (!f.read(riff, 4) || !read_u32(f, riff_size) || !f.read(wave, 4)) return false;
    if (std::strncmp(riff, "RIFF", 4) != 0 || std::strncmp(wave, "WAVE", 4) != 0) {
        core::log_error("[file] not a RIFF/WAVE file: " + path);
        return false;
    }

    // Walk chunks; fmt must precede data.
    FmtChunk fmt{};
    bool have_fmt = false;
    std::vector<char> payload;
    char chunk_id[4];
    uint32_t chunk_size = 0;
    while (f.read(chunk_id, 4) && read_u32(f, chunk_size)) {
        if (std::strncmp(chunk_id, "fmt ", 4) == 0) {
            if (chunk_size < sizeof(FmtChunk)) return false;
            if (!f.read(reinterpret_cast<char*>(&fmt), sizeof(FmtChunk))) return false;
            f.seekg(chunk_size - sizeof(FmtChunk) + (chunk_size & 1), std::ios::cur);
            have_fmt = true;
        } else if (std::strncmp(chunk_id, "data", 4) == 0) {
            if (!have_fmt) return false;
            payload.resize(chunk_size);
            if (!f.read(payload.data(), chunk_size)) {
                // Truncated recordings are common; keep what was read.
                payload.resize(static_cast<size_t>(f.gcount()));
            }
            break;
        } else {
            f.seekg(chunk_size + (chunk_size & 1), std::ios::cur);
        }
    }
    if (!have_fmt || payload.empty()) {
        core::log_error("[file] missing fmt or data chunk: " + path);
        return false;
    }

    AudioBuffer buf;
    buf.sample_rate = static_cast<int>(fmt.sampleRate);
    buf.channels = std::max<int>(1, fmt.numChannels);
    if (fmt.audioFormat == 1 && fmt.bitsPerSample == 16) {
        buf.format = SampleFormat::Int16;
        buf.sample_count = payload.size() / sizeof(int16_t);
    } else if (fmt.audioFormat == 3 && fmt.bitsPerSample == 32) {
        buf.format = SampleFormat::Float32;
        buf.sample_count = payload.size() / sizeof(float);
    } else {
        core::log_error("[file] unsupported WAV encoding (format " + std::to_string(fmt.audioFormat) +
                        ", " + std::to_string(fmt.bitsPerSample) + " bits): " + path);
        return false;
    }
    buf.sample_count -= buf.sample_count % static_cast<size_t>(buf.channels);
    buf.data = payload.data();

    // Downmix only; the file keeps its own rate so read_chunk pacing matches real time.
    mono_ = downmix_to_mono_i16(buf);
    cursor_ = 0;
    sample_rate_ = buf.sample_rate;
    channels_ = fmt.numChannels;
    bits_per_sample_ = fmt.bitsPerSample;
    duration_seconds_ = static_cast<double>(mono_.size()) / std::max(1, sample_rate_);
    source_path_ = path;
    return true;
}

void FileCapture::stop() {
    mono_.clear();
    cursor_ = 0;
    sample_rate_ = 0;
}

std::vector<int16_t> FileCapture::read_chunk(int chunk_ms) {
    std::vector<int16_t> out;
    if (sample_rate_ <= 0 || cursor_ >= mono_.size()) return out;
    size_t frames_per_chunk = static_cast<size_t>(sample_rate_) * static_cast<size_t>(std::max(1, chunk_ms)) / 1000;
    frames_per_chunk = std::max<size_t>(1, frames_per_chunk);
    size_t n = std::min(frames_per_chunk, mono_.size() - cursor_);
    out.insert(out.end(), mono_.begin() + cursor_, mono_.begin() + cursor_ + n);
    cursor_ += n;
    return out;
}

} // namespace audio
