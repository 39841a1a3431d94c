#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

// WAV-backed source that simulates a capture device by returning fixed-size chunks.
// PCM16 and float32 files are decoded to mono int16 at the file's own sample rate.
class FileCapture {
public:
    bool start_from_wav(const std::string& path);
    void stop();
    void rewind() { cursor_ = 0; }
    int sample_rate() const { return sample_rate_; }

    // Returns the next chunk (chunk_ms long, last one shorter). Empty when no more data.
    std::vector<int16_t> read_chunk(int chunk_ms = 20);

    int channels() const { return channels_; }
    int bits_per_sample() const { return bits_per_sample_; }
    double duration_seconds() const { return duration_seconds_; }
    size_t total_samples() const { return mono_.size(); }
    const std::string& source_path() const { return source_path_; }

private:
    std::string source_path_;
    std::vector<int16_t> mono_; // decoded mono PCM16
    size_t cursor_ = 0;
    int sample_rate_ = 0;
    int channels_ = 0;
    int bits_per_sample_ = 0;
    double duration_seconds_ = 0.0;
};

} // namespace audio
