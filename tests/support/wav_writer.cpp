#include "support/wav_writer.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>

namespace test_support {

std::vector<int16_t> tone(int duration_ms, int sample_rate, double frequency, double amplitude) {
    const double kPi = 3.14159265358979323846;
    const size_t n = static_cast<size_t>(duration_ms) * static_cast<size_t>(sample_rate) / 1000;
    std::vector<int16_t> out(n);
    for (size_t i = 0; i < n; ++i) {
        const double v = amplitude * std::sin(2.0 * kPi * frequency * static_cast<double>(i) / sample_rate);
        out[i] = static_cast<int16_t>(std::lrint(v * 32767.0));
    }
    return out;
}

std::vector<int16_t> silence(int duration_ms, int sample_rate) {
    return std::vector<int16_t>(static_cast<size_t>(duration_ms) * static_cast<size_t>(sample_rate) / 1000, 0);
}

void append(std::vector<int16_t>& dst, const std::vector<int16_t>& src) {
    dst.insert(dst.end(), src.begin(), src.end());
}

namespace {

void put_u32(std::ofstream& f, uint32_t v) {
    const char b[4] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff),
                       static_cast<char>((v >> 16) & 0xff), static_cast<char>((v >> 24) & 0xff)};
    f.write(b, 4);
}

void put_u16(std::ofstream& f, uint16_t v) {
    const char b[2] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff)};
    f.write(b, 2);
}

} // namespace

bool write_wav(const std::string& path, const std::vector<int16_t>& samples, int sample_rate) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    const uint32_t data_bytes = static_cast<uint32_t>(samples.size() * 2);
    f.write("RIFF", 4);
    put_u32(f, 36 + data_bytes);
    f.write("WAVE", 4);
    f.write("fmt ", 4);
    put_u32(f, 16);
    put_u16(f, 1);                                          // PCM
    put_u16(f, 1);                                          // mono
    put_u32(f, static_cast<uint32_t>(sample_rate));
    put_u32(f, static_cast<uint32_t>(sample_rate * 2));     // byte rate
    put_u16(f, 2);                                          // block align
    put_u16(f, 16);
    f.write("data", 4);
    put_u32(f, data_bytes);
    for (int16_t s : samples) {
        put_u16(f, static_cast<uint16_t>(s));
    }
    return static_cast<bool>(f);
}

std::string make_temp_dir(const std::string& prefix) {
    static std::atomic<int> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = std::filesystem::temp_directory_path() /
               (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(dir);
    return dir.string();
}

} // namespace test_support
