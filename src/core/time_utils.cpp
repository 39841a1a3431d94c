#include "core/time_utils.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

namespace core {

namespace {
std::tm to_utc(int64_t epoch_ms) {
    std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
    if (epoch_ms < 0 && epoch_ms % 1000 != 0) secs -= 1;
    std::tm out{};
#if defined(_WIN32)
    gmtime_s(&out, &secs);
#else
    gmtime_r(&secs, &out);
#endif
    return out;
}

int millis_part(int64_t epoch_ms) {
    int ms = static_cast<int>(epoch_ms % 1000);
    return ms < 0 ? ms + 1000 : ms;
}
} // namespace

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string format_iso_utc(int64_t epoch_ms) {
    std::tm t = to_utc(epoch_ms);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  t.tm_year + 1900, t.tm_mon + 1, t.tm_mday,
                  t.tm_hour, t.tm_min, t.tm_sec, millis_part(epoch_ms));
    return buf;
}

std::string format_file_stamp(int64_t epoch_ms) {
    std::tm t = to_utc(epoch_ms);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d-%02d-%02d-%03dZ",
                  t.tm_year + 1900, t.tm_mon + 1, t.tm_mday,
                  t.tm_hour, t.tm_min, t.tm_sec, millis_part(epoch_ms));
    return buf;
}

std::string format_clock_time(int64_t epoch_ms) {
    std::tm t = to_utc(epoch_ms);
    char buf[20];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d",
                  t.tm_hour, t.tm_min, t.tm_sec, millis_part(epoch_ms));
    return buf;
}

std::string format_srt_time(int64_t offset_ms) {
    if (offset_ms < 0) offset_ms = 0;
    const int64_t hours = offset_ms / 3600000;
    const int minutes = static_cast<int>((offset_ms / 60000) % 60);
    const int seconds = static_cast<int>((offset_ms / 1000) % 60);
    const int millis = static_cast<int>(offset_ms % 1000);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02d:%02d,%03d",
                  static_cast<long long>(hours), minutes, seconds, millis);
    return buf;
}

} // namespace core
