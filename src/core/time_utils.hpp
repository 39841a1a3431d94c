#pragma once
#include <cstdint>
#include <string>

namespace core {

// Wall clock, milliseconds since the Unix epoch.
int64_t now_ms();

// "2025-03-01T14:05:09.123Z"
std::string format_iso_utc(int64_t epoch_ms);

// "2025-03-01T14-05-09-123Z", safe for file names.
std::string format_file_stamp(int64_t epoch_ms);

// "14:05:09.123" (UTC)
std::string format_clock_time(int64_t epoch_ms);

// "HH:MM:SS,mmm" for a duration, as used by SRT subtitles.
std::string format_srt_time(int64_t offset_ms);

} // namespace core
