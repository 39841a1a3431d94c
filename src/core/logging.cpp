#include "core/logging.hpp"
#include "core/time_utils.hpp"
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace core {

namespace {
LogLevel initial_level() {
    return std::getenv("DUALSCRIBE_DEBUG") != nullptr ? LogLevel::Debug : LogLevel::Info;
}

std::atomic<LogLevel> g_level{initial_level()};
std::mutex g_log_mutex;

void write_line(std::ostream& os, const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    os << "[" << format_clock_time(now_ms()) << "] [" << tag << "] " << msg << std::endl;
}
} // namespace

void set_log_level(LogLevel level) { g_level.store(level); }
LogLevel log_level() { return g_level.load(); }

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void log_debug(const std::string& msg) {
    if (g_level.load() <= LogLevel::Debug) write_line(std::cout, "DEBUG", msg);
}
void log_info(const std::string& msg) {
    if (g_level.load() <= LogLevel::Info) write_line(std::cout, "INFO", msg);
}
void log_warn(const std::string& msg) {
    if (g_level.load() <= LogLevel::Warn) write_line(std::cerr, "WARN", msg);
}
void log_error(const std::string& msg) { write_line(std::cerr, "ERROR", msg); }

} // namespace core
