#pragma once
#include <string>

namespace core {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

void set_log_level(LogLevel level);
LogLevel log_level();

// Parses "debug", "info", "warn", "error". Unknown names map to Info.
LogLevel parse_log_level(const std::string& name);

void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

} // namespace core
