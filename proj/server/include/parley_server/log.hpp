#pragma once

#include <sstream>
#include <string>

namespace parley_server {

enum class LogLevel {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3
};

// Parses "debug" | "info" | "warn" | "error". Returns false on anything else.
bool parse_log_level(const std::string& name, LogLevel& out);

void set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;

// "14:32:10", local time
std::string timestamp_hhmmss();

// Debug/Info -> stdout, Warn/Error -> stderr. One line per call.
void log_line(LogLevel level, const std::string& text);

namespace detail {
template <typename... Args>
void log_fmt(LogLevel level, const Args&... args) {
    if (level < log_level()) return;
    std::ostringstream o;
    (o << ... << args);
    log_line(level, o.str());
}
} // namespace detail

template <typename... Args> void log_debug(const Args&... a) { detail::log_fmt(LogLevel::Debug, a...); }
template <typename... Args> void log_info(const Args&... a)  { detail::log_fmt(LogLevel::Info, a...); }
template <typename... Args> void log_warn(const Args&... a)  { detail::log_fmt(LogLevel::Warn, a...); }
template <typename... Args> void log_error(const Args&... a) { detail::log_fmt(LogLevel::Error, a...); }

} // namespace parley_server
