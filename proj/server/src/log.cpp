#include "parley_server/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace parley_server {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_log_mutex;
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "info")  { out = LogLevel::Info;  return true; }
    if (name == "warn")  { out = LogLevel::Warn;  return true; }
    if (name == "error") { out = LogLevel::Error; return true; }
    return false;
}

void set_log_level(LogLevel level) noexcept {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

std::string timestamp_hhmmss() {
    using namespace std::chrono;
    const std::time_t t = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream o;
    o << std::setfill('0')
      << std::setw(2) << tm.tm_hour << ":"
      << std::setw(2) << tm.tm_min  << ":"
      << std::setw(2) << tm.tm_sec;
    return o.str();
}

void log_line(LogLevel level, const std::string& text) {
    const std::string ts = timestamp_hhmmss();
    std::lock_guard<std::mutex> lock(g_log_mutex);

    switch (level) {
        case LogLevel::Debug:
        case LogLevel::Info:
            std::cout << "[" << ts << "] " << text << "\n";
            break;
        case LogLevel::Warn:
            std::cerr << "[" << ts << "] WARN: " << text << "\n";
            break;
        case LogLevel::Error:
            std::cerr << "[" << ts << "] ERROR: " << text << std::endl;
            break;
    }
}

} // namespace parley_server
