#pragma once

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace iit {

enum class LogLevel { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4, OFF = 5 };

namespace log {

inline const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF";
    }
    return "?";
}

inline LogLevel parse_level(const std::string& name, LogLevel fallback) {
    for (int i = 0; i <= static_cast<int>(LogLevel::OFF); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (name == level_name(level)) return level;
    }
    return fallback;
}

namespace detail {

inline LogLevel initial_level() {
    const char* env = std::getenv("IIT_LOG_LEVEL");
    return env ? parse_level(env, LogLevel::WARN) : LogLevel::WARN;
}

inline std::atomic<int>& threshold() {
    static std::atomic<int> value{static_cast<int>(initial_level())};
    return value;
}

inline std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

}  // namespace detail

inline void set_level(LogLevel level) {
    detail::threshold().store(static_cast<int>(level), std::memory_order_relaxed);
}

inline LogLevel level() {
    return static_cast<LogLevel>(detail::threshold().load(std::memory_order_relaxed));
}

inline bool enabled(LogLevel level) {
    return level != LogLevel::OFF &&
           static_cast<int>(level) >= detail::threshold().load(std::memory_order_relaxed);
}

/**
 * Write one line to stderr: "[HH:MM:SS.mmm][component] LEVEL message".
 *
 * Lines from concurrent workers never interleave.
 */
inline void write(LogLevel level, const char* component, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_time_t, &tm_buf);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    std::lock_guard<std::mutex> lock(detail::sink_mutex());
    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count()
              << std::setfill(' ') << "][" << component << "] " << level_name(level) << " "
              << message << "\n";
}

/**
 * Format and write one line when `level` is enabled. `format` receives the
 * stream to write to and is not called otherwise.
 *
 *   log::message(LogLevel::INFO, "BigPhi", [&](std::ostream& os) {
 *       os << "evaluated " << n << " cuts";
 *   });
 */
template<typename Format>
void message(LogLevel level, const char* component, Format&& format) {
    if (!enabled(level)) return;
    std::ostringstream os;
    format(static_cast<std::ostream&>(os));
    write(level, component, os.str());
}

}  // namespace log
}  // namespace iit
