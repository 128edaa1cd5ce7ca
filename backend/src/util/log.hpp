#pragma once
#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

// Process-wide console logging. Every runner thread writes through here so
// lines from different endpoints never interleave.
enum class LogLevel : uint8_t {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3
};

inline std::atomic<bool>& log_verbose_flag() {
    static std::atomic<bool> verbose{false};
    return verbose;
}

inline void set_log_verbose(bool on) {
    log_verbose_flag().store(on, std::memory_order_relaxed);
}

inline void log_line(LogLevel level, const std::string& line) {
    if (level == LogLevel::Debug && !log_verbose_flag().load(std::memory_order_relaxed))
        return;
    static std::mutex io_mtx;
    std::lock_guard<std::mutex> lk(io_mtx);
    std::ostream& os = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    os << line << std::endl;
}

template <typename... Args>
inline std::string log_format(const Args&... args) {
    std::ostringstream os;
    (os << ... << args);
    return os.str();
}

template <typename... Args>
inline void log_debug(const Args&... args) {
    if (!log_verbose_flag().load(std::memory_order_relaxed)) return;
    log_line(LogLevel::Debug, log_format(args...));
}

template <typename... Args>
inline void log_info(const Args&... args) { log_line(LogLevel::Info, log_format(args...)); }

template <typename... Args>
inline void log_warn(const Args&... args) { log_line(LogLevel::Warn, log_format(args...)); }

template <typename... Args>
inline void log_error(const Args&... args) { log_line(LogLevel::Error, log_format(args...)); }
