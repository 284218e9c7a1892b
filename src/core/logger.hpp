#pragma once
#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>

#include "time_utils.hpp"

namespace beagle {
enum class LogLevel { DEBUG, INFO, WARN, ERROR };

inline const char* level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

inline bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug")
        out = LogLevel::DEBUG;
    else if (name == "info")
        out = LogLevel::INFO;
    else if (name == "warn")
        out = LogLevel::WARN;
    else if (name == "error")
        out = LogLevel::ERROR;
    else
        return false;
    return true;
}

inline std::atomic<int>& log_threshold() {
    static std::atomic<int> threshold{static_cast<int>(LogLevel::INFO)};
    return threshold;
}

inline void set_log_level(LogLevel lvl) {
    log_threshold().store(static_cast<int>(lvl));
}

inline bool log_enabled(LogLevel lvl) {
    return static_cast<int>(lvl) >= log_threshold().load();
}

// Workers log concurrently; one line per call, never interleaved.
inline void write_log_line(LogLevel lvl, const std::string& msg) {
    static std::mutex mu;
    std::string ts = wall_time_iso8601();
    std::lock_guard<std::mutex> lock(mu);
    std::fprintf(stderr, "[%s] %s: %s\n", ts.c_str(), level_name(lvl), msg.c_str());
    std::fflush(stderr);
}

inline void log(LogLevel lvl, const std::string& msg) {
    if (log_enabled(lvl)) write_log_line(lvl, msg);
}
}  // namespace beagle
