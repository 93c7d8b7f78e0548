#include "trade_log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

// ---- Logging (avoid interleaved prints from multiple threads) ----
static std::mutex g_log_mtx;
static std::atomic<int> g_min_level{static_cast<int>(LogLevel::Info)};

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void set_log_level(LogLevel lvl) {
    g_min_level.store(static_cast<int>(lvl));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_min_level.load());
}

void log_line(LogLevel lvl, const char* tag, const std::string& msg) {
    if (static_cast<int>(lvl) < g_min_level.load()) return;

    std::lock_guard<std::mutex> lk(g_log_mtx);
    std::ostream& os = (lvl >= LogLevel::Warn) ? std::cerr : std::cout;
    os << "[" << tag << "] ";
    if (lvl == LogLevel::Warn)  os << "WARN ";
    if (lvl == LogLevel::Error) os << "ERROR ";
    os << msg << "\n";
}
