#pragma once
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// "debug" / "info" / "warn" / "error"; unknown names map to Info
LogLevel parse_log_level(const std::string& name);

void set_log_level(LogLevel lvl);
LogLevel log_level();

// One "[TAG] msg" line; Warn and Error go to stderr.
// Lines from concurrent threads never interleave.
void log_line(LogLevel lvl, const char* tag, const std::string& msg);

inline void log_debug(const char* tag, const std::string& msg) { log_line(LogLevel::Debug, tag, msg); }
inline void log_info(const char* tag, const std::string& msg)  { log_line(LogLevel::Info, tag, msg); }
inline void log_warn(const char* tag, const std::string& msg)  { log_line(LogLevel::Warn, tag, msg); }
inline void log_error(const char* tag, const std::string& msg) { log_line(LogLevel::Error, tag, msg); }
