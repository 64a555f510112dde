#pragma once

#include <string>
#include <filesystem>

enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3,
};

// "error" | "warn" | "info" | "debug". Returns false for anything else.
bool parse_log_level(const std::string& s, LogLevel& out);
const char* log_level_name(LogLevel level);

// Default: <tmp>/pipewatch_debug.log
std::string pw_log_path();
void set_log_path(const std::filesystem::path& path);

// Messages above this level are dropped. Default: Info.
void set_log_level(LogLevel level);
LogLevel log_level();

// Append a timestamped line to the debug log. Safe to call from any thread.
void pw_log(LogLevel level, const std::string& msg);

inline void log_error(const std::string& msg) { pw_log(LogLevel::Error, msg); }
inline void log_warn(const std::string& msg) { pw_log(LogLevel::Warn, msg); }
inline void log_info(const std::string& msg) { pw_log(LogLevel::Info, msg); }
inline void log_debug(const std::string& msg) { pw_log(LogLevel::Debug, msg); }
