#include "log.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <mutex>

namespace {

std::mutex log_mutex;
std::string log_path_override;
std::atomic<int> min_level{static_cast<int>(LogLevel::Info)};

} // namespace

bool parse_log_level(const std::string& s, LogLevel& out) {
    if (s == "error") { out = LogLevel::Error; return true; }
    if (s == "warn")  { out = LogLevel::Warn;  return true; }
    if (s == "info")  { out = LogLevel::Info;  return true; }
    if (s == "debug") { out = LogLevel::Debug; return true; }
    return false;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
    }
    return "?";
}

std::string pw_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_path_override.empty()) return log_path_override;
    static const std::string path = (std::filesystem::temp_directory_path() / "pipewatch_debug.log").string();
    return path;
}

void set_log_path(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_path_override = path.string();
}

void set_log_level(LogLevel level) {
    min_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(min_level.load());
}

void pw_log(LogLevel level, const std::string& msg) {
    if (static_cast<int>(level) > min_level.load()) return;

    std::string path = pw_log_path();

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(log_mutex);
    std::ofstream out(path, std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << log_level_name(level) << " " << msg << "\n";
}
