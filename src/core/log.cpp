#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <atomic>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <mutex>

namespace {

std::mutex log_mutex;
std::string current_path;
std::atomic<LogLevel> threshold{LogLevel::INFO};

} // namespace

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::DEBUG; return true; }
    if (name == "info")  { out = LogLevel::INFO;  return true; }
    if (name == "warn")  { out = LogLevel::WARN;  return true; }
    if (name == "error") { out = LogLevel::ERROR; return true; }
    return false;
}

void set_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_path = path;
}

std::string log_path() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (current_path.empty()) {
        current_path = (platform::temp_dir() / DEFAULT_LOG_FILE).string();
    }
    return current_path;
}

void set_log_level(LogLevel level) {
    threshold = level;
}

void sshgate_log(LogLevel level, const std::string& msg) {
    if (level < threshold.load()) return;

    std::string path = log_path();

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(log_mutex);
    std::ofstream out(path, std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << fmt::format("{:<5}", level_name(level)) << " " << msg << "\n";
}
