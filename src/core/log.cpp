#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <filesystem>
#include <mutex>

namespace {

std::mutex log_mutex;
std::string log_path;
LogLevel log_min_level = LogLevel::Info;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "?    ";
}

std::string default_log_path() {
    return (platform::temp_dir() / "clusterm.log").string();
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void configure_logging(const std::string& path, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_path = path.empty() ? default_log_path() : path;
    log_min_level = min_level;
}

std::string clusterm_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return log_path.empty() ? default_log_path() : log_path;
}

void clusterm_log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < log_min_level) return;

    std::ofstream out(log_path.empty() ? default_log_path() : log_path, std::ios::app);
    if (!out) return;

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
    out << "[" << ts << "] " << level_tag(level) << " " << msg << "\n";
}

std::string job_log_path(const std::string& dir, const std::string& job_id) {
    return (std::filesystem::path(dir) / (job_id + ".log")).string();
}

void append_job_log(const std::string& dir, const std::string& job_id, const std::string& msg) {
    if (dir.empty()) return;
    std::string path = job_log_path(dir, job_id);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}
