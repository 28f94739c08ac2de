#pragma once

#include <string>
#include <fmt/format.h>

enum class LogLevel { Debug, Info, Warn, Error };

// Parse "debug" / "info" / "warn" / "error". Unknown names map to Info.
LogLevel parse_log_level(const std::string& name);

// Route log output to a file and set the minimum level written.
// An empty path selects <tmp>/clusterm.log.
void configure_logging(const std::string& path, LogLevel min_level);

std::string clusterm_log_path();

// Append a timestamped line to the debug log.
void clusterm_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { clusterm_log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { clusterm_log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { clusterm_log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { clusterm_log(LogLevel::Error, msg); }

// Persistent job log path: <dir>/{job_id}.log
std::string job_log_path(const std::string& dir, const std::string& job_id);

// Append a timestamped line to a job's persistent log file.
void append_job_log(const std::string& dir, const std::string& job_id, const std::string& msg);
