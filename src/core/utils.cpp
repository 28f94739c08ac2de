#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdio>

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:             return "none";
        case ErrorCode::Conflict:         return "conflict";
        case ErrorCode::Validation:       return "validation";
        case ErrorCode::Topology:         return "topology";
        case ErrorCode::StatusTransition: return "status-transition";
        case ErrorCode::Configuration:    return "configuration";
        case ErrorCode::Canceled:         return "canceled";
        case ErrorCode::Internal:         return "internal";
    }
    return "unknown";
}

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::string generate_job_id(const std::string& kind) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &tm_buf);
    return fmt::format("{}-{:03d}__{}", buf, static_cast<int>(ms.count()), kind);
}

std::string expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}
