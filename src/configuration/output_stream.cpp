#include "output_stream.hpp"
#include <core/constants.hpp>
#include <chrono>
#include <poll.h>
#include <unistd.h>
#include <cerrno>

// ── PipeOutputStream ────────────────────────────────────────

PipeOutputStream::PipeOutputStream(int fd) : fd_(fd) {
}

bool PipeOutputStream::take_line(std::string& line) {
    auto nl = buf_.find('\n');
    if (nl == std::string::npos) return false;
    line = buf_.substr(0, nl);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    buf_.erase(0, nl + 1);
    return true;
}

OutputStream::ReadStatus PipeOutputStream::read_line(std::string& line, int timeout_ms) {
    if (take_line(line)) return ReadStatus::Line;

    if (eof_ || fd_ < 0) {
        if (!buf_.empty()) {
            line.swap(buf_);
            buf_.clear();
            return ReadStatus::Line;
        }
        return ReadStatus::Eof;
    }

    struct pollfd pfd = {fd_, POLLIN, 0};
    int rc = poll(&pfd, 1, timeout_ms);
    if (rc == 0) return ReadStatus::Timeout;
    if (rc < 0) {
        if (errno == EINTR) return ReadStatus::Timeout;
        eof_ = true;
        return read_line(line, 0);
    }

    char chunk[PIPE_READ_BUF_SIZE];
    ssize_t n = read(fd_, chunk, sizeof(chunk));
    if (n > 0) {
        buf_.append(chunk, static_cast<size_t>(n));
        if (take_line(line)) return ReadStatus::Line;
        return ReadStatus::Timeout;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return ReadStatus::Timeout;

    // n == 0 (writer closed) or a hard read error
    eof_ = true;
    return read_line(line, 0);
}

// ── LineBufferStream ────────────────────────────────────────

LineBufferStream::LineBufferStream(const std::vector<std::string>& lines, bool closed)
    : lines_(lines.begin(), lines.end()), closed_(closed) {
}

void LineBufferStream::push_line(const std::string& line) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(line);
    }
    cv_.notify_all();
}

void LineBufferStream::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

OutputStream::ReadStatus LineBufferStream::read_line(std::string& line, int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms),
                 [this] { return !lines_.empty() || closed_; });
    if (!lines_.empty()) {
        line = lines_.front();
        lines_.pop_front();
        return ReadStatus::Line;
    }
    return closed_ ? ReadStatus::Eof : ReadStatus::Timeout;
}
