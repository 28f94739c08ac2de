#pragma once

#include <string>
#include <deque>
#include <vector>
#include <mutex>
#include <condition_variable>

// Line-oriented output of a running configuration engine
class OutputStream {
public:
    enum class ReadStatus { Line, Timeout, Eof };

    virtual ~OutputStream() = default;

    // Wait up to timeout_ms for the next complete line (without '\n').
    // A trailing partial line is delivered before Eof.
    virtual ReadStatus read_line(std::string& line, int timeout_ms) = 0;
};

// Reads lines from a pipe file descriptor. Does not own the fd.
class PipeOutputStream : public OutputStream {
public:
    explicit PipeOutputStream(int fd);

    ReadStatus read_line(std::string& line, int timeout_ms) override;

private:
    int fd_;
    std::string buf_;
    bool eof_ = false;

    bool take_line(std::string& line);
};

// In-memory stream fed by push_line()/close(); used for engine runs that
// never produced a process and by tests.
class LineBufferStream : public OutputStream {
public:
    LineBufferStream() = default;
    explicit LineBufferStream(const std::vector<std::string>& lines, bool closed = true);

    void push_line(const std::string& line);
    void close();

    ReadStatus read_line(std::string& line, int timeout_ms) override;

private:
    std::deque<std::string> lines_;
    bool closed_ = false;
    std::mutex mutex_;
    std::condition_variable cv_;
};
