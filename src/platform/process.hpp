#pragma once

#include <string>
#include <vector>
#include <atomic>

namespace platform {

// Opaque handle to a spawned child process. The child leads its own
// process group so terminate() also reaches anything it forked.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Wait for the process to exit. Returns the exit code, 128+signal if the
    // child was killed, or -1 on timeout / reap failure.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // SIGTERM the process group, then SIGKILL after grace_ms if still alive.
    void terminate(int grace_ms);

    // Read end of the child's combined stdout/stderr pipe, -1 if not captured.
    int output_fd() const { return out_fd_; }

private:
    int pid_ = -1;
    int out_fd_ = -1;
    std::atomic<bool> exited_{false};

    int reap(int status);

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               bool capture_output);
};

// Spawn a child process. With capture_output the child's stdout and stderr
// are joined into one pipe readable through output_fd().
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool capture_output = false);

} // namespace platform
