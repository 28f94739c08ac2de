#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    if (out_fd_ >= 0) close(out_fd_);
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), out_fd_(other.out_fd_), exited_(other.exited_.load()) {
    other.pid_ = -1;
    other.out_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (out_fd_ >= 0) close(out_fd_);
        pid_ = other.pid_;
        out_fd_ = other.out_fd_;
        exited_.store(other.exited_.load());
        other.pid_ = -1;
        other.out_fd_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::reap(int status) {
    exited_.store(true);
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (timeout_ms < 0) {
        int status = 0;
        pid_t ret;
        do {
            ret = waitpid(pid_, &status, 0);
        } while (ret < 0 && errno == EINTR);
        if (ret == pid_) return reap(status);
        exited_.store(true);  // reaped elsewhere
        return -1;
    }
    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        int status = 0;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) return reap(status);
        if (ret < 0) {
            exited_.store(true);
            return -1;
        }
        sleep_ms(100);
        elapsed += 100;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate(int grace_ms) {
    if (pid_ <= 0 || exited_.load()) return;
    kill(-pid_, SIGTERM);
    for (int waited = 0; waited < grace_ms; waited += 100) {
        if (exited_.load()) return;
        int status = 0;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reap(status);
            return;
        }
        sleep_ms(100);
    }
    if (!exited_.load()) kill(-pid_, SIGKILL);
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    bool capture_output) {
    ProcessHandle handle;

    int fds[2] = {-1, -1};
    if (capture_output && pipe2(fds, O_CLOEXEC) != 0) {
        return handle;
    }

    pid_t pid = fork();
    if (pid < 0) {  // fork failed
        if (fds[0] >= 0) { close(fds[0]); close(fds[1]); }
        return handle;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (capture_output) {
            dup2(fds[1], STDOUT_FILENO);
            dup2(fds[1], STDERR_FILENO);
        }

        // Build argv array
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    setpgid(pid, pid);
    if (capture_output) {
        close(fds[1]);
        handle.out_fd_ = fds[0];
    }
    handle.pid_ = pid;
    return handle;
}

} // namespace platform
