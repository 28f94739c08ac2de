#pragma once

#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <optional>
#include <functional>
#include <condition_variable>
#include <core/types.hpp>
#include <core/cancel_token.hpp>

enum class JobStatus { Idle, Active, Errored, Completed };

const char* job_status_name(JobStatus status);

// Body of a job, run on the gate's worker thread
using JobRunner = std::function<Result<void>(const CancelToken& cancel,
                                             const StatusCallback& log)>;

// Called exactly once when the runner returns
using JobDoneCallback = std::function<void(JobStatus status, const Result<void>& result)>;

// Snapshot of a job for polling
struct JobInfo {
    std::string id;
    std::string description;
    JobStatus status = JobStatus::Idle;
    ErrorCode error_code = ErrorCode::None;
    std::string error;
    std::string start_time;
    std::string end_time;
    std::vector<std::string> logs;   // last MAX_JOB_LOG_LINES output lines
};

// Admits at most one cluster-mutating job at a time.
//
// check_and_set_active_job() claims the gate, run_active_job() starts the
// runner on a worker thread, and the gate frees itself after the runner's
// completion callback has returned. reset_active_job() releases a claimed
// job that was never started.
class ActiveJobGate {
public:
    using IdGenerator = std::function<std::string()>;
    using Clock = std::function<std::string()>;

    explicit ActiveJobGate(const std::string& job_log_dir = "",
                           IdGenerator ids = nullptr, Clock clock = nullptr);
    ~ActiveJobGate();

    ActiveJobGate(const ActiveJobGate&) = delete;
    ActiveJobGate& operator=(const ActiveJobGate&) = delete;

    // Fails with ErrorCode::Conflict, changing nothing, if a job is active.
    Result<void> check_and_set_active_job(const std::string& description,
                                          JobRunner runner,
                                          JobDoneCallback on_complete);

    // Start the claimed job in the background.
    Result<void> run_active_job();

    // Release a claimed job that has not been started. No-op otherwise.
    void reset_active_job();

    // Trip the active job's cancel token. Returns false if nothing is active.
    bool cancel_active_job();

    bool is_active() const;
    std::optional<JobInfo> active_job() const;
    std::optional<JobInfo> last_job() const;

    // Block until no job is active. timeout_ms = -1 waits indefinitely.
    bool wait_idle(int timeout_ms = -1);

private:
    struct Job {
        JobInfo info;
        JobRunner runner;
        JobDoneCallback on_complete;
        CancelTokenPtr cancel;
        std::deque<std::string> logs;
        bool started = false;
    };

    std::string job_log_dir_;
    IdGenerator ids_;
    Clock clock_;

    std::shared_ptr<Job> active_;
    std::optional<JobInfo> last_;
    std::thread worker_;
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;

    void run_job(std::shared_ptr<Job> job);
    void append_log(Job& job, const std::string& line);
    JobInfo snapshot(const Job& job) const;
};
