#include "job_gate.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <chrono>

const char* job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::Idle:      return "idle";
        case JobStatus::Active:    return "active";
        case JobStatus::Errored:   return "errored";
        case JobStatus::Completed: return "completed";
    }
    return "unknown";
}

static Result<void> err_active_job(const std::string& desc) {
    return Result<void>::Err(ErrorCode::Conflict,
        fmt::format("there is already an active job, please try in sometime. Job: {}", desc));
}

ActiveJobGate::ActiveJobGate(const std::string& job_log_dir, IdGenerator ids, Clock clock)
    : job_log_dir_(job_log_dir),
      ids_(ids ? std::move(ids) : IdGenerator([] { return generate_job_id("job"); })),
      clock_(clock ? std::move(clock) : Clock([] { return now_iso(); })) {
}

ActiveJobGate::~ActiveJobGate() {
    cancel_active_job();
    reset_active_job();
    wait_idle();
    if (worker_.joinable()) {
        worker_.join();
    }
}

Result<void> ActiveJobGate::check_and_set_active_job(const std::string& description,
                                                     JobRunner runner,
                                                     JobDoneCallback on_complete) {
    std::thread finished;
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_) {
            return err_active_job(active_->info.description);
        }

        auto job = std::make_shared<Job>();
        job->info.id = ids_();
        job->info.description = description;
        job->info.status = JobStatus::Active;
        job->runner = std::move(runner);
        job->on_complete = std::move(on_complete);
        job->cancel = std::make_shared<CancelToken>();
        active_ = job;
        id = job->info.id;

        // The previous worker has already cleared itself; reap its thread
        finished = std::move(worker_);
    }
    if (finished.joinable()) finished.join();

    log_info(fmt::format("job {} accepted: {}", id, description));
    return Result<void>::Ok();
}

Result<void> ActiveJobGate::run_active_job() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) {
        return Result<void>::Err("no active job to run");
    }
    if (active_->started) {
        return Result<void>::Err(fmt::format("job {} is already running", active_->info.id));
    }

    active_->started = true;
    active_->info.start_time = clock_();
    worker_ = std::thread(&ActiveJobGate::run_job, this, active_);
    return Result<void>::Ok();
}

void ActiveJobGate::reset_active_job() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) return;
        if (active_->started) {
            log_warn(fmt::format("job {} is running, not resetting it", active_->info.id));
            return;
        }
        log_info(fmt::format("job {} reset before start", active_->info.id));
        active_.reset();
    }
    idle_cv_.notify_all();
}

bool ActiveJobGate::cancel_active_job() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) return false;
    active_->cancel->cancel();
    log_info(fmt::format("job {} cancel requested", active_->info.id));
    return true;
}

bool ActiveJobGate::is_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ != nullptr;
}

std::optional<JobInfo> ActiveJobGate::active_job() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_) return std::nullopt;
    return snapshot(*active_);
}

std::optional<JobInfo> ActiveJobGate::last_job() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_;
}

bool ActiveJobGate::wait_idle(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout_ms < 0) {
        idle_cv_.wait(lock, [this] { return active_ == nullptr; });
        return true;
    }
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [this] { return active_ == nullptr; });
}

// caller holds mutex_
JobInfo ActiveJobGate::snapshot(const Job& job) const {
    JobInfo info = job.info;
    info.logs.assign(job.logs.begin(), job.logs.end());
    return info;
}

void ActiveJobGate::append_log(Job& job, const std::string& line) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job.logs.push_back(line);
        while (job.logs.size() > static_cast<size_t>(MAX_JOB_LOG_LINES)) {
            job.logs.pop_front();
        }
    }
    append_job_log(job_log_dir_, job.info.id, line);
}

void ActiveJobGate::run_job(std::shared_ptr<Job> job) {
    StatusCallback log = [this, job](const std::string& line) { append_log(*job, line); };

    Result<void> result = Result<void>::Err("job has no runner");
    if (job->runner) {
        try {
            result = job->runner(*job->cancel, log);
        } catch (const std::exception& e) {
            result = Result<void>::Err(std::string("job runner threw: ") + e.what());
        }
    }

    JobStatus status = result.is_ok() ? JobStatus::Completed : JobStatus::Errored;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job->info.status = status;
        job->info.error_code = result.code;
        job->info.error = result.error;
        job->info.end_time = clock_();
    }
    if (result.is_ok()) {
        log_info(fmt::format("job {} finished: {}", job->info.id, job_status_name(status)));
    } else {
        log_info(fmt::format("job {} finished: {} ({}: {})", job->info.id, job_status_name(status),
                             error_code_name(result.code), result.error));
    }

    if (job->on_complete) {
        try {
            job->on_complete(status, result);
        } catch (const std::exception& e) {
            log_error(fmt::format("job {} completion callback threw: {}", job->info.id, e.what()));
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_ = snapshot(*job);
        active_.reset();
    }
    idle_cv_.notify_all();
}
