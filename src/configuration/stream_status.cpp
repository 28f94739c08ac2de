#include "stream_status.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <chrono>

static bool is_done(const EngineRun& run, int timeout_ms) {
    return run.done.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::ready;
}

// Forward whatever output is still buffered, bounded in time so a
// grandchild holding the pipe open cannot stall us.
static void drain_output(EngineRun& run, const StatusCallback& log) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(OUTPUT_DRAIN_MAX_MS);
    std::string line;
    while (std::chrono::steady_clock::now() < deadline) {
        auto st = run.output->read_line(line, STREAM_POLL_MS);
        if (st == OutputStream::ReadStatus::Eof) return;
        if (st == OutputStream::ReadStatus::Line && log) log(line);
    }
}

static Result<void> stop_canceled_run(EngineRun& run, const StatusCallback& log) {
    log_info("job canceled, stopping configuration engine");
    if (run.cancel) run.cancel();
    drain_output(run, log);
    run.done.wait();
    return Result<void>::Err(ErrorCode::Canceled, "job was canceled");
}

Result<void> log_output_and_return_status(EngineRun& run, const CancelToken& cancel,
                                          const StatusCallback& log) {
    if (!run.done.valid()) {
        return Result<void>::Err("configuration engine returned no completion signal");
    }

    if (run.output) {
        std::string line;
        while (true) {
            if (cancel.canceled()) return stop_canceled_run(run, log);

            auto st = run.output->read_line(line, STREAM_POLL_MS);
            if (st == OutputStream::ReadStatus::Line) {
                if (log) log(line);
                continue;
            }
            if (st == OutputStream::ReadStatus::Eof) break;

            // Timeout: the engine may have exited with the pipe still open
            if (is_done(run, 0)) {
                drain_output(run, log);
                break;
            }
        }
    }

    while (!is_done(run, STREAM_POLL_MS)) {
        if (cancel.canceled()) return stop_canceled_run(run, log);
    }
    return run.done.get();
}
