#include "execution.hpp"
#include "stream_status.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

Result<void> configure_or_cleanup_on_error(ConfigurationEngine& engine,
                                           const HostList& hosts,
                                           const std::string& extra_vars,
                                           const CancelToken& cancel,
                                           const StatusCallback& log) {
    auto run = engine.configure(hosts, extra_vars);
    auto cfg_result = log_output_and_return_status(run, cancel, log);
    if (cfg_result.is_ok()) {
        return cfg_result;
    }

    log_error(fmt::format("configuration failed, starting cleanup. Error: {}", cfg_result.error));
    if (cancel.canceled()) {
        log_warn("job canceled, skipping cleanup");
        if (log) log("cleanup skipped: job canceled");
        return cfg_result;
    }

    auto cleanup_run = engine.cleanup(hosts, extra_vars);
    auto cleanup_result = log_output_and_return_status(cleanup_run, cancel, log);
    if (cleanup_result.is_err()) {
        log_error(fmt::format("cleanup failed. Error: {}", cleanup_result.error));
    }

    // the caller only ever sees the configuration error
    return cfg_result;
}
