#pragma once

#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include "engine.hpp"

// Copy the run's output to `log` line by line until the engine finishes or
// `cancel` trips, and resolve to a single status. On cancellation the
// engine is stopped through run.cancel and a Canceled error is returned.
Result<void> log_output_and_return_status(EngineRun& run, const CancelToken& cancel,
                                          const StatusCallback& log);
