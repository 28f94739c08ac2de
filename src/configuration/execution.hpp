#pragma once

#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include "engine.hpp"

// Configure `hosts`; if that fails, run the engine's cleanup against the
// same hosts and extra vars. The returned status is always the configure
// result: cleanup failures are only logged. If `cancel` is already tripped
// when cleanup would start, cleanup is skipped.
Result<void> configure_or_cleanup_on_error(ConfigurationEngine& engine,
                                           const HostList& hosts,
                                           const std::string& extra_vars,
                                           const CancelToken& cancel,
                                           const StatusCallback& log);
