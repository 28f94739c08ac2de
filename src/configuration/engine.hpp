#pragma once

#include <string>
#include <memory>
#include <future>
#include <functional>
#include <core/types.hpp>
#include "host_config.hpp"
#include "output_stream.hpp"

// One invocation of the configuration engine: its live output, a trigger
// that stops it, and the final status once it has exited.
struct EngineRun {
    std::shared_ptr<OutputStream> output;
    std::function<void()> cancel;
    std::shared_future<Result<void>> done;
};

// Engine run that failed before producing any output
EngineRun failed_engine_run(ErrorCode code, const std::string& error);

// External automation that applies provisioning steps to hosts
class ConfigurationEngine {
public:
    virtual ~ConfigurationEngine() = default;

    virtual EngineRun configure(const HostList& hosts, const std::string& extra_vars) = 0;
    virtual EngineRun cleanup(const HostList& hosts, const std::string& extra_vars) = 0;
};
