#include "engine.hpp"

EngineRun failed_engine_run(ErrorCode code, const std::string& error) {
    std::promise<Result<void>> p;
    p.set_value(Result<void>::Err(code, error));

    EngineRun run;
    run.output = std::make_shared<LineBufferStream>(std::vector<std::string>{}, true);
    run.cancel = [] {};
    run.done = p.get_future().share();
    return run;
}
