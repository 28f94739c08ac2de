#include "ansible_engine.hpp"
#include "ansible_host.hpp"
#include "extra_vars.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <future>

namespace fs = std::filesystem;

namespace {

// Pipe stream that owns the process whose output fd it reads
class ProcessOutputStream : public PipeOutputStream {
public:
    explicit ProcessOutputStream(std::shared_ptr<platform::ProcessHandle> proc)
        : PipeOutputStream(proc->output_fd()), proc_(std::move(proc)) {}

private:
    std::shared_ptr<platform::ProcessHandle> proc_;
};

} // namespace

AnsibleEngine::AnsibleEngine(const AnsibleConfig& config) : config_(config) {
}

EngineRun AnsibleEngine::configure(const HostList& hosts, const std::string& extra_vars) {
    return run_playbook(config_.configure_playbook, hosts, extra_vars);
}

EngineRun AnsibleEngine::cleanup(const HostList& hosts, const std::string& extra_vars) {
    return run_playbook(config_.cleanup_playbook, hosts, extra_vars);
}

std::string AnsibleEngine::playbook_path(const std::string& playbook) const {
    if (fs::path(playbook).is_absolute()) return playbook;
    return (fs::path(config_.playbook_location) / playbook).string();
}

std::vector<std::string> AnsibleEngine::playbook_args(const std::string& inventory_path,
                                                      const std::string& playbook,
                                                      const std::string& merged_vars) const {
    std::vector<std::string> args = {"-i", inventory_path};
    if (!config_.user.empty()) {
        args.push_back("-u");
        args.push_back(config_.user);
    }
    if (!config_.private_key.empty()) {
        args.push_back("--private-key");
        args.push_back(config_.private_key);
    }
    args.push_back("--extra-vars");
    args.push_back(merged_vars);
    args.push_back(playbook_path(playbook));
    return args;
}

EngineRun AnsibleEngine::run_playbook(const std::string& playbook, const HostList& hosts,
                                      const std::string& extra_vars) {
    auto merged = merge_extra_vars(config_.extra_variables, extra_vars);
    if (merged.is_err()) {
        return failed_engine_run(ErrorCode::Configuration, merged.error);
    }

    fs::path inventory = platform::temp_file("clusterm_inventory");
    if (inventory.empty()) {
        return failed_engine_run(ErrorCode::Configuration,
                                 "failed to create temporary inventory file");
    }
    {
        std::ofstream out(inventory);
        out << render_inventory(hosts);
        if (!out) {
            std::error_code ec;
            fs::remove(inventory, ec);
            return failed_engine_run(ErrorCode::Configuration,
                                     "failed to write inventory " + inventory.string());
        }
    }

    auto args = playbook_args(inventory.string(), playbook, merged.value);
    log_debug(fmt::format("ansible: {} {}", config_.binary, fmt::join(args, " ")));

    auto proc = std::make_shared<platform::ProcessHandle>(
        platform::spawn(config_.binary, args, true));
    if (!proc->valid()) {
        std::error_code ec;
        fs::remove(inventory, ec);
        return failed_engine_run(ErrorCode::Configuration,
                                 fmt::format("failed to start {}", config_.binary));
    }

    std::string label = fs::path(playbook).filename().string();

    EngineRun run;
    run.output = std::make_shared<ProcessOutputStream>(proc);
    run.cancel = [proc] { proc->terminate(ENGINE_TERM_GRACE_MS); };
    run.done = std::async(std::launch::async, [proc, inventory, label] {
        int rc = proc->wait();
        std::error_code ec;
        fs::remove(inventory, ec);
        if (rc == 0) {
            return Result<void>::Ok();
        }
        if (rc == 127) {
            return Result<void>::Err(ErrorCode::Configuration,
                fmt::format("{}: ansible-playbook could not be executed", label));
        }
        return Result<void>::Err(ErrorCode::Configuration,
            fmt::format("{} failed with exit status {}", label, rc));
    }).share();

    return run;
}
