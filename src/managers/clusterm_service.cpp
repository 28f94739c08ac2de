#include "clusterm_service.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <configuration/ansible_host.hpp>
#include <configuration/extra_vars.hpp>
#include <fmt/format.h>

ClustermService::ClustermService() = default;

ClustermService::~ClustermService() {
    stop();
}

// ── Lifecycle ─────────────────────────────────────────────────

Result<void> ClustermService::start(const std::string& config_path, StatusCallback cb) {
    if (manager_) {
        return Result<void>::Ok();
    }

    auto config_result = config_path.empty() ? Config::load()
                                             : Config::load_file(expand_home(config_path));
    if (config_result.is_err()) {
        return Result<void>::Err(config_result.error);
    }
    config_ = config_result.value;

    auto vars = parse_extra_vars(config_->ansible().extra_variables);
    if (vars.is_err()) {
        config_.reset();
        return Result<void>::Err(ErrorCode::Configuration, "ansible.extra_variables: " + vars.error);
    }

    const auto& logging = config_->logging();
    configure_logging(expand_home(logging.file), parse_log_level(logging.level));
    if (!logging.job_log_dir.empty()) {
        config_->set_job_log_dir(expand_home(logging.job_log_dir));
    }

    std::string state_file = config_->inventory().state_file;
    inventory_ = std::make_unique<InventoryStore>(state_file.empty() ? fs::path()
                                                                     : fs::path(expand_home(state_file)));
    auto loaded = inventory_->load();
    if (loaded.is_err()) {
        inventory_.reset();
        return Result<void>::Err("Failed to load inventory: " + loaded.error);
    }
    if (cb) cb(fmt::format("Inventory loaded ({} assets)", inventory_->assets().size()));

    engine_ = std::make_unique<AnsibleEngine>(config_->ansible());
    manager_ = std::make_unique<ClusterManager>(config_.value(), *inventory_, *engine_);

    log_info(fmt::format("clusterm started, log file {}", clusterm_log_path()));
    return Result<void>::Ok();
}

void ClustermService::stop() {
    if (manager_) {
        manager_.reset();
        log_info("clusterm stopped");
    }
    engine_.reset();
    inventory_.reset();
}

// ── Nodes ─────────────────────────────────────────────────────

Result<void> ClustermService::add_node(const std::string& name, const std::string& mgmt_address,
                                       MonitorState state) {
    if (!manager_) return Result<void>::Err("Not started");

    // A known node keeps its host config: its group and master vars
    // record what it was commissioned as.
    auto existing = manager_->nodes().find(name);
    if (existing && existing->cfg && existing->cfg->address() == mgmt_address) {
        auto updated = manager_->nodes().set_monitor_state(name, state, mgmt_address);
        if (updated.is_err()) return updated;
    } else {
        Node node;
        node.name = name;
        node.mgmt_address = mgmt_address;
        node.mon_state = state;
        if (existing && existing->cfg) {
            node.cfg = std::make_shared<AnsibleHost>(existing->cfg->tag(), mgmt_address,
                                                     existing->cfg->group(), existing->cfg->vars());
        } else {
            node.cfg = std::make_shared<AnsibleHost>(name, mgmt_address);
        }

        auto added = manager_->nodes().upsert(node);
        if (added.is_err()) return added;
    }

    if (inventory_->status(name).is_err()) {
        auto asset = inventory_->add_asset(name);
        // a concurrent add_node may have created it first
        if (asset.is_err() && inventory_->status(name).is_err()) return asset;
    }
    log_debug(fmt::format("node {} ({}) registered as {}", name, mgmt_address,
                          monitor_state_name(state)));
    return Result<void>::Ok();
}

Result<void> ClustermService::set_monitor_state(const std::string& name, MonitorState state) {
    if (!manager_) return Result<void>::Err("Not started");
    return manager_->nodes().set_monitor_state(name, state);
}

std::vector<NodeSummary> ClustermService::list_nodes() {
    std::vector<NodeSummary> out;
    if (!manager_) return out;

    for (const auto& node : manager_->nodes().nodes()) {
        NodeSummary s;
        s.name = node.name;
        s.mgmt_address = node.mgmt_address;
        s.monitor_state = monitor_state_name(node.mon_state);
        auto status = inventory_->status(node.name);
        s.asset_status = status.is_ok() ? asset_status_name(status.value) : "-";
        s.group = node.cfg ? node.cfg->group() : "";
        out.push_back(s);
    }
    return out;
}

// ── Jobs ──────────────────────────────────────────────────────

Result<std::shared_ptr<CommissionEvent>> ClustermService::commission_nodes(
        const std::vector<std::string>& names,
        const std::string& extra_vars,
        const std::string& host_group) {
    if (!manager_) return Result<std::shared_ptr<CommissionEvent>>::Err("Not started");
    return manager_->commission_nodes(names, extra_vars, host_group);
}

std::optional<JobInfo> ClustermService::active_job() const {
    if (!manager_) return std::nullopt;
    return manager_->active_job();
}

std::optional<JobInfo> ClustermService::last_job() const {
    if (!manager_) return std::nullopt;
    return manager_->last_job();
}

Result<void> ClustermService::cancel_job() {
    if (!manager_) return Result<void>::Err("Not started");
    if (!manager_->cancel_active_job()) {
        return Result<void>::Err("No active job");
    }
    return Result<void>::Ok();
}

bool ClustermService::wait_idle(int timeout_ms) {
    if (!manager_) return true;
    return manager_->wait_idle(timeout_ms);
}
