#include "commission_event.hpp"
#include "cluster_manager.hpp"
#include "topology.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <configuration/extra_vars.hpp>
#include <configuration/execution.hpp>
#include <fmt/format.h>

const char* commission_state_name(CommissionState state) {
    switch (state) {
        case CommissionState::Created:             return "created";
        case CommissionState::Validating:          return "validating";
        case CommissionState::PreparingInventory:  return "preparing-inventory";
        case CommissionState::SettingProvisioning: return "setting-provisioning";
        case CommissionState::Running:             return "running";
        case CommissionState::Committing:          return "committing";
        case CommissionState::RollingBack:         return "rolling-back";
        case CommissionState::Done:                return "done";
    }
    return "unknown";
}

std::shared_ptr<CommissionEvent> CommissionEvent::create(ClusterManager& mgr,
                                                         const std::vector<std::string>& node_names,
                                                         const std::string& extra_vars,
                                                         const std::string& host_group) {
    return std::make_shared<CommissionEvent>(Token{}, mgr, node_names, extra_vars, host_group);
}

CommissionEvent::CommissionEvent(Token, ClusterManager& mgr, const std::vector<std::string>& node_names,
                                 const std::string& extra_vars, const std::string& host_group)
    : mgr_(mgr), node_names_(node_names), extra_vars_(extra_vars), host_group_(host_group) {
}

std::string CommissionEvent::to_string() const {
    return fmt::format("commissionEvent: [{}]", join(node_names_));
}

Result<void> CommissionEvent::process() {
    if (state_ != CommissionState::Created) {
        return Result<void>::Err(fmt::format("{} was already processed", to_string()));
    }

    auto self = shared_from_this();
    auto acquired = mgr_.gate().check_and_set_active_job(
        to_string(),
        [self](const CancelToken& cancel, const StatusCallback& log) {
            return self->run(cancel, log);
        },
        [self](JobStatus status, const Result<void>& result) {
            self->on_job_done(status, result);
        });
    if (acquired.is_err()) {
        return acquired;
    }

    auto result = process_acquired();
    if (result.is_err()) {
        log_warn(fmt::format("{} rejected while {}: {}", to_string(),
                             commission_state_name(state_), result.error));
        mgr_.gate().reset_active_job();
        state_ = CommissionState::Done;
    }
    return result;
}

// Runs with the gate held. Every error returned here releases it.
Result<void> CommissionEvent::process_acquired() {
    state_ = CommissionState::Validating;
    auto valid = event_validate();
    if (valid.is_err()) {
        return valid;
    }

    state_ = CommissionState::PreparingInventory;
    auto prepared = prepare_inventory();
    if (prepared.is_err()) {
        return prepared;
    }

    state_ = CommissionState::SettingProvisioning;
    auto& assets = mgr_.assets();
    auto provisioning = mgr_.set_assets_status_atomic(
        node_names_, AssetStatus::Unallocated,
        [&assets](const std::string& name) { return assets.set_provisioning(name); },
        [&assets](const std::string& name) { return assets.set_unallocated(name); });
    if (provisioning.is_err()) {
        return provisioning;
    }

    state_ = CommissionState::Running;
    auto started = mgr_.gate().run_active_job();
    if (started.is_err()) {
        mgr_.set_assets_status_best_effort(
            node_names_,
            [&assets](const std::string& name) { return assets.set_unallocated(name); });
        return started;
    }

    log_info(fmt::format("{} started as group {}", to_string(), host_group_));
    return Result<void>::Ok();
}

Result<void> CommissionEvent::event_validate() {
    if (!is_valid_host_group(host_group_)) {
        return Result<void>::Err(ErrorCode::Validation,
            fmt::format("invalid or empty host-group specified: '{}'", host_group_));
    }

    auto vars = parse_extra_vars(extra_vars_);
    if (vars.is_err()) {
        return Result<void>::Err(ErrorCode::Validation,
            fmt::format("invalid extra variables: {}", vars.error));
    }

    auto nodes = mgr_.common_event_validate(node_names_);
    if (nodes.is_err()) {
        return forward_error<void>(nodes);
    }
    enodes_ = nodes.value;
    return Result<void>::Ok();
}

Result<void> CommissionEvent::prepare_inventory() {
    auto assignment = assign_topology(mgr_.nodes(), mgr_.assets(), enodes_, host_group_);
    if (assignment.is_err()) {
        return Result<void>::Err(ErrorCode::Topology, assignment.error);
    }

    if (assignment.value.master_found) {
        log_debug(fmt::format("{}: using master {} ({})", to_string(),
                              assignment.value.master_name, assignment.value.master_addr));
    }
    hosts_ = assignment.value.hosts;
    return Result<void>::Ok();
}

Result<void> CommissionEvent::run(const CancelToken& cancel, const StatusCallback& log) {
    return configure_or_cleanup_on_error(mgr_.engine(), hosts_, extra_vars_, cancel, log);
}

void CommissionEvent::on_job_done(JobStatus status, const Result<void>& result) {
    auto& assets = mgr_.assets();
    if (status == JobStatus::Errored) {
        state_ = CommissionState::RollingBack;
        log_warn(fmt::format("{} failed, reverting nodes to unallocated. Error: {}",
                             to_string(), result.error));
        mgr_.set_assets_status_best_effort(
            node_names_,
            [&assets](const std::string& name) { return assets.set_unallocated(name); });
    } else {
        state_ = CommissionState::Committing;
        mgr_.set_assets_status_best_effort(
            node_names_,
            [&assets](const std::string& name) { return assets.set_commissioned(name); });
    }
    state_ = CommissionState::Done;
}
