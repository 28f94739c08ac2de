#include "cluster_manager.hpp"
#include "commission_event.hpp"
#include "topology.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

ClusterManager::ClusterManager(const Config& config, AssetTracker& assets,
                               ConfigurationEngine& engine,
                               ActiveJobGate::IdGenerator ids, ActiveJobGate::Clock clock)
    : config_(config),
      assets_(assets),
      engine_(engine),
      gate_(config.logging().job_log_dir, std::move(ids), std::move(clock)) {
}

ClusterManager::~ClusterManager() {
    if (gate_.cancel_active_job()) {
        log_info("shutting down, waiting for the active job to stop");
    }
    gate_.wait_idle();
}

Result<std::shared_ptr<CommissionEvent>> ClusterManager::commission_nodes(
        const std::vector<std::string>& names,
        const std::string& extra_vars,
        const std::string& host_group) {
    auto event = CommissionEvent::create(*this, names, extra_vars, host_group);
    auto result = event->process();
    if (result.is_err()) {
        log_warn(fmt::format("{} failed ({}): {}", event->to_string(),
                             error_code_name(result.code), result.error));
        return forward_error<std::shared_ptr<CommissionEvent>>(result);
    }
    return Result<std::shared_ptr<CommissionEvent>>::Ok(event);
}

Result<std::map<std::string, Node>> ClusterManager::common_event_validate(
        const std::vector<std::string>& names) {
    using R = Result<std::map<std::string, Node>>;

    if (names.empty()) {
        return R::Err(ErrorCode::Validation, "no nodes specified");
    }

    std::map<std::string, Node> resolved;
    for (const auto& name : names) {
        if (resolved.count(name)) {
            return R::Err(ErrorCode::Validation,
                          fmt::format("node '{}' specified more than once", name));
        }

        auto node = nodes_.find(name);
        if (!node) {
            return R::Err(ErrorCode::Validation, fmt::format("node '{}' doesn't exist", name));
        }
        if (node->mon_state != MonitorState::Discovered) {
            return R::Err(ErrorCode::Validation,
                          fmt::format("node '{}' is not in discovered state, monitor state: {}",
                                      name, monitor_state_name(node->mon_state)));
        }

        auto status = assets_.status(name);
        if (status.is_err()) {
            return R::Err(ErrorCode::Validation,
                          fmt::format("node '{}' has no inventory asset: {}", name, status.error));
        }

        resolved[name] = *node;
    }
    return R::Ok(resolved);
}

Result<bool> ClusterManager::is_discovered_and_allocated_node(const std::string& name) {
    return ::is_discovered_and_allocated_node(nodes_, assets_, name);
}

Result<bool> ClusterManager::is_master_node(const std::string& name) {
    return ::is_master_node(nodes_, name);
}

Result<void> ClusterManager::set_assets_status_atomic(const std::vector<std::string>& names,
                                                      AssetStatus expected,
                                                      const AssetStatusSetter& set,
                                                      const AssetStatusSetter& rollback) {
    return ::set_assets_status_atomic(assets_, names, expected, set, rollback);
}

std::vector<AssetUpdateOutcome> ClusterManager::set_assets_status_best_effort(
        const std::vector<std::string>& names,
        const AssetStatusSetter& set) {
    auto outcomes = ::set_assets_status_best_effort(names, set);
    for (const auto& o : outcomes) {
        if (o.result.is_err()) {
            log_error(fmt::format("failed to update status of asset '{}'. Error: {}",
                                  o.name, o.result.error));
        }
    }
    return outcomes;
}
