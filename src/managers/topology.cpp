#include "topology.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

bool is_valid_host_group(const std::string& group) {
    return group == MASTER_GROUP_NAME || group == WORKER_GROUP_NAME;
}

Result<bool> is_discovered_and_allocated_node(const NodeRegistry& registry,
                                              AssetTracker& assets,
                                              const std::string& name) {
    auto node = registry.find(name);
    if (!node) {
        return Result<bool>::Err(ErrorCode::Validation, fmt::format("node '{}' doesn't exist", name));
    }
    if (node->mon_state != MonitorState::Discovered) {
        return Result<bool>::Ok(false);
    }

    auto status = assets.status(name);
    if (status.is_err()) {
        return forward_error<bool>(status);
    }
    return Result<bool>::Ok(status.value == AssetStatus::Commissioned);
}

Result<bool> is_master_node(const NodeRegistry& registry, const std::string& name) {
    auto node = registry.find(name);
    if (!node) {
        return Result<bool>::Err(ErrorCode::Validation, fmt::format("node '{}' doesn't exist", name));
    }
    if (!node->cfg) {
        return Result<bool>::Err(fmt::format("node '{}' has no host configuration", name));
    }
    return Result<bool>::Ok(node->cfg->group() == MASTER_GROUP_NAME);
}

Result<TopologyAssignment> assign_topology(const NodeRegistry& registry,
                                           AssetTracker& assets,
                                           const std::map<std::string, Node>& event_nodes,
                                           const std::string& host_group) {
    TopologyAssignment out;
    out.host_group = host_group;

    for (const auto& node : registry.nodes()) {
        const std::string& name = node.name;
        if (event_nodes.count(name)) {
            // skip nodes in the event
            continue;
        }

        auto allocated = is_discovered_and_allocated_node(registry, assets, name);
        if (allocated.is_err() || !allocated.value) {
            if (allocated.is_err()) {
                log_debug(fmt::format("a node check failed for '{}'. Error: {}", name, allocated.error));
            }
            // not yet provisioned or not discovered
            continue;
        }

        auto master = is_master_node(registry, name);
        if (master.is_err() || !master.value) {
            if (master.is_err()) {
                log_debug(fmt::format("a node check failed for '{}'. Error: {}", name, master.error));
            }
            continue;
        }

        out.master_found = true;
        out.master_addr = node.mgmt_address;
        out.master_name = node.cfg->tag();
        break;
    }

    if (!out.master_found && host_group == WORKER_GROUP_NAME) {
        return Result<TopologyAssignment>::Err(ErrorCode::Topology,
            "Cannot commission a worker node without existence of a master node in the cluster, "
            "make sure atleast one master node is commissioned.");
    }

    for (const auto& [name, node] : event_nodes) {
        if (!node.cfg) {
            return Result<TopologyAssignment>::Err(
                fmt::format("node '{}' has no host configuration", name));
        }
        node.cfg->set_group(host_group);
        node.cfg->set_var(ETCD_MASTER_ADDR_HOST_VAR, out.master_addr);
        node.cfg->set_var(ETCD_MASTER_NAME_HOST_VAR, out.master_name);
        out.hosts.push_back(node.cfg);
    }

    return Result<TopologyAssignment>::Ok(out);
}
