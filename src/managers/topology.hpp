#pragma once

#include <string>
#include <map>
#include <core/types.hpp>
#include <configuration/host_config.hpp>
#include <inventory/node_registry.hpp>
#include <inventory/asset_tracker.hpp>

// Outcome of placing a commission event's nodes in the cluster topology
struct TopologyAssignment {
    std::string host_group;
    bool master_found = false;
    std::string master_addr;       // "" when this event creates the first master
    std::string master_name;
    HostList hosts;                // one config per event node, vars applied
};

bool is_valid_host_group(const std::string& group);

// Node is monitored as discovered and its asset is commissioned.
Result<bool> is_discovered_and_allocated_node(const NodeRegistry& registry,
                                              AssetTracker& assets,
                                              const std::string& name);

// Node's host config places it in the master group.
Result<bool> is_master_node(const NodeRegistry& registry, const std::string& name);

// Pick the group and master identity for `event_nodes` and write them into
// each node's host config.
//
// The registry is scanned (event nodes excluded) for a node that is both
// discovered+allocated and in the master group; the first one found
// supplies etcd_master_addr / etcd_master_name. Query errors on a
// candidate are logged and treated as "not a master". Without a master,
// a worker request fails with ErrorCode::Topology while a master request
// proceeds with empty master vars. When several masters exist, which one
// is chosen is unspecified.
Result<TopologyAssignment> assign_topology(const NodeRegistry& registry,
                                           AssetTracker& assets,
                                           const std::map<std::string, Node>& event_nodes,
                                           const std::string& host_group);
