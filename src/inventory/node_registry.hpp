#pragma once

#include <string>
#include <map>
#include <vector>
#include <mutex>
#include <optional>
#include <core/types.hpp>
#include "node.hpp"

// Nodes known to the manager, keyed by name. Safe to use from the monitor
// feed and the job worker at the same time: readers get copies, and a
// copy shares its host config with the registry entry.
class NodeRegistry {
public:
    // Register or replace a node. The node must carry a name and a config.
    Result<void> upsert(Node node);

    // Update the monitor view of a known node
    Result<void> set_monitor_state(const std::string& name, MonitorState state,
                                   const std::string& mgmt_address = "");

    std::optional<Node> find(const std::string& name) const;

    // Snapshot of every node. Order is an implementation detail.
    std::vector<Node> nodes() const;
    size_t size() const;

private:
    std::map<std::string, Node> nodes_;
    mutable std::mutex mutex_;
};
