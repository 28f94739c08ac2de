#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <core/config.hpp>
#include <inventory/inventory_store.hpp>
#include <configuration/ansible_engine.hpp>
#include "cluster_manager.hpp"
#include "commission_event.hpp"

// Pure data for frontends, no manager types needed.
struct NodeSummary {
    std::string name;
    std::string mgmt_address;
    std::string monitor_state;   // "discovered", "disappeared", "unknown"
    std::string asset_status;    // "unallocated", ... or "-" if not in inventory
    std::string group;           // host group, "" until assigned
};

// Headless service facade: wires the config, the inventory store, the
// Ansible engine and the cluster manager together.
class ClustermService {
public:
    ClustermService();
    ~ClustermService();

    // ── Lifecycle ─────────────────────────────────────────────

    // Load config (~/.clusterm/config.yaml unless a path is given), set up
    // logging, load the inventory and build the managers. Default extra
    // variables that are not a map fail with ErrorCode::Configuration.
    Result<void> start(const std::string& config_path = "", StatusCallback cb = nullptr);

    // Cancel any active job, wait for it, and tear down the managers.
    void stop();

    bool is_started() const { return manager_ != nullptr; }

    // ── Nodes ─────────────────────────────────────────────────

    // Register a node reported by the monitor. Nodes new to the inventory
    // are added as unallocated. A node already registered keeps its group
    // and host vars; only its monitor state and address are refreshed.
    Result<void> add_node(const std::string& name, const std::string& mgmt_address,
                          MonitorState state = MonitorState::Discovered);

    Result<void> set_monitor_state(const std::string& name, MonitorState state);

    std::vector<NodeSummary> list_nodes();

    // ── Jobs ──────────────────────────────────────────────────

    Result<std::shared_ptr<CommissionEvent>> commission_nodes(const std::vector<std::string>& names,
                                                              const std::string& extra_vars,
                                                              const std::string& host_group);

    std::optional<JobInfo> active_job() const;
    std::optional<JobInfo> last_job() const;
    Result<void> cancel_job();
    bool wait_idle(int timeout_ms = -1);

    // ── Accessors ─────────────────────────────────────────────

    const Config& config() const { return config_.value(); }
    ClusterManager* manager() { return manager_.get(); }
    InventoryStore* inventory() { return inventory_.get(); }

private:
    std::optional<Config> config_;
    std::unique_ptr<InventoryStore> inventory_;
    std::unique_ptr<AnsibleEngine> engine_;
    std::unique_ptr<ClusterManager> manager_;
};
