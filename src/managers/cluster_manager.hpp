#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <core/types.hpp>
#include <core/config.hpp>
#include <inventory/node_registry.hpp>
#include <inventory/asset_tracker.hpp>
#include <configuration/engine.hpp>
#include "job_gate.hpp"

class CommissionEvent;

// Owns the node registry and the job gate, and holds the inventory and
// configuration engine the workflows run against.
class ClusterManager {
public:
    ClusterManager(const Config& config, AssetTracker& assets, ConfigurationEngine& engine,
                   ActiveJobGate::IdGenerator ids = nullptr,
                   ActiveJobGate::Clock clock = nullptr);
    ~ClusterManager();

    ClusterManager(const ClusterManager&) = delete;
    ClusterManager& operator=(const ClusterManager&) = delete;

    // ── Workflows ─────────────────────────────────────────────

    // Start commissioning `names` into `host_group`. Returns once the
    // background job is launched; the outcome lands in last_job().
    Result<std::shared_ptr<CommissionEvent>> commission_nodes(const std::vector<std::string>& names,
                                                              const std::string& extra_vars,
                                                              const std::string& host_group);

    // ── Job status ────────────────────────────────────────────

    std::optional<JobInfo> active_job() const { return gate_.active_job(); }
    std::optional<JobInfo> last_job() const { return gate_.last_job(); }
    bool cancel_active_job() { return gate_.cancel_active_job(); }
    bool wait_idle(int timeout_ms = -1) { return gate_.wait_idle(timeout_ms); }

    // ── Shared by events ──────────────────────────────────────

    // Resolve node names for a mutating event. The list must be non-empty
    // and free of duplicates, and every node must be known, discovered and
    // present in the inventory.
    Result<std::map<std::string, Node>> common_event_validate(const std::vector<std::string>& names);

    Result<bool> is_discovered_and_allocated_node(const std::string& name);
    Result<bool> is_master_node(const std::string& name);

    Result<void> set_assets_status_atomic(const std::vector<std::string>& names,
                                          AssetStatus expected,
                                          const AssetStatusSetter& set,
                                          const AssetStatusSetter& rollback);

    // Failures are logged and do not stop the batch.
    std::vector<AssetUpdateOutcome> set_assets_status_best_effort(const std::vector<std::string>& names,
                                                                  const AssetStatusSetter& set);

    // ── Accessors ─────────────────────────────────────────────

    NodeRegistry& nodes() { return nodes_; }
    const NodeRegistry& nodes() const { return nodes_; }
    AssetTracker& assets() { return assets_; }
    ConfigurationEngine& engine() { return engine_; }
    ActiveJobGate& gate() { return gate_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    AssetTracker& assets_;
    ConfigurationEngine& engine_;
    NodeRegistry nodes_;
    ActiveJobGate gate_;   // last: its destructor joins a job that uses the members above
};
