#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <atomic>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <configuration/host_config.hpp>
#include <inventory/node.hpp>
#include "job_gate.hpp"

class ClusterManager;

enum class CommissionState {
    Created,
    Validating,
    PreparingInventory,
    SettingProvisioning,
    Running,
    Committing,
    RollingBack,
    Done,
};

const char* commission_state_name(CommissionState state);

// Brings a set of discovered nodes into the cluster as masters or workers.
//
// process() claims the manager's job gate, validates the request, assigns
// topology, and moves every node to provisioning before handing the
// configuration run to the gate's worker thread. Any failure up to that
// point releases the gate and leaves the inventory untouched. When the run
// ends the nodes become commissioned, or unallocated if it failed.
class CommissionEvent : public std::enable_shared_from_this<CommissionEvent> {
    // Restricts construction to create()
    struct Token {};

public:
    static std::shared_ptr<CommissionEvent> create(ClusterManager& mgr,
                                                   const std::vector<std::string>& node_names,
                                                   const std::string& extra_vars,
                                                   const std::string& host_group);

    Result<void> process();

    // "commissionEvent: [node1, node2]"
    std::string to_string() const;

    CommissionState state() const { return state_.load(); }
    const std::vector<std::string>& node_names() const { return node_names_; }
    const std::string& host_group() const { return host_group_; }
    const std::string& extra_vars() const { return extra_vars_; }

    // Host configs handed to the engine; filled once the inventory is prepared
    const HostList& hosts() const { return hosts_; }

    CommissionEvent(Token, ClusterManager& mgr, const std::vector<std::string>& node_names,
                    const std::string& extra_vars, const std::string& host_group);

private:

    ClusterManager& mgr_;
    std::vector<std::string> node_names_;
    std::string extra_vars_;
    std::string host_group_;

    std::map<std::string, Node> enodes_;
    HostList hosts_;
    std::atomic<CommissionState> state_{CommissionState::Created};

    Result<void> process_acquired();
    Result<void> event_validate();
    Result<void> prepare_inventory();
    Result<void> run(const CancelToken& cancel, const StatusCallback& log);
    void on_job_done(JobStatus status, const Result<void>& result);
};
