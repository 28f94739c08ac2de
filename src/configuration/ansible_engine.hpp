#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include "engine.hpp"

// Runs playbooks with ansible-playbook against a generated inventory
class AnsibleEngine : public ConfigurationEngine {
public:
    explicit AnsibleEngine(const AnsibleConfig& config);

    EngineRun configure(const HostList& hosts, const std::string& extra_vars) override;
    EngineRun cleanup(const HostList& hosts, const std::string& extra_vars) override;

    // Command line for one playbook run (without the program name)
    std::vector<std::string> playbook_args(const std::string& inventory_path,
                                           const std::string& playbook,
                                           const std::string& merged_vars) const;

private:
    AnsibleConfig config_;

    EngineRun run_playbook(const std::string& playbook, const HostList& hosts,
                           const std::string& extra_vars);
    std::string playbook_path(const std::string& playbook) const;
};
