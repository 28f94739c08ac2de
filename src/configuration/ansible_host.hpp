#pragma once

#include <string>
#include <map>
#include <mutex>
#include "host_config.hpp"

// Host record as rendered into an Ansible inventory
class AnsibleHost : public HostConfig {
public:
    AnsibleHost(const std::string& tag, const std::string& address,
                const std::string& group = "",
                const std::map<std::string, std::string>& vars = {});

    std::string tag() const override;
    std::string address() const override;
    std::string group() const override;
    std::map<std::string, std::string> vars() const override;

    void set_group(const std::string& group) override;
    void set_var(const std::string& key, const std::string& value) override;

private:
    std::string tag_;
    std::string address_;
    std::string group_;
    std::map<std::string, std::string> vars_;
    mutable std::mutex mutex_;
};

// Render hosts as an INI inventory:
//
//   [service-worker]
//   node1 ansible_host=10.0.0.7 etcd_master_addr=10.0.0.5 etcd_master_name=master-1
//
// Hosts without a group go under [ungrouped].
std::string render_inventory(const HostList& hosts);
