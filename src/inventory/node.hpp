#pragma once

#include <string>
#include <memory>
#include <configuration/host_config.hpp>

// Reachability of a node as last reported by its monitor
enum class MonitorState { Unknown, Discovered, Disappeared };

const char* monitor_state_name(MonitorState state);

struct Node {
    std::string name;
    std::string mgmt_address;                 // management network address
    MonitorState mon_state = MonitorState::Unknown;
    std::shared_ptr<HostConfig> cfg;          // tag, group and host vars
};
