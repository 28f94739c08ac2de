#include "node_registry.hpp"
#include <fmt/format.h>

const char* monitor_state_name(MonitorState state) {
    switch (state) {
        case MonitorState::Unknown:     return "unknown";
        case MonitorState::Discovered:  return "discovered";
        case MonitorState::Disappeared: return "disappeared";
    }
    return "unknown";
}

Result<void> NodeRegistry::upsert(Node node) {
    if (node.name.empty()) {
        return Result<void>::Err(ErrorCode::Validation, "node name is empty");
    }
    if (!node.cfg) {
        return Result<void>::Err(ErrorCode::Validation,
                                 fmt::format("node '{}' has no host configuration", node.name));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string name = node.name;
    nodes_[name] = std::move(node);
    return Result<void>::Ok();
}

Result<void> NodeRegistry::set_monitor_state(const std::string& name, MonitorState state,
                                             const std::string& mgmt_address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(name);
    if (it == nodes_.end()) {
        return Result<void>::Err(ErrorCode::Validation, fmt::format("node '{}' doesn't exist", name));
    }
    it->second.mon_state = state;
    if (!mgmt_address.empty()) it->second.mgmt_address = mgmt_address;
    return Result<void>::Ok();
}

std::optional<Node> NodeRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(name);
    if (it == nodes_.end()) return std::nullopt;
    return it->second;
}

std::vector<Node> NodeRegistry::nodes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Node> out;
    out.reserve(nodes_.size());
    for (const auto& [name, node] : nodes_) {
        out.push_back(node);
    }
    return out;
}

size_t NodeRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.size();
}
