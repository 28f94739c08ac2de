#include "ansible_host.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

AnsibleHost::AnsibleHost(const std::string& tag, const std::string& address,
                         const std::string& group,
                         const std::map<std::string, std::string>& vars)
    : tag_(tag), address_(address), group_(group), vars_(vars) {
}

std::string AnsibleHost::tag() const {
    return tag_;
}

std::string AnsibleHost::address() const {
    return address_;
}

std::string AnsibleHost::group() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return group_;
}

std::map<std::string, std::string> AnsibleHost::vars() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return vars_;
}

void AnsibleHost::set_group(const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex_);
    group_ = group;
}

void AnsibleHost::set_var(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    vars_[key] = value;
}

// Quote a value only when ansible's key=value parser would split it
static std::string inventory_value(const std::string& value) {
    if (!value.empty() && value.find_first_of(" \t\"'=#") == std::string::npos) {
        return value;
    }
    std::string escaped;
    for (char c : value) {
        if (c == '"' || c == '\\') escaped += '\\';
        escaped += c;
    }
    return "\"" + escaped + "\"";
}

std::string render_inventory(const HostList& hosts) {
    std::map<std::string, std::vector<std::string>> sections;
    for (const auto& h : hosts) {
        std::string line = h->tag();
        if (!h->address().empty()) {
            line += fmt::format(" {}={}", ANSIBLE_HOST_VAR, inventory_value(h->address()));
        }
        for (const auto& [key, val] : h->vars()) {
            if (key == ANSIBLE_HOST_VAR) continue;
            line += fmt::format(" {}={}", key, inventory_value(val));
        }
        std::string group = h->group().empty() ? "ungrouped" : h->group();
        sections[group].push_back(line);
    }

    std::string out;
    for (const auto& [group, lines] : sections) {
        out += fmt::format("[{}]\n", group);
        for (const auto& l : lines) out += l + "\n";
        out += "\n";
    }
    return out;
}
