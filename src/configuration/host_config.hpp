#pragma once

#include <string>
#include <map>
#include <memory>
#include <vector>

// The view of a node's configuration record that topology assignment and
// the configuration engine need. Concrete records live behind it.
class HostConfig {
public:
    virtual ~HostConfig() = default;

    virtual std::string tag() const = 0;
    virtual std::string address() const = 0;
    virtual std::string group() const = 0;
    virtual std::map<std::string, std::string> vars() const = 0;

    virtual void set_group(const std::string& group) = 0;
    virtual void set_var(const std::string& key, const std::string& value) = 0;
};

using HostList = std::vector<std::shared_ptr<HostConfig>>;
