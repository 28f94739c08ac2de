#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include "yaml_json.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / ".clusterm";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# clusterm configuration

inventory:
  state_file: "~/.clusterm/inventory.yaml"

ansible:
  binary: "ansible-playbook"
  playbook_location: "/etc/clusterm/ansible"
  configure_playbook: "site.yml"
  cleanup_playbook: "cleanup.yml"
  user: "clusterm"
  private_key: "~/.ssh/id_rsa"
  # Merged under the extra variables of each request
  extra_variables: "{}"

logging:
  file: ""                 # default: <tmp>/clusterm.log
  level: "info"
  job_log_dir: "~/.clusterm/logs"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

static InventoryConfig parse_inventory_config(const YAML::Node& node) {
    InventoryConfig inv;
    inv.state_file = expand_home(node["state_file"].as<std::string>(""));
    return inv;
}

static AnsibleConfig parse_ansible_config(const YAML::Node& node) {
    AnsibleConfig a;
    a.binary = node["binary"].as<std::string>(DEFAULT_ANSIBLE_BINARY);
    a.playbook_location = expand_home(
        node["playbook_location"].as<std::string>(DEFAULT_PLAYBOOK_LOCATION));
    a.configure_playbook = node["configure_playbook"].as<std::string>(DEFAULT_CONFIGURE_PLAYBOOK);
    a.cleanup_playbook = node["cleanup_playbook"].as<std::string>(DEFAULT_CLEANUP_PLAYBOOK);
    a.user = node["user"].as<std::string>(DEFAULT_ANSIBLE_USER);
    a.private_key = expand_home(node["private_key"].as<std::string>(""));

    // Accept either a quoted JSON string or an inline YAML map
    const auto& ev = node["extra_variables"];
    if (ev && ev.IsMap()) {
        a.extra_variables = yaml_to_json(ev);
    } else {
        a.extra_variables = ev.as<std::string>(DEFAULT_EXTRA_VARIABLES);
    }
    return a;
}

static LoggingConfig parse_logging_config(const YAML::Node& node) {
    LoggingConfig l;
    l.file = expand_home(node["file"].as<std::string>(""));
    l.level = node["level"].as<std::string>(DEFAULT_LOG_LEVEL);
    l.job_log_dir = expand_home(node["job_log_dir"].as<std::string>(""));
    return l;
}

Config Config::defaults() {
    Config config;
    config.inventory_ = parse_inventory_config(YAML::Node());
    config.ansible_ = parse_ansible_config(YAML::Node());
    config.logging_ = parse_logging_config(YAML::Node());
    return config;
}

Result<Config> Config::load() {
    if (!config_exists()) {
        return Result<Config>::Err("Config not found at " + get_config_path().string());
    }
    return load_file(get_config_path());
}

Result<Config> Config::load_file(const fs::path& path) {
    Config config;
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err("Config " + path.string() + " is not a YAML map");
        }

        config.inventory_ = parse_inventory_config(root["inventory"] ? root["inventory"] : YAML::Node());
        config.ansible_ = parse_ansible_config(root["ansible"] ? root["ansible"] : YAML::Node());
        config.logging_ = parse_logging_config(root["logging"] ? root["logging"] : YAML::Node());
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }

    if (config.ansible_.configure_playbook.empty() || config.ansible_.cleanup_playbook.empty()) {
        return Result<Config>::Err("ansible.configure_playbook and ansible.cleanup_playbook must be set");
    }

    return Result<Config>::Ok(config);
}

