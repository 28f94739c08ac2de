#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

struct InventoryConfig {
    std::string state_file;          // YAML asset store, "" = in-memory only
};

struct AnsibleConfig {
    std::string binary;              // ansible-playbook executable
    std::string playbook_location;   // directory holding the playbooks
    std::string configure_playbook;  // run to commission hosts
    std::string cleanup_playbook;    // run against the same hosts on failure
    std::string user;                // remote ssh user (-u)
    std::string private_key;         // ssh key (--private-key), "" = agent default
    std::string extra_variables;     // JSON/YAML map merged under request vars
};

struct LoggingConfig {
    std::string file;                // "" = <tmp>/clusterm.log
    std::string level;               // debug | info | warn | error
    std::string job_log_dir;         // per-job output logs, "" = disabled
};

class Config {
public:
    // Load from ~/.clusterm/config.yaml
    static Result<Config> load();

    // Load from an explicit path
    static Result<Config> load_file(const fs::path& path);

    // Config with every field at its default
    static Config defaults();

    // Accessors
    const InventoryConfig& inventory() const { return inventory_; }
    const AnsibleConfig& ansible() const { return ansible_; }
    const LoggingConfig& logging() const { return logging_; }

    void set_job_log_dir(const std::string& dir) { logging_.job_log_dir = dir; }
    void set_extra_variables(const std::string& vars) { ansible_.extra_variables = vars; }

public:
    Config() = default;

private:
    InventoryConfig inventory_;
    AnsibleConfig ansible_;
    LoggingConfig logging_;
};

// Helper to check if the config exists
bool config_exists();

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Create default config (no-op if one exists)
Result<void> create_default_config();
