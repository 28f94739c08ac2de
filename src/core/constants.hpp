#pragma once

// ── Host groups ─────────────────────────────────────────────
// Topology roles a commissioned node can take.
constexpr const char* MASTER_GROUP_NAME = "service-master";
constexpr const char* WORKER_GROUP_NAME = "service-worker";

// ── Host variables ──────────────────────────────────────────
// Identity of the existing control-plane node, handed to every new node.
constexpr const char* ETCD_MASTER_ADDR_HOST_VAR = "etcd_master_addr";
constexpr const char* ETCD_MASTER_NAME_HOST_VAR = "etcd_master_name";
constexpr const char* ANSIBLE_HOST_VAR          = "ansible_host";

// ── Timeouts ────────────────────────────────────────────────
constexpr int STREAM_POLL_MS             = 100;   // Output read timeout per loop iteration
constexpr int ENGINE_TERM_GRACE_MS       = 2000;  // SIGTERM → SIGKILL grace period
constexpr int OUTPUT_DRAIN_MAX_MS        = 2000;  // Max time to drain output after exit

// ── Buffer sizes ────────────────────────────────────────────
constexpr int PIPE_READ_BUF_SIZE         = 4096;
constexpr int MAX_JOB_LOG_LINES          = 1000;  // Lines kept in memory per job

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_ANSIBLE_BINARY      = "ansible-playbook";
constexpr const char* DEFAULT_PLAYBOOK_LOCATION   = "/etc/clusterm/ansible";
constexpr const char* DEFAULT_CONFIGURE_PLAYBOOK  = "site.yml";
constexpr const char* DEFAULT_CLEANUP_PLAYBOOK    = "cleanup.yml";
constexpr const char* DEFAULT_ANSIBLE_USER        = "clusterm";
constexpr const char* DEFAULT_EXTRA_VARIABLES     = "{}";
constexpr const char* DEFAULT_LOG_LEVEL           = "info";
