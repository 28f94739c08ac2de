#pragma once

#include <string>
#include <map>
#include <vector>
#include <mutex>
#include <filesystem>
#include "asset_tracker.hpp"

namespace fs = std::filesystem;

struct AssetRecord {
    std::string name;
    AssetStatus status = AssetStatus::Unallocated;
    std::string updated_at;          // ISO timestamp of the last transition
};

// Asset tracker backed by a YAML file. An empty path keeps the
// inventory in memory only.
class InventoryStore : public AssetTracker {
public:
    explicit InventoryStore(const fs::path& store_path = {});

    // Load records from disk, replacing what is in memory. A missing file
    // is an empty inventory; an unreadable one is an error.
    Result<void> load();
    Result<void> save() const;

    // Register an asset. Fails if the name is already known.
    Result<void> add_asset(const std::string& name,
                           AssetStatus status = AssetStatus::Unallocated);

    std::vector<AssetRecord> assets() const;

    Result<AssetStatus> status(const std::string& name) override;
    Result<void> set_unallocated(const std::string& name) override;
    Result<void> set_provisioning(const std::string& name) override;
    Result<void> set_commissioned(const std::string& name) override;

    const fs::path& path() const { return store_path_; }

private:
    fs::path store_path_;  // ~/.clusterm/inventory.yaml
    std::map<std::string, AssetRecord> records_;
    mutable std::mutex mutex_;

    Result<void> transition(const std::string& name, AssetStatus to);
    Result<void> save_unlocked() const;
};
