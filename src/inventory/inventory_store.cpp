#include "inventory_store.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

InventoryStore::InventoryStore(const fs::path& store_path)
    : store_path_(store_path) {
}

Result<void> InventoryStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();

    if (store_path_.empty() || !fs::exists(store_path_)) {
        return Result<void>::Ok();
    }

    try {
        YAML::Node root = YAML::LoadFile(store_path_.string());

        if (root["assets"] && root["assets"].IsSequence()) {
            for (const auto& n : root["assets"]) {
                AssetRecord a;
                a.name = n["name"].as<std::string>("");
                if (a.name.empty()) continue;
                std::string status = n["status"].as<std::string>("unallocated");
                if (!parse_asset_status(status, a.status)) {
                    log_warn(fmt::format("inventory: asset '{}' has unknown status '{}', marking errored",
                                         a.name, status));
                    a.status = AssetStatus::Errored;
                }
                a.updated_at = n["updated_at"].as<std::string>("");
                records_[a.name] = a;
            }
        }
    } catch (const std::exception& e) {
        records_.clear();
        return Result<void>::Err(fmt::format("failed to read inventory {}: {}",
                                             store_path_.string(), e.what()));
    }

    return Result<void>::Ok();
}

Result<void> InventoryStore::save() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_unlocked();
}

Result<void> InventoryStore::save_unlocked() const {
    if (store_path_.empty()) return Result<void>::Ok();

    std::error_code ec;
    fs::create_directories(store_path_.parent_path(), ec);

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "assets" << YAML::Value << YAML::BeginSeq;
    for (const auto& [name, a] : records_) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << a.name;
        out << YAML::Key << "status" << YAML::Value << asset_status_name(a.status);
        out << YAML::Key << "updated_at" << YAML::Value << a.updated_at;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    // Write then rename so a crash never leaves a truncated inventory
    fs::path tmp = store_path_;
    tmp += ".tmp";
    {
        std::ofstream fout(tmp.string());
        fout << out.c_str();
        if (!fout) {
            return Result<void>::Err("failed to write inventory " + tmp.string());
        }
    }
    fs::rename(tmp, store_path_, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("failed to replace inventory {}: {}",
                                             store_path_.string(), ec.message()));
    }
    return Result<void>::Ok();
}

Result<void> InventoryStore::add_asset(const std::string& name, AssetStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.count(name)) {
        return Result<void>::Err(ErrorCode::Validation,
                                 fmt::format("asset '{}' already exists", name));
    }
    records_[name] = AssetRecord{name, status, now_iso()};
    return save_unlocked();
}

std::vector<AssetRecord> InventoryStore::assets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AssetRecord> out;
    for (const auto& [name, a] : records_) out.push_back(a);
    return out;
}

Result<AssetStatus> InventoryStore::status(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(name);
    if (it == records_.end()) {
        return Result<AssetStatus>::Err(ErrorCode::Validation,
                                        fmt::format("asset '{}' not found in inventory", name));
    }
    return Result<AssetStatus>::Ok(it->second.status);
}

Result<void> InventoryStore::set_unallocated(const std::string& name) {
    return transition(name, AssetStatus::Unallocated);
}

Result<void> InventoryStore::set_provisioning(const std::string& name) {
    return transition(name, AssetStatus::Provisioning);
}

Result<void> InventoryStore::set_commissioned(const std::string& name) {
    return transition(name, AssetStatus::Commissioned);
}

Result<void> InventoryStore::transition(const std::string& name, AssetStatus to) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(name);
    if (it == records_.end()) {
        return Result<void>::Err(ErrorCode::Validation,
                                 fmt::format("asset '{}' not found in inventory", name));
    }

    AssetRecord& a = it->second;
    if (!is_legal_transition(a.status, to)) {
        return Result<void>::Err(ErrorCode::StatusTransition,
            fmt::format("asset '{}' cannot move from {} to {}", name,
                        asset_status_name(a.status), asset_status_name(to)));
    }

    AssetRecord prev = a;
    a.status = to;
    a.updated_at = now_iso();

    auto saved = save_unlocked();
    if (saved.is_err()) {
        a = prev;
        return saved;
    }
    log_debug(fmt::format("inventory: asset '{}' {} -> {}", name,
                          asset_status_name(prev.status), asset_status_name(to)));
    return Result<void>::Ok();
}
