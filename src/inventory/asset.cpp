#include "asset.hpp"

const char* asset_status_name(AssetStatus status) {
    switch (status) {
        case AssetStatus::Unallocated:  return "unallocated";
        case AssetStatus::Provisioning: return "provisioning";
        case AssetStatus::Commissioned: return "commissioned";
        case AssetStatus::Errored:      return "errored";
    }
    return "unknown";
}

bool parse_asset_status(const std::string& name, AssetStatus& out) {
    if (name == "unallocated")  { out = AssetStatus::Unallocated;  return true; }
    if (name == "provisioning") { out = AssetStatus::Provisioning; return true; }
    if (name == "commissioned") { out = AssetStatus::Commissioned; return true; }
    if (name == "errored")      { out = AssetStatus::Errored;      return true; }
    return false;
}

bool is_legal_transition(AssetStatus from, AssetStatus to) {
    switch (from) {
        case AssetStatus::Unallocated:
            return to == AssetStatus::Provisioning;
        case AssetStatus::Provisioning:
            return to == AssetStatus::Commissioned || to == AssetStatus::Unallocated;
        default:
            return false;
    }
}
