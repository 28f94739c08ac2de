#pragma once

#include <string>

// Allocation lifecycle of a node's asset record
enum class AssetStatus { Unallocated, Provisioning, Commissioned, Errored };

const char* asset_status_name(AssetStatus status);

// Parse "unallocated" / "provisioning" / "commissioned" / "errored"
bool parse_asset_status(const std::string& name, AssetStatus& out);

// Legal moves: Unallocated → Provisioning → Commissioned, and
// Provisioning → Unallocated when provisioning fails.
bool is_legal_transition(AssetStatus from, AssetStatus to);
