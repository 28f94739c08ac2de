#pragma once

#include <string>
#include <vector>
#include <functional>
#include <core/types.hpp>
#include "asset.hpp"

// Inventory backend holding the asset status of every node
class AssetTracker {
public:
    virtual ~AssetTracker() = default;

    virtual Result<AssetStatus> status(const std::string& name) = 0;

    virtual Result<void> set_unallocated(const std::string& name) = 0;
    virtual Result<void> set_provisioning(const std::string& name) = 0;
    virtual Result<void> set_commissioned(const std::string& name) = 0;
};

using AssetStatusSetter = std::function<Result<void>(const std::string&)>;

struct AssetUpdateOutcome {
    std::string name;
    Result<void> result;
};

// Move every asset in `names` with `set`, all or nothing. Each asset must
// currently be in `expected`; otherwise nothing is touched. If `set` fails
// part way, the assets already moved are put back with `rollback`.
Result<void> set_assets_status_atomic(AssetTracker& tracker,
                                      const std::vector<std::string>& names,
                                      AssetStatus expected,
                                      const AssetStatusSetter& set,
                                      const AssetStatusSetter& rollback);

// Apply `set` to every asset independently; one failure does not stop the
// batch. Returns one outcome per name, in order.
std::vector<AssetUpdateOutcome> set_assets_status_best_effort(const std::vector<std::string>& names,
                                                              const AssetStatusSetter& set);
