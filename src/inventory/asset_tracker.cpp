#include "asset_tracker.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

Result<void> set_assets_status_atomic(AssetTracker& tracker,
                                      const std::vector<std::string>& names,
                                      AssetStatus expected,
                                      const AssetStatusSetter& set,
                                      const AssetStatusSetter& rollback) {
    for (const auto& name : names) {
        auto current = tracker.status(name);
        if (current.is_err()) {
            return forward_error<void>(current);
        }
        if (current.value != expected) {
            return Result<void>::Err(ErrorCode::StatusTransition,
                fmt::format("asset '{}' is {}, expected {}", name,
                            asset_status_name(current.value), asset_status_name(expected)));
        }
    }

    std::vector<std::string> applied;
    for (const auto& name : names) {
        auto r = set(name);
        if (r.is_ok()) {
            applied.push_back(name);
            continue;
        }

        for (auto it = applied.rbegin(); it != applied.rend(); ++it) {
            auto rb = rollback(*it);
            if (rb.is_err()) {
                log_error(fmt::format("failed to roll back asset '{}'. Error: {}", *it, rb.error));
            }
        }
        if (r.code == ErrorCode::Internal) r.code = ErrorCode::StatusTransition;
        return r;
    }
    return Result<void>::Ok();
}

std::vector<AssetUpdateOutcome> set_assets_status_best_effort(const std::vector<std::string>& names,
                                                              const AssetStatusSetter& set) {
    std::vector<AssetUpdateOutcome> outcomes;
    outcomes.reserve(names.size());
    for (const auto& name : names) {
        outcomes.push_back({name, set(name)});
    }
    return outcomes;
}
