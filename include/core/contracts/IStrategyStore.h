#pragma once

#include <optional>
#include <vector>

#include "core/model/AllocationTypes.h"

namespace capflow {
namespace core {

struct StrategyStoreSnapshot {
    int schema_version = 1;
    long long saved_at_ms = 0;
    std::vector<ReallocationStrategy> strategies;
};

class IStrategyStore {
public:
    virtual ~IStrategyStore() = default;

    virtual std::optional<StrategyStoreSnapshot> load() = 0;
    virtual bool save(const StrategyStoreSnapshot& snapshot) = 0;
};

} // namespace core
} // namespace capflow
