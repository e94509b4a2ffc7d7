#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/Clock.h"
#include "common/Errors.h"
#include "core/contracts/IStrategyStore.h"
#include "core/model/AllocationTypes.h"
#include "engine/EngineConfig.h"
#include "ledger/CapitalLedger.h"

namespace capflow {
namespace strategy {

struct CreateStrategyResult {
    OperationResult status;
    std::string strategy_id;
};

// Book of reallocation strategies. Strategies are only ever deactivated
// explicitly; every change is written through to the store when one is set.
class StrategyManager {
public:
    StrategyManager(
        std::shared_ptr<ledger::CapitalLedger> ledger,
        std::shared_ptr<IClock> clock,
        engine::StrategyDefaults defaults,
        std::shared_ptr<core::IStrategyStore> store = nullptr
    );

    CreateStrategyResult createStrategy(core::ReallocationStrategy draft);
    OperationResult activate(const std::string& id);
    OperationResult deactivate(const std::string& id);

    std::optional<core::ReallocationStrategy> get(const std::string& id) const;
    std::vector<core::ReallocationStrategy> list() const;
    std::vector<core::ReallocationStrategy> activeFor(const Asset& asset) const;

    OperationResult recordExecution(const std::string& id, long long executed_at_ms);
    OperationResult updateTargetWeights(const std::string& id, const std::vector<Bps>& weights);

    // Reloads strategies saved by a previous process. Returns the number restored.
    std::size_t restore();

    const engine::StrategyDefaults& defaults() const { return defaults_; }

private:
    void persistLocked();

    std::shared_ptr<ledger::CapitalLedger> ledger_;
    std::shared_ptr<IClock> clock_;
    engine::StrategyDefaults defaults_;
    std::shared_ptr<core::IStrategyStore> store_;

    mutable std::mutex mutex_;
    std::map<std::string, core::ReallocationStrategy> strategies_;
    std::uint64_t next_id_ = 1;
};

} // namespace strategy
} // namespace capflow
