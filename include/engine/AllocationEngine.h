#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "analytics/AllocationAnalytics.h"
#include "analytics/IdleCapitalDetector.h"
#include "common/Clock.h"
#include "core/adapters/ConfiguredOracles.h"
#include "core/contracts/IAccessPolicy.h"
#include "core/contracts/IEventJournal.h"
#include "core/contracts/IPriceOracle.h"
#include "core/contracts/IRiskOracle.h"
#include "core/contracts/IStrategyStore.h"
#include "core/contracts/IYieldOracle.h"
#include "core/orchestration/AllocationCycleCoordinator.h"
#include "engine/EngineConfig.h"
#include "execution/RateLimiter.h"
#include "execution/ReallocationExecutor.h"
#include "ledger/AssetLockTable.h"
#include "ledger/CapitalLedger.h"
#include "ledger/VenueRegistry.h"
#include "strategy/StrategyManager.h"

namespace capflow {
namespace engine {

// Collaborators the embedding process may supply. Anything left null is
// built from EngineConfig (configured oracles, venue-backed yields, system
// clock, allow-all access, journal/store at the configured paths).
struct EngineDependencies {
    std::shared_ptr<IClock> clock;
    std::shared_ptr<core::IYieldOracle> yield_oracle;
    std::shared_ptr<core::IRiskOracle> risk_oracle;
    std::shared_ptr<core::IPriceOracle> price_oracle;
    std::shared_ptr<core::IAccessPolicy> access_policy;
    std::shared_ptr<core::IEventJournal> journal;
    std::shared_ptr<core::IStrategyStore> strategy_store;
};

// Allocation engine: operator and keeper surface over the ledger, detector,
// scorer, executor and strategy book. Every public operation checks the
// caller's capability first and answers UNAUTHORIZED otherwise. While paused,
// deposits, withdrawals and reallocation answer PAUSED; emergency
// reallocation stays available.
class AllocationEngine {
public:
    AllocationEngine(const EngineConfig& config, EngineDependencies deps = {});
    ~AllocationEngine();

    // ===== Operator surface =====

    OperationResult registerVenue(const std::string& caller, ledger::VenueDescriptor venue);
    OperationResult registerAsset(const std::string& caller, const Asset& asset,
                                  const std::vector<VenueWeight>& target_weights);
    OperationResult setTargetWeights(const std::string& caller, const Asset& asset,
                                     const std::vector<VenueWeight>& target_weights);
    OperationResult setRateLimit(const std::string& caller, const Asset& asset,
                                 long long cooldown_ms, Bps max_reallocation_bps_per_cycle);
    OperationResult setVenueFrozen(const std::string& caller, const VenueId& venue, bool frozen);
    OperationResult reconcile(const std::string& caller, const Asset& asset,
                              const std::map<VenueId, Amount>& balances);

    strategy::CreateStrategyResult createStrategy(const std::string& caller, core::ReallocationStrategy draft);
    OperationResult activateStrategy(const std::string& caller, const std::string& strategy_id);
    OperationResult deactivateStrategy(const std::string& caller, const std::string& strategy_id);

    OperationResult pause(const std::string& caller);
    OperationResult unpause(const std::string& caller);
    bool isPaused() const { return paused_; }

    execution::EmergencyReport emergencyReallocate(const std::string& caller, const Asset& asset,
                                                   const VenueId& from_venue, Amount amount,
                                                   const VenueId& to_safe_venue);

    // ===== Depositor surface =====

    ledger::DepositResult deposit(const std::string& caller, const Asset& asset, Amount amount);
    ledger::WithdrawResult withdraw(const std::string& caller, const Asset& asset, Amount amount,
                                    const std::vector<VenueId>& preferred_order = {});

    // ===== Keeper surface =====

    analytics::ScanReport scan(const std::string& caller, const Asset& asset);
    core::CycleReport runCycle(const std::string& caller, const Asset& asset);
    std::vector<core::CycleReport> runDailyRebalance(const std::string& caller, const std::vector<Asset>& assets);
    execution::StrategyExecutionReport executeStrategy(const std::string& caller, const std::string& strategy_id);
    core::AdaptReport adaptStrategy(const std::string& caller, const std::string& strategy_id);

    // Runs every active strategy whose execution frequency has elapsed.
    std::vector<execution::StrategyExecutionReport> runDueStrategies(const std::string& caller);

    // ===== Engine control (keeper loop) =====

    bool start(const std::string& caller, int max_cycles = 0);
    void stop();
    bool isRunning() const { return running_; }

    // ===== Read side =====

    analytics::AssetAnalytics analytics(const Asset& asset) const;
    // Journal rows for one asset; empty when no journal is configured.
    std::vector<core::JournalEvent> auditTrail(const Asset& asset, std::uint64_t seq_inclusive = 0) const;
    const ledger::CapitalLedger& ledger() const { return *ledger_; }
    const execution::ReallocationExecutor& executor() const { return *executor_; }
    const strategy::StrategyManager& strategies() const { return *strategies_; }
    const analytics::IdleCapitalDetector& detector() const { return *detector_; }
    const EngineConfig& config() const { return config_; }

private:
    bool allowed(const std::string& caller, core::Capability capability, const char* operation) const;
    void bootstrapPaperVenues();
    void run(std::string caller, int max_cycles);
    void runKeeperCycle(const std::string& caller, int cycle);
    void journalPauseChange(const std::string& caller, bool paused);

    EngineConfig config_;

    std::shared_ptr<IClock> clock_;
    std::shared_ptr<core::ConfiguredRiskOracle> configured_risks_;
    std::shared_ptr<core::ConfiguredPriceOracle> configured_prices_;
    std::shared_ptr<core::IYieldOracle> yields_;
    std::shared_ptr<core::IRiskOracle> risks_;
    std::shared_ptr<core::IPriceOracle> prices_;
    std::shared_ptr<core::IAccessPolicy> access_;
    std::shared_ptr<core::IEventJournal> journal_;
    std::shared_ptr<core::IStrategyStore> store_;

    std::shared_ptr<ledger::VenueRegistry> registry_;
    std::shared_ptr<ledger::AssetLockTable> locks_;
    std::shared_ptr<ledger::CapitalLedger> ledger_;
    std::shared_ptr<analytics::IdleCapitalDetector> detector_;
    std::shared_ptr<strategy::StrategyManager> strategies_;
    std::shared_ptr<execution::RateLimiter> limiter_;
    std::shared_ptr<execution::ReallocationExecutor> executor_;
    std::shared_ptr<core::AllocationCycleCoordinator> coordinator_;
    std::unique_ptr<analytics::AllocationAnalytics> analytics_;

    std::atomic<bool> running_{false};
    std::atomic<bool> paused_{false};
    std::unique_ptr<std::thread> worker_thread_;
};

} // namespace engine
} // namespace capflow
