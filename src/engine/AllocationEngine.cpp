#include "engine/AllocationEngine.h"
#include "common/Logger.h"
#include "core/adapters/RoleAccessPolicy.h"
#include "core/adapters/SimulatedVenueAdapter.h"
#include "core/adapters/VenueYieldOracle.h"
#include "core/state/EventJournalJsonl.h"
#include "core/state/StrategyStoreJson.h"

#include <algorithm>
#include <chrono>

namespace capflow {
namespace engine {

namespace {
const char* capabilityToString(core::Capability capability) {
    switch (capability) {
        case core::Capability::DEPOSIT: return "DEPOSIT";
        case core::Capability::WITHDRAW: return "WITHDRAW";
        case core::Capability::CONFIGURE: return "CONFIGURE";
        case core::Capability::MANAGE_STRATEGY: return "MANAGE_STRATEGY";
        case core::Capability::KEEPER: return "KEEPER";
        case core::Capability::EMERGENCY: return "EMERGENCY";
        case core::Capability::RECONCILE: return "RECONCILE";
    }
    return "UNKNOWN";
}

OperationResult unauthorized(const std::string& caller, const char* operation) {
    return OperationResult::failure(ErrorCode::UNAUTHORIZED, caller + " may not call " + operation);
}

OperationResult pausedFailure(const char* operation) {
    return OperationResult::failure(ErrorCode::PAUSED, std::string("engine paused: ") + operation);
}
}

AllocationEngine::AllocationEngine(const EngineConfig& config, EngineDependencies deps)
    : config_(config)
{
    LOG_INFO("AllocationEngine init: mode={}, venues={}, assets={}",
             config_.mode == EngineMode::LIVE ? "LIVE" : "PAPER", config_.venues.size(), config_.assets.size());

    clock_ = deps.clock ? deps.clock : std::make_shared<SystemClock>();
    registry_ = std::make_shared<ledger::VenueRegistry>();
    locks_ = std::make_shared<ledger::AssetLockTable>();

    configured_risks_ = std::make_shared<core::ConfiguredRiskOracle>();
    configured_prices_ = std::make_shared<core::ConfiguredPriceOracle>();
    yields_ = deps.yield_oracle ? deps.yield_oracle : std::make_shared<core::VenueYieldOracle>(registry_);
    risks_ = deps.risk_oracle ? deps.risk_oracle : configured_risks_;
    prices_ = deps.price_oracle ? deps.price_oracle : configured_prices_;
    access_ = deps.access_policy ? deps.access_policy : std::make_shared<core::RoleAccessPolicy>(true);
    journal_ = deps.journal;
    if (!journal_ && !config_.journal_path.empty()) {
        journal_ = std::make_shared<core::EventJournalJsonl>(config_.journal_path);
    }
    store_ = deps.strategy_store;
    if (!store_ && !config_.strategy_store_path.empty()) {
        store_ = std::make_shared<core::StrategyStoreJson>(config_.strategy_store_path);
    }

    ledger_ = std::make_shared<ledger::CapitalLedger>(registry_, locks_, clock_, journal_);
    detector_ = std::make_shared<analytics::IdleCapitalDetector>(ledger_, yields_, clock_, config_.detector, journal_);
    strategies_ = std::make_shared<strategy::StrategyManager>(ledger_, clock_, config_.strategy, store_);
    limiter_ = std::make_shared<execution::RateLimiter>(config_.rate_limit.cooldown_ms,
                                                        config_.rate_limit.max_reallocation_bps_per_cycle);
    executor_ = std::make_shared<execution::ReallocationExecutor>(
        ledger_, detector_, strategies_, limiter_, yields_, risks_, clock_,
        config_.scorer.opportunity_ttl_ms, journal_, config_.scorer.opportunity_retention);
    coordinator_ = std::make_shared<core::AllocationCycleCoordinator>(
        ledger_, detector_, executor_, strategies_, yields_, risks_, clock_, config_.scorer, journal_);
    analytics_ = std::make_unique<analytics::AllocationAnalytics>(ledger_, executor_, yields_, prices_);

    if (config_.mode == EngineMode::PAPER) {
        bootstrapPaperVenues();
    } else if (!config_.venues.empty()) {
        LOG_WARN("LIVE mode ignores configured paper venues; register live adapters via registerVenue()");
    }

    const auto restored = strategies_->restore();
    if (restored > 0) {
        LOG_INFO("Resumed {} persisted strategies", restored);
    }
}

AllocationEngine::~AllocationEngine() {
    stop();
}

void AllocationEngine::bootstrapPaperVenues() {
    for (const auto& v : config_.venues) {
        ledger::VenueDescriptor descriptor;
        descriptor.id = v.id;
        descriptor.kind = venueKindFromString(v.kind);
        descriptor.adapter = std::make_shared<core::SimulatedVenueAdapter>(
            v.id, v.yield_bps, v.utilization_bps, v.liquidity_depth);
        descriptor.fixed_execution_cost = v.fixed_execution_cost;
        descriptor.execution_cost_bps = v.execution_cost_bps;
        descriptor.max_capacity = v.max_capacity;
        auto r = registry_->registerVenue(std::move(descriptor));
        if (!r.ok()) {
            LOG_ERROR("Paper venue skipped: {} ({})", v.id, r.reason);
            continue;
        }
        configured_risks_->setVenueRisk(v.id, v.risk_score);
    }

    for (const auto& a : config_.assets) {
        auto r = ledger_->registerAsset(a.asset, a.target_weights);
        if (!r.ok()) {
            LOG_ERROR("Paper asset skipped: {} ({})", a.asset, r.reason);
            continue;
        }
        configured_prices_->setPrice(a.asset, a.price);
        if (a.initial_deposit > 0) {
            auto deposited = ledger_->deposit(a.asset, a.initial_deposit);
            if (!deposited.status.ok()) {
                LOG_ERROR("Paper seed deposit failed: {} ({})", a.asset, deposited.status.reason);
            }
        }
    }
}

bool AllocationEngine::allowed(const std::string& caller, core::Capability capability, const char* operation) const {
    if (access_->isAllowed(caller, capability)) {
        return true;
    }
    LOG_WARN("Unauthorized: caller={}, operation={}, capability={}", caller, operation, capabilityToString(capability));
    return false;
}

// ===== Operator surface =====

OperationResult AllocationEngine::registerVenue(const std::string& caller, ledger::VenueDescriptor venue) {
    if (!allowed(caller, core::Capability::CONFIGURE, "registerVenue")) {
        return unauthorized(caller, "registerVenue");
    }
    return registry_->registerVenue(std::move(venue));
}

OperationResult AllocationEngine::registerAsset(const std::string& caller, const Asset& asset,
                                                const std::vector<VenueWeight>& target_weights) {
    if (!allowed(caller, core::Capability::CONFIGURE, "registerAsset")) {
        return unauthorized(caller, "registerAsset");
    }
    return ledger_->registerAsset(asset, target_weights);
}

OperationResult AllocationEngine::setTargetWeights(const std::string& caller, const Asset& asset,
                                                   const std::vector<VenueWeight>& target_weights) {
    if (!allowed(caller, core::Capability::CONFIGURE, "setTargetWeights")) {
        return unauthorized(caller, "setTargetWeights");
    }
    return ledger_->setTargetWeights(asset, target_weights);
}

OperationResult AllocationEngine::setRateLimit(const std::string& caller, const Asset& asset,
                                               long long cooldown_ms, Bps max_reallocation_bps_per_cycle) {
    if (!allowed(caller, core::Capability::CONFIGURE, "setRateLimit")) {
        return unauthorized(caller, "setRateLimit");
    }
    if (!ledger_->isRegistered(asset)) {
        return OperationResult::failure(ErrorCode::VALIDATION, "asset not registered: " + asset);
    }
    return limiter_->configure(asset, cooldown_ms, max_reallocation_bps_per_cycle);
}

OperationResult AllocationEngine::setVenueFrozen(const std::string& caller, const VenueId& venue, bool frozen) {
    if (!allowed(caller, core::Capability::EMERGENCY, "setVenueFrozen")) {
        return unauthorized(caller, "setVenueFrozen");
    }
    return registry_->setFrozen(venue, frozen);
}

OperationResult AllocationEngine::reconcile(const std::string& caller, const Asset& asset,
                                            const std::map<VenueId, Amount>& balances) {
    if (!allowed(caller, core::Capability::RECONCILE, "reconcile")) {
        return unauthorized(caller, "reconcile");
    }
    return ledger_->reconcile(asset, balances);
}

strategy::CreateStrategyResult AllocationEngine::createStrategy(const std::string& caller,
                                                                core::ReallocationStrategy draft) {
    if (!allowed(caller, core::Capability::MANAGE_STRATEGY, "createStrategy")) {
        return {unauthorized(caller, "createStrategy"), std::string()};
    }
    return strategies_->createStrategy(std::move(draft));
}

OperationResult AllocationEngine::activateStrategy(const std::string& caller, const std::string& strategy_id) {
    if (!allowed(caller, core::Capability::MANAGE_STRATEGY, "activateStrategy")) {
        return unauthorized(caller, "activateStrategy");
    }
    return strategies_->activate(strategy_id);
}

OperationResult AllocationEngine::deactivateStrategy(const std::string& caller, const std::string& strategy_id) {
    if (!allowed(caller, core::Capability::MANAGE_STRATEGY, "deactivateStrategy")) {
        return unauthorized(caller, "deactivateStrategy");
    }
    return strategies_->deactivate(strategy_id);
}

OperationResult AllocationEngine::pause(const std::string& caller) {
    if (!allowed(caller, core::Capability::EMERGENCY, "pause")) {
        return unauthorized(caller, "pause");
    }
    if (paused_.exchange(true)) {
        return OperationResult::failure(ErrorCode::VALIDATION, "engine already paused");
    }
    LOG_WARN("Engine paused by {}", caller);
    journalPauseChange(caller, true);
    return OperationResult::success();
}

OperationResult AllocationEngine::unpause(const std::string& caller) {
    if (!allowed(caller, core::Capability::EMERGENCY, "unpause")) {
        return unauthorized(caller, "unpause");
    }
    if (!paused_.exchange(false)) {
        return OperationResult::failure(ErrorCode::VALIDATION, "engine not paused");
    }
    LOG_WARN("Engine unpaused by {}", caller);
    journalPauseChange(caller, false);
    return OperationResult::success();
}

void AllocationEngine::journalPauseChange(const std::string& caller, bool paused) {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.ts_ms = clock_->nowMs();
    event.type = paused ? core::JournalEventType::ENGINE_PAUSED : core::JournalEventType::ENGINE_UNPAUSED;
    event.entity_id = caller;
    if (!journal_->append(event)) {
        LOG_WARN("Journal append failed: {}", paused ? "ENGINE_PAUSED" : "ENGINE_UNPAUSED");
    }
}

execution::EmergencyReport AllocationEngine::emergencyReallocate(const std::string& caller, const Asset& asset,
                                                                 const VenueId& from_venue, Amount amount,
                                                                 const VenueId& to_safe_venue) {
    if (!allowed(caller, core::Capability::EMERGENCY, "emergencyReallocate")) {
        execution::EmergencyReport report;
        report.asset = asset;
        report.from_venue = from_venue;
        report.requested = amount;
        report.status = unauthorized(caller, "emergencyReallocate");
        return report;
    }
    return executor_->emergencyReallocate(asset, from_venue, amount, to_safe_venue);
}

// ===== Depositor surface =====

ledger::DepositResult AllocationEngine::deposit(const std::string& caller, const Asset& asset, Amount amount) {
    if (!allowed(caller, core::Capability::DEPOSIT, "deposit")) {
        ledger::DepositResult result;
        result.status = unauthorized(caller, "deposit");
        return result;
    }
    if (paused_) {
        ledger::DepositResult result;
        result.status = pausedFailure("deposit");
        return result;
    }
    return ledger_->deposit(asset, amount);
}

ledger::WithdrawResult AllocationEngine::withdraw(const std::string& caller, const Asset& asset, Amount amount,
                                                  const std::vector<VenueId>& preferred_order) {
    if (!allowed(caller, core::Capability::WITHDRAW, "withdraw")) {
        ledger::WithdrawResult result;
        result.status = unauthorized(caller, "withdraw");
        return result;
    }
    if (paused_) {
        ledger::WithdrawResult result;
        result.status = pausedFailure("withdraw");
        return result;
    }
    return ledger_->withdraw(asset, amount, preferred_order);
}

// ===== Keeper surface =====

analytics::ScanReport AllocationEngine::scan(const std::string& caller, const Asset& asset) {
    if (!allowed(caller, core::Capability::KEEPER, "scan")) {
        analytics::ScanReport report;
        report.asset = asset;
        report.status = unauthorized(caller, "scan");
        return report;
    }
    return detector_->scan(asset);
}

core::CycleReport AllocationEngine::runCycle(const std::string& caller, const Asset& asset) {
    if (!allowed(caller, core::Capability::KEEPER, "runCycle")) {
        core::CycleReport report;
        report.asset = asset;
        report.status = unauthorized(caller, "runCycle");
        return report;
    }
    if (paused_) {
        core::CycleReport report;
        report.asset = asset;
        report.status = pausedFailure("runCycle");
        return report;
    }
    return coordinator_->runCycle(asset);
}

std::vector<core::CycleReport> AllocationEngine::runDailyRebalance(const std::string& caller,
                                                                   const std::vector<Asset>& assets) {
    if (!allowed(caller, core::Capability::KEEPER, "runDailyRebalance")) {
        return {};
    }
    if (paused_) {
        std::vector<core::CycleReport> reports;
        for (const auto& asset : assets.empty() ? ledger_->assets() : assets) {
            core::CycleReport report;
            report.asset = asset;
            report.status = pausedFailure("runDailyRebalance");
            reports.push_back(std::move(report));
        }
        return reports;
    }
    return coordinator_->runDailyRebalance(assets);
}

execution::StrategyExecutionReport AllocationEngine::executeStrategy(const std::string& caller,
                                                                     const std::string& strategy_id) {
    if (!allowed(caller, core::Capability::KEEPER, "executeStrategy")) {
        execution::StrategyExecutionReport report;
        report.strategy_id = strategy_id;
        report.status = unauthorized(caller, "executeStrategy");
        return report;
    }
    if (paused_) {
        execution::StrategyExecutionReport report;
        report.strategy_id = strategy_id;
        report.status = pausedFailure("executeStrategy");
        return report;
    }
    return executor_->executeStrategy(strategy_id);
}

core::AdaptReport AllocationEngine::adaptStrategy(const std::string& caller, const std::string& strategy_id) {
    if (!allowed(caller, core::Capability::KEEPER, "adaptStrategy")) {
        core::AdaptReport report;
        report.strategy_id = strategy_id;
        report.status = unauthorized(caller, "adaptStrategy");
        return report;
    }
    return coordinator_->adaptStrategy(strategy_id);
}

std::vector<execution::StrategyExecutionReport> AllocationEngine::runDueStrategies(const std::string& caller) {
    std::vector<execution::StrategyExecutionReport> reports;
    if (!allowed(caller, core::Capability::KEEPER, "runDueStrategies")) {
        return reports;
    }
    if (paused_) {
        LOG_INFO("Due strategies skipped: engine paused");
        return reports;
    }
    const long long now = clock_->nowMs();
    for (const auto& s : strategies_->list()) {
        if (!s.active) {
            continue;
        }
        if (s.has_executed && now - s.last_execution_ms < s.execution_frequency_ms) {
            continue;
        }
        reports.push_back(executor_->executeStrategy(s.id));
        if (s.adaptive && reports.back().completed_legs > 0) {
            auto adapted = coordinator_->adaptStrategy(s.id);
            if (!adapted.status.ok()) {
                LOG_WARN("Adaptation skipped: strategy={}, reason={}", s.id, adapted.status.reason);
            }
        }
    }
    return reports;
}

// ===== Engine control =====

bool AllocationEngine::start(const std::string& caller, int max_cycles) {
    if (running_) {
        LOG_WARN("AllocationEngine already running");
        return false;
    }
    if (!allowed(caller, core::Capability::KEEPER, "start")) {
        return false;
    }
    LOG_INFO("========================================");
    LOG_INFO("Keeper loop start (interval={}s, max_cycles={})", config_.cycle_interval_seconds, max_cycles);
    LOG_INFO("========================================");
    // A loop that ended on max_cycles leaves a finished but joinable thread.
    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    worker_thread_.reset();
    running_ = true;
    worker_thread_ = std::make_unique<std::thread>(&AllocationEngine::run, this, caller, max_cycles);
    return true;
}

void AllocationEngine::stop() {
    running_ = false;
    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    worker_thread_.reset();
}

void AllocationEngine::runKeeperCycle(const std::string& caller, int cycle) {
    try {
        for (const auto& report : coordinator_->runDailyRebalance({})) {
            if (!report.status.ok()) {
                LOG_WARN("Cycle {} for {}: {} ({})", cycle, report.asset,
                         errorCodeToString(report.status.code), report.status.reason);
            }
        }
        runDueStrategies(caller);
        for (const auto& asset : ledger_->assets()) {
            const auto a = analytics_->compute(asset);
            LOG_INFO("[{}] total={}, utilized={}, idle={}, unallocated={}, yield={}bps, realloc ok/fail={}/{}",
                     asset, a.total_deposited, a.total_utilized, a.idle_capital, a.unallocated,
                     a.weighted_yield_bps, a.completed_reallocations, a.failed_reallocations);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Keeper cycle error: {}", e.what());
    }
}

void AllocationEngine::run(std::string caller, int max_cycles) {
    const auto interval = std::chrono::seconds(std::max(1, config_.cycle_interval_seconds));
    const auto poll = std::chrono::milliseconds(200);
    auto last_cycle = std::chrono::steady_clock::now() - interval;
    int cycles = 0;

    while (running_) {
        const auto now = std::chrono::steady_clock::now();
        if (now - last_cycle >= interval) {
            if (paused_) {
                LOG_INFO("Keeper cycle {} skipped: engine paused", cycles + 1);
            } else {
                runKeeperCycle(caller, cycles + 1);
            }
            last_cycle = std::chrono::steady_clock::now();
            if (max_cycles > 0 && ++cycles >= max_cycles) {
                running_ = false;
                break;
            }
        }
        std::this_thread::sleep_for(poll);
    }
    LOG_INFO("Keeper loop stopped after {} cycles", cycles);
}

analytics::AssetAnalytics AllocationEngine::analytics(const Asset& asset) const {
    return analytics_->compute(asset);
}

std::vector<core::JournalEvent> AllocationEngine::auditTrail(const Asset& asset, std::uint64_t seq_inclusive) const {
    if (!journal_) {
        return {};
    }
    return journal_->readAsset(asset, seq_inclusive);
}

} // namespace engine
} // namespace capflow
