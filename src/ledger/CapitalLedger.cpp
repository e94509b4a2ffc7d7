#include "ledger/CapitalLedger.h"
#include "common/Logger.h"

#include <algorithm>
#include <set>

namespace capflow {
namespace ledger {

namespace {
Amount clampAccepted(Amount reported, Amount requested) {
    return std::clamp<Amount>(reported, 0, requested);
}

nlohmann::json toJson(const std::map<VenueId, Amount>& amounts) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [venue, amount] : amounts) {
        out[venue] = amount;
    }
    return out;
}
}

CapitalLedger::CapitalLedger(
    std::shared_ptr<VenueRegistry> venues,
    std::shared_ptr<AssetLockTable> locks,
    std::shared_ptr<IClock> clock,
    std::shared_ptr<core::IEventJournal> journal
)
    : venues_(std::move(venues))
    , locks_(std::move(locks))
    , clock_(std::move(clock))
    , journal_(std::move(journal)) {}

// ===== Configuration =====

OperationResult CapitalLedger::validateWeights(const std::vector<VenueWeight>& weights) const {
    if (weights.empty()) {
        return OperationResult::success();
    }
    std::set<VenueId> seen;
    long long sum = 0;
    for (const auto& w : weights) {
        if (!venues_->contains(w.venue)) {
            return OperationResult::failure(ErrorCode::VALIDATION, "unknown venue in weights: " + w.venue);
        }
        if (!seen.insert(w.venue).second) {
            return OperationResult::failure(ErrorCode::VALIDATION, "duplicate venue in weights: " + w.venue);
        }
        if (w.weight_bps < 0) {
            return OperationResult::failure(ErrorCode::VALIDATION, "negative weight for venue: " + w.venue);
        }
        sum += w.weight_bps;
    }
    if (sum != kBpsDenominator) {
        return OperationResult::failure(ErrorCode::VALIDATION,
            "target weights must sum to 10000 bps, got " + std::to_string(sum));
    }
    return OperationResult::success();
}

OperationResult CapitalLedger::registerAsset(const Asset& asset, const std::vector<VenueWeight>& target_weights) {
    if (asset.empty()) {
        return OperationResult::failure(ErrorCode::VALIDATION, "asset id is empty");
    }
    auto valid = validateWeights(target_weights);
    if (!valid.ok()) {
        return valid;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.count(asset) > 0) {
        return OperationResult::failure(ErrorCode::VALIDATION, "asset already registered: " + asset);
    }
    core::LedgerEntry entry;
    entry.asset = asset;
    entry.utilization_target = target_weights;
    entry.last_update_ms = clock_->nowMs();
    entries_.emplace(asset, std::move(entry));
    LOG_INFO("Asset registered: {} ({} target venues)", asset, target_weights.size());
    return OperationResult::success();
}

OperationResult CapitalLedger::setTargetWeights(const Asset& asset, const std::vector<VenueWeight>& target_weights) {
    auto valid = validateWeights(target_weights);
    if (!valid.ok()) {
        return valid;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(asset);
    if (it == entries_.end()) {
        return OperationResult::failure(ErrorCode::VALIDATION, "asset not registered: " + asset);
    }
    it->second.utilization_target = target_weights;
    it->second.last_update_ms = clock_->nowMs();
    return OperationResult::success();
}

OperationResult CapitalLedger::preconditions(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(asset);
    if (it == entries_.end()) {
        return OperationResult::failure(ErrorCode::VALIDATION, "asset not registered: " + asset);
    }
    if (it->second.halted) {
        return OperationResult::failure(ErrorCode::INVARIANT_VIOLATION,
            "asset halted pending reconciliation: " + it->second.halt_reason);
    }
    return OperationResult::success();
}

// ===== Mutations =====

DepositResult CapitalLedger::deposit(const Asset& asset, Amount amount) {
    DepositResult result;
    if (amount <= 0) {
        result.status = OperationResult::failure(ErrorCode::VALIDATION, "deposit amount must be positive");
        return result;
    }

    auto guard = locks_->tryAcquire(asset);
    if (!guard) {
        result.status = OperationResult::failure(ErrorCode::ASSET_LOCKED, "asset busy: " + asset);
        return result;
    }

    result.status = preconditions(asset);
    if (!result.status.ok()) {
        return result;
    }

    const auto weights = targetWeights(asset);

    // Earmark per venue; the rounding remainder goes to the first venue.
    std::vector<std::pair<VenueId, Amount>> earmarks;
    Amount earmarked = 0;
    for (const auto& w : weights) {
        const Amount share = applyBps(amount, w.weight_bps);
        earmarks.emplace_back(w.venue, share);
        earmarked += share;
    }
    if (!earmarks.empty()) {
        earmarks.front().second += amount - earmarked;
    } else {
        result.unallocated = amount;
    }

    // Adapter calls run without the data mutex; the ledger is only updated
    // once every placement is known.
    for (const auto& [venue, share] : earmarks) {
        if (share <= 0) {
            continue;
        }
        Amount accepted = 0;
        auto adapter = venues_->adapter(venue);
        if (adapter && !venues_->isFrozen(venue)) {
            try {
                accepted = clampAccepted(adapter->deposit(asset, share), share);
            } catch (const std::exception& e) {
                LOG_WARN("Deposit placement failed: asset={}, venue={}, amount={}, error={}", asset, venue, share, e.what());
                accepted = 0;
            }
        }
        if (accepted > 0) {
            result.applied[venue] += accepted;
        }
        if (accepted < share) {
            LOG_WARN("Deposit shortfall credited to unallocated: asset={}, venue={}, shortfall={}",
                     asset, venue, share - accepted);
        }
        result.unallocated += share - accepted;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = entries_.at(asset);
        entry.total_deposited += amount;
        for (const auto& [venue, placed] : result.applied) {
            entry.per_venue_balance[venue] += placed;
        }
        if (result.unallocated > 0) {
            entry.per_venue_balance[kUnallocatedVenue] += result.unallocated;
        }
        entry.last_update_ms = clock_->nowMs();
        if (!entry.invariantHolds()) {
            haltLocked(entry, "sum mismatch after deposit");
            result.status = OperationResult::failure(ErrorCode::INVARIANT_VIOLATION, "sum mismatch after deposit");
            return result;
        }
    }

    LOG_INFO("Deposit applied: asset={}, amount={}, venues={}, unallocated={}",
             asset, amount, result.applied.size(), result.unallocated);
    nlohmann::json payload;
    payload["amount"] = amount;
    payload["applied"] = toJson(result.applied);
    payload["unallocated"] = result.unallocated;
    journal(core::JournalEventType::DEPOSIT_APPLIED, asset, asset, std::move(payload));
    return result;
}

WithdrawResult CapitalLedger::withdraw(const Asset& asset, Amount amount, const std::vector<VenueId>& preferred_order) {
    WithdrawResult result;
    if (amount <= 0) {
        result.status = OperationResult::failure(ErrorCode::VALIDATION, "withdraw amount must be positive");
        return result;
    }

    auto guard = locks_->tryAcquire(asset);
    if (!guard) {
        result.status = OperationResult::failure(ErrorCode::ASSET_LOCKED, "asset busy: " + asset);
        return result;
    }

    result.status = preconditions(asset);
    if (!result.status.ok()) {
        return result;
    }

    std::map<VenueId, Amount> balances;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        balances = entries_.at(asset).per_venue_balance;
    }

    std::vector<VenueId> order;
    std::set<VenueId> seen;
    if (preferred_order.empty()) {
        order.push_back(kUnallocatedVenue);
        for (const auto& [venue, balance] : balances) {
            if (venue != kUnallocatedVenue && balance > 0) {
                order.push_back(venue);
            }
        }
    } else {
        for (const auto& venue : preferred_order) {
            if (venue != kUnallocatedVenue && !venues_->contains(venue)) {
                result.status = OperationResult::failure(ErrorCode::VALIDATION, "unknown venue in order: " + venue);
                return result;
            }
            if (seen.insert(venue).second) {
                order.push_back(venue);
            }
        }
    }

    Amount available = 0;
    for (const auto& venue : order) {
        auto it = balances.find(venue);
        available += (it == balances.end()) ? 0 : it->second;
    }
    if (available < amount) {
        result.status = OperationResult::failure(ErrorCode::INSUFFICIENT_LIQUIDITY,
            "requested " + std::to_string(amount) + ", recorded in listed venues " + std::to_string(available));
        return result;
    }

    Amount remaining = amount;
    for (const auto& venue : order) {
        if (remaining <= 0) {
            break;
        }
        auto it = balances.find(venue);
        const Amount take = std::min<Amount>((it == balances.end()) ? 0 : it->second, remaining);
        if (take <= 0) {
            continue;
        }
        Amount got = take;
        if (venue != kUnallocatedVenue) {
            got = 0;
            auto adapter = venues_->adapter(venue);
            try {
                got = adapter ? clampAccepted(adapter->withdraw(asset, take), take) : 0;
            } catch (const std::exception& e) {
                LOG_WARN("Withdraw from venue failed: asset={}, venue={}, amount={}, error={}", asset, venue, take, e.what());
            }
        }
        if (got > 0) {
            result.pulled[venue] = got;
            remaining -= got;
        }
    }

    if (remaining > 0) {
        // Could not source everything: put back what was pulled. Whatever a
        // venue refuses to take back stays with the engine.
        std::map<VenueId, Amount> stranded;
        for (const auto& [venue, got] : result.pulled) {
            if (venue == kUnallocatedVenue) {
                continue;
            }
            Amount returned = 0;
            auto adapter = venues_->adapter(venue);
            try {
                returned = adapter ? clampAccepted(adapter->deposit(asset, got), got) : 0;
            } catch (const std::exception& e) {
                LOG_ERROR("Return after failed withdraw rejected: asset={}, venue={}, amount={}, error={}",
                          asset, venue, got, e.what());
            }
            if (returned < got) {
                stranded[venue] = got - returned;
            }
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& entry = entries_.at(asset);
            for (const auto& [venue, lost] : stranded) {
                entry.per_venue_balance[venue] -= lost;
                entry.per_venue_balance[kUnallocatedVenue] += lost;
            }
            entry.last_update_ms = clock_->nowMs();
        }
        result.status = OperationResult::failure(ErrorCode::INSUFFICIENT_LIQUIDITY,
            "venues released " + std::to_string(amount - remaining) + " of " + std::to_string(amount));
        LOG_WARN("Withdraw rejected: asset={}, {}", asset, result.status.reason);
        result.pulled.clear();
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = entries_.at(asset);
        for (const auto& [venue, got] : result.pulled) {
            entry.per_venue_balance[venue] -= got;
        }
        entry.total_deposited -= amount;
        entry.last_update_ms = clock_->nowMs();
        if (!entry.invariantHolds()) {
            haltLocked(entry, "sum mismatch after withdraw");
            result.status = OperationResult::failure(ErrorCode::INVARIANT_VIOLATION, "sum mismatch after withdraw");
            return result;
        }
    }
    result.withdrawn = amount;

    LOG_INFO("Withdraw applied: asset={}, amount={}, venues={}", asset, amount, result.pulled.size());
    nlohmann::json payload;
    payload["amount"] = amount;
    payload["pulled"] = toJson(result.pulled);
    journal(core::JournalEventType::WITHDRAWAL_APPLIED, asset, asset, std::move(payload));
    return result;
}

OperationResult CapitalLedger::reconcile(const Asset& asset, const std::map<VenueId, Amount>& balances) {
    auto guard = locks_->tryAcquire(asset);
    if (!guard) {
        return OperationResult::failure(ErrorCode::ASSET_LOCKED, "asset busy: " + asset);
    }
    for (const auto& [venue, amount] : balances) {
        if (venue != kUnallocatedVenue && !venues_->contains(venue)) {
            return OperationResult::failure(ErrorCode::VALIDATION, "unknown venue: " + venue);
        }
        if (amount < 0) {
            return OperationResult::failure(ErrorCode::VALIDATION, "negative balance for venue: " + venue);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(asset);
    if (it == entries_.end()) {
        return OperationResult::failure(ErrorCode::VALIDATION, "asset not registered: " + asset);
    }
    auto& entry = it->second;
    entry.per_venue_balance = balances;
    entry.total_deposited = entry.venueSum();
    entry.halted = false;
    entry.halt_reason.clear();
    entry.last_update_ms = clock_->nowMs();
    LOG_WARN("Ledger reconciled: asset={}, total={}", asset, entry.total_deposited);
    return OperationResult::success();
}

OperationResult CapitalLedger::rebalanceRecord(const Asset& asset, const VenueId& from_venue,
                                               const VenueId& to_venue, Amount amount) {
    if (amount <= 0) {
        return OperationResult::failure(ErrorCode::VALIDATION, "rebalance amount must be positive");
    }
    if (from_venue == to_venue) {
        return OperationResult::failure(ErrorCode::VALIDATION, "rebalance source equals target");
    }
    if (to_venue != kUnallocatedVenue && !venues_->contains(to_venue)) {
        return OperationResult::failure(ErrorCode::VALIDATION, "unknown venue: " + to_venue);
    }
    if (!locks_->isLocked(asset)) {
        return OperationResult::failure(ErrorCode::VALIDATION, "rebalanceRecord requires the asset execution lock");
    }

    std::string halt_reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(asset);
        if (it == entries_.end()) {
            return OperationResult::failure(ErrorCode::INVARIANT_VIOLATION, "rebalance on unregistered asset: " + asset);
        }
        auto& entry = it->second;
        if (entry.halted) {
            return OperationResult::failure(ErrorCode::INVARIANT_VIOLATION, "asset halted: " + entry.halt_reason);
        }
        auto from_it = entry.per_venue_balance.find(from_venue);
        const Amount from_balance = (from_it == entry.per_venue_balance.end()) ? 0 : from_it->second;
        if (from_balance < amount) {
            halt_reason = "rebalance would drive " + from_venue + " negative (" +
                          std::to_string(from_balance) + " < " + std::to_string(amount) + ")";
            haltLocked(entry, halt_reason);
        } else {
            entry.per_venue_balance[from_venue] -= amount;
            entry.per_venue_balance[to_venue] += amount;
            entry.last_update_ms = clock_->nowMs();
            if (!entry.invariantHolds()) {
                halt_reason = "sum mismatch after rebalance";
                haltLocked(entry, halt_reason);
            }
        }
    }

    if (!halt_reason.empty()) {
        nlohmann::json payload;
        payload["reason"] = halt_reason;
        journal(core::JournalEventType::LEDGER_HALTED, asset, asset, std::move(payload));
        return OperationResult::failure(ErrorCode::INVARIANT_VIOLATION, halt_reason);
    }
    return OperationResult::success();
}

void CapitalLedger::haltLocked(core::LedgerEntry& entry, const std::string& reason) {
    entry.halted = true;
    entry.halt_reason = reason;
    LOG_ERROR("Ledger halted: asset={}, reason={}", entry.asset, reason);
}

// ===== Queries =====

bool CapitalLedger::isRegistered(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(asset) > 0;
}

bool CapitalLedger::isHalted(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(asset);
    return it != entries_.end() && it->second.halted;
}

Amount CapitalLedger::totalDeposited(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(asset);
    return (it == entries_.end()) ? 0 : it->second.total_deposited;
}

Amount CapitalLedger::balanceOf(const Asset& asset, const VenueId& venue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(asset);
    if (it == entries_.end()) {
        return 0;
    }
    auto venue_it = it->second.per_venue_balance.find(venue);
    return (venue_it == it->second.per_venue_balance.end()) ? 0 : venue_it->second;
}

std::optional<core::LedgerEntry> CapitalLedger::snapshot(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(asset);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Asset> CapitalLedger::assets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Asset> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.first);
    }
    return out;
}

std::vector<VenueWeight> CapitalLedger::targetWeights(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(asset);
    return (it == entries_.end()) ? std::vector<VenueWeight>{} : it->second.utilization_target;
}

OperationResult CapitalLedger::checkInvariant(const Asset& asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(asset);
    if (it == entries_.end()) {
        return OperationResult::failure(ErrorCode::VALIDATION, "asset not registered: " + asset);
    }
    auto& entry = it->second;
    bool negative = false;
    for (const auto& balance : entry.per_venue_balance) {
        negative = negative || balance.second < 0;
    }
    if (negative || !entry.invariantHolds()) {
        const std::string reason = "sum(per-venue)=" + std::to_string(entry.venueSum()) +
                                   " total=" + std::to_string(entry.total_deposited);
        haltLocked(entry, reason);
        return OperationResult::failure(ErrorCode::INVARIANT_VIOLATION, reason);
    }
    return OperationResult::success();
}

std::optional<Bps> CapitalLedger::utilization(const Asset& asset, const VenueId& venue) const {
    if (venue == kUnallocatedVenue) {
        return 0;
    }
    auto adapter = venues_->adapter(venue);
    if (!adapter) {
        return std::nullopt;
    }
    try {
        return std::clamp<Bps>(adapter->queryUtilization(asset), 0, kBpsDenominator);
    } catch (const std::exception& e) {
        LOG_WARN("Utilization query failed: asset={}, venue={}, error={}", asset, venue, e.what());
        return std::nullopt;
    }
}

void CapitalLedger::journal(core::JournalEventType type, const Asset& asset,
                            const std::string& entity_id, nlohmann::json payload) {
    if (!journal_) {
        return;
    }
    core::JournalEvent event;
    event.ts_ms = clock_->nowMs();
    event.type = type;
    event.asset = asset;
    event.entity_id = entity_id;
    event.payload = std::move(payload);
    if (!journal_->append(event)) {
        LOG_WARN("Journal append failed: asset={}", asset);
    }
}

} // namespace ledger
} // namespace capflow
