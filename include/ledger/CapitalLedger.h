#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "common/Clock.h"
#include "common/Errors.h"
#include "common/Types.h"
#include "core/contracts/IEventJournal.h"
#include "core/model/AllocationTypes.h"
#include "ledger/AssetLockTable.h"
#include "ledger/VenueRegistry.h"

namespace capflow {
namespace ledger {

struct DepositResult {
    OperationResult status;
    std::map<VenueId, Amount> applied;  // per-venue amounts actually placed
    Amount unallocated = 0;             // credited to the unallocated bucket
};

struct WithdrawResult {
    OperationResult status;
    std::map<VenueId, Amount> pulled;
    Amount withdrawn = 0;
};

// Authoritative record of deposits per asset and their placement per venue.
// The only writer of balances. For every asset, sum(per-venue) == total after
// each mutating call; a violation halts the asset until reconcile().
class CapitalLedger {
public:
    CapitalLedger(
        std::shared_ptr<VenueRegistry> venues,
        std::shared_ptr<AssetLockTable> locks,
        std::shared_ptr<IClock> clock,
        std::shared_ptr<core::IEventJournal> journal = nullptr
    );

    // ===== Configuration =====

    OperationResult registerAsset(const Asset& asset, const std::vector<VenueWeight>& target_weights);
    OperationResult setTargetWeights(const Asset& asset, const std::vector<VenueWeight>& target_weights);

    // ===== Mutations (each holds the asset lock) =====

    DepositResult deposit(const Asset& asset, Amount amount);
    WithdrawResult withdraw(const Asset& asset, Amount amount, const std::vector<VenueId>& preferred_order);
    OperationResult reconcile(const Asset& asset, const std::map<VenueId, Amount>& balances);

    // Internal transfer between venues. Caller must hold the asset lock
    // (the reallocation executor does). Funds must already be physically
    // where the record says they go.
    OperationResult rebalanceRecord(const Asset& asset, const VenueId& from_venue,
                                    const VenueId& to_venue, Amount amount);

    // ===== Queries =====

    bool isRegistered(const Asset& asset) const;
    bool isHalted(const Asset& asset) const;
    Amount totalDeposited(const Asset& asset) const;
    Amount balanceOf(const Asset& asset, const VenueId& venue) const;
    std::optional<core::LedgerEntry> snapshot(const Asset& asset) const;
    std::vector<Asset> assets() const;
    std::vector<VenueWeight> targetWeights(const Asset& asset) const;

    // Re-checks the sum identity; halts the asset on mismatch.
    OperationResult checkInvariant(const Asset& asset);

    // active / total as reported downstream. The unallocated bucket is 0.
    std::optional<Bps> utilization(const Asset& asset, const VenueId& venue) const;

    AssetLockTable& locks() { return *locks_; }
    const VenueRegistry& venues() const { return *venues_; }

private:
    OperationResult validateWeights(const std::vector<VenueWeight>& weights) const;
    OperationResult preconditions(const Asset& asset) const;
    void haltLocked(core::LedgerEntry& entry, const std::string& reason);
    void journal(core::JournalEventType type, const Asset& asset, const std::string& entity_id, nlohmann::json payload);

    std::shared_ptr<VenueRegistry> venues_;
    std::shared_ptr<AssetLockTable> locks_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<core::IEventJournal> journal_;

    mutable std::mutex mutex_;
    std::map<Asset, core::LedgerEntry> entries_;
};

} // namespace ledger
} // namespace capflow
