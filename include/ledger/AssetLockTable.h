#pragma once

#include <mutex>
#include <set>
#include <utility>

#include "common/Types.h"

namespace capflow {
namespace ledger {

// Per-asset exclusive execution section. Acquisition never waits: a second
// attempt on a held asset (reentrant adapter callback or another thread)
// fails immediately.
class AssetLockTable {
public:
    class Guard {
    public:
        Guard() = default;
        Guard(AssetLockTable* table, Asset asset) : table_(table), asset_(std::move(asset)) {}
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard(Guard&& other) noexcept : table_(other.table_), asset_(std::move(other.asset_)) {
            other.table_ = nullptr;
        }
        Guard& operator=(Guard&& other) noexcept {
            if (this != &other) {
                release();
                table_ = other.table_;
                asset_ = std::move(other.asset_);
                other.table_ = nullptr;
            }
            return *this;
        }
        ~Guard() { release(); }

        bool ownsLock() const { return table_ != nullptr; }
        explicit operator bool() const { return ownsLock(); }

    private:
        void release() {
            if (table_) {
                table_->release(asset_);
                table_ = nullptr;
            }
        }

        AssetLockTable* table_ = nullptr;
        Asset asset_;
    };

    Guard tryAcquire(const Asset& asset);
    bool isLocked(const Asset& asset) const;

private:
    void release(const Asset& asset);

    mutable std::mutex mutex_;
    std::set<Asset> held_;
};

} // namespace ledger
} // namespace capflow
