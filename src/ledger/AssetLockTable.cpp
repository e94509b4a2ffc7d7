#include "ledger/AssetLockTable.h"

namespace capflow {
namespace ledger {

AssetLockTable::Guard AssetLockTable::tryAcquire(const Asset& asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!held_.insert(asset).second) {
        return Guard();
    }
    return Guard(this, asset);
}

bool AssetLockTable::isLocked(const Asset& asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_.count(asset) > 0;
}

void AssetLockTable::release(const Asset& asset) {
    std::lock_guard<std::mutex> lock(mutex_);
    held_.erase(asset);
}

} // namespace ledger
} // namespace capflow
