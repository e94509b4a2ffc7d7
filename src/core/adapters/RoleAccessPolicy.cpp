#include "core/adapters/RoleAccessPolicy.h"

namespace capflow {
namespace core {

RoleAccessPolicy::RoleAccessPolicy(bool allow_all)
    : allow_all_(allow_all) {}

void RoleAccessPolicy::grant(const std::string& caller, Capability capability) {
    std::lock_guard<std::mutex> lock(mutex_);
    grants_[caller].insert(capability);
}

void RoleAccessPolicy::grantAll(const std::string& caller) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& caps = grants_[caller];
    for (auto c : {Capability::DEPOSIT, Capability::WITHDRAW, Capability::CONFIGURE, Capability::MANAGE_STRATEGY,
                   Capability::KEEPER, Capability::EMERGENCY, Capability::RECONCILE}) {
        caps.insert(c);
    }
}

void RoleAccessPolicy::revoke(const std::string& caller, Capability capability) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = grants_.find(caller);
    if (it != grants_.end()) {
        it->second.erase(capability);
    }
}

bool RoleAccessPolicy::isAllowed(const std::string& caller, Capability capability) const {
    if (allow_all_) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = grants_.find(caller);
    return it != grants_.end() && it->second.count(capability) > 0;
}

} // namespace core
} // namespace capflow
